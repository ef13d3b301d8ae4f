#pragma once

#include <pulsenet/Runtime.hpp>
#include <pulsenet/core/QuitFlag.hpp>
#include <pulsenet/crypto/ConnectToken.hpp>
#include <pulsenet/net/Address.hpp>
#include <pulsenet/net/Socket.hpp>
#include <pulsenet/runtime/MatchProtocol.hpp>
#include <pulsenet/util/NonCopyable.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace pulsenet::runtime
{

struct MatchServiceSettings
{
    std::uint64_t protocolId{0};
    crypto::Key privateKey{};
    /// 토큰에 실을 게임 서버 공개 주소
    net::Address serverAddress;
    int timeoutSeconds{0};
    int tokenExpirySeconds{0};
};

/// 매치 요청에 connect token 을 발급합니다. (소켓 없음)
class MatchService : private util::NonCopyable
{
  public:
    MatchService(const Runtime &runtime, MatchServiceSettings settings);

    /// protocolId 가 다르면 nullopt. loopback 이면 서버 목록이 127.0.0.1:<서버 포트>.
    [[nodiscard]] std::optional<crypto::ConnectTokenBytes>
    issueToken(const MatchRequestBody &request) const;

    /// 요청 프레임 body -> 응답 프레임 body
    [[nodiscard]] std::vector<std::uint8_t> handleRequest(std::span<const std::uint8_t> body) const;

    [[nodiscard]] std::uint64_t issuedCount() const noexcept
    {
        return issued_.load(std::memory_order_relaxed);
    }

  private:
    const Runtime &runtime_;
    MatchServiceSettings settings_;
    mutable std::atomic<std::uint64_t> issued_{0};
};

/// MatchService 를 TCP 로 노출합니다. 연결 1개당 요청 1개.
class MatchServer : private util::NonCopyable
{
  public:
    MatchServer(const MatchService &service, const net::Address &listenAddress);

    /// listen 소켓을 엽니다. 실패하면 false (errno 유지).
    bool open();

    /// quit 이 올라갈 때까지 accept 루프. pollMs 마다 quit 을 확인한다.
    void run(const core::QuitFlag &quit, int pollMs);

    /// 한 번 accept 를 시도하고 요청을 처리한다. 처리했으면 true.
    bool serveOnce();

    /// 실제 listen 주소 (port 0 이면 커널이 고른 포트)
    [[nodiscard]] const net::Address &address() const noexcept { return address_; }

  private:
    void handleConnection(net::Socket &conn, const net::Address &peer);

    const MatchService &service_;
    net::Address address_;
    net::Socket listener_;
    int ioTimeoutMs_{0};
};

} // namespace pulsenet::runtime
