#pragma once

#include <pulsenet/util/NonCopyable.hpp>

#include <cstdint>
#include <span>

namespace pulsenet::session
{

enum class LoopbackRole : std::uint8_t
{
    Client,
    Server
};

/// 서버 쪽 loopback 수신 입구 (Server 가 구현)
class ILoopbackServerEndpoint
{
  public:
    virtual ~ILoopbackServerEndpoint() = default;
    virtual void processLoopbackPacket(int clientIndex, std::span<const std::uint8_t> packet,
                                       std::uint64_t sequence) = 0;
};

/// 클라이언트 쪽 loopback 수신 입구 (Client 가 구현)
class ILoopbackClientEndpoint
{
  public:
    virtual ~ILoopbackClientEndpoint() = default;
    virtual void processLoopbackPacket(std::span<const std::uint8_t> packet,
                                       std::uint64_t sequence) = 0;
};

/// 같은 프로세스의 클라이언트 1개와 서버 1개 사이에서 소켓 대신 패킷을 넘겨줍니다.
///
/// - 양 끝을 소유하지 않는다(비소유 포인터). 양 끝이 bridge 보다 오래 살거나 먼저 detach 해야 한다.
/// - 큐잉/복사/재정렬 없음. deliver() 안에서 상대 쪽 처리까지 동기로 끝난다.
/// - 등록되지 않은 bridge 로 보내는 것은 설정 오류: std::logic_error.
class LoopbackBridge : private pulsenet::util::NonCopyable
{
  public:
    LoopbackBridge() = default;

    LoopbackBridge(LoopbackBridge &&) = delete;
    LoopbackBridge &operator=(LoopbackBridge &&) = delete;

    void attachServer(ILoopbackServerEndpoint &server) noexcept { server_ = &server; }
    void attachClient(ILoopbackClientEndpoint &client) noexcept { client_ = &client; }
    void detachServer() noexcept { server_ = nullptr; }
    void detachClient() noexcept { client_ = nullptr; }

    [[nodiscard]] bool isRegistered() const noexcept
    {
        return server_ != nullptr && client_ != nullptr;
    }

    /// Client 역할: 서버의 clientIndex 슬롯으로. Server 역할: 등록된 클라이언트로.
    void deliver(LoopbackRole from, int clientIndex, std::span<const std::uint8_t> packet,
                 std::uint64_t sequence);

    [[nodiscard]] std::uint64_t deliveredCount() const noexcept { return delivered_; }

  private:
    ILoopbackServerEndpoint *server_{nullptr};
    ILoopbackClientEndpoint *client_{nullptr};
    std::uint64_t delivered_{0};
};

} // namespace pulsenet::session
