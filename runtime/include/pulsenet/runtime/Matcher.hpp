#pragma once

#include <pulsenet/Runtime.hpp>
#include <pulsenet/core/GlobalConfig.hpp>
#include <pulsenet/crypto/ConnectToken.hpp>
#include <pulsenet/net/Address.hpp>
#include <pulsenet/util/NonCopyable.hpp>

#include <cstdint>
#include <string_view>

namespace pulsenet::runtime
{

enum class MatchStatus : std::uint8_t
{
    Pending,
    Found,
    Failed
};

[[nodiscard]] std::string_view matchStatusName(MatchStatus status) noexcept;

/// 매치메이커 능력 집합. secure 드라이버는 이 인터페이스만 본다.
class IMatcher
{
  public:
    virtual ~IMatcher() = default;

    /// 동기 요청. 반환 후 matchStatus() 는 Found 또는 Failed.
    virtual MatchStatus requestMatch(std::uint64_t protocolId, std::uint64_t clientId,
                                     bool loopback) = 0;

    [[nodiscard]] virtual MatchStatus matchStatus() const noexcept = 0;

    /// Found 가 아닐 때 호출하면 std::logic_error
    virtual void getConnectToken(crypto::ConnectTokenBytes &out) const = 0;
};

/// TCP 매처 클라이언트. 요청 1회당 연결 1개.
class Matcher final : public IMatcher, private util::NonCopyable
{
  public:
    Matcher(const Runtime &runtime, const core::MatcherSettings &settings);

    /// 엔드포인트 검증. 실패하면 이후 requestMatch 는 바로 Failed.
    bool initialize();

    MatchStatus requestMatch(std::uint64_t protocolId, std::uint64_t clientId,
                             bool loopback) override;
    [[nodiscard]] MatchStatus matchStatus() const noexcept override { return status_; }
    void getConnectToken(crypto::ConnectTokenBytes &out) const override;

    [[nodiscard]] const net::Address &endpoint() const noexcept { return endpoint_; }

  private:
    bool tryOnce(std::uint64_t protocolId, std::uint64_t clientId, bool loopback, int attempt);

    const Runtime &runtime_;
    core::MatcherSettings settings_;
    net::Address endpoint_;
    bool initialized_{false};
    MatchStatus status_{MatchStatus::Pending};
    crypto::ConnectTokenBytes token_{};
};

} // namespace pulsenet::runtime
