#pragma once

#include <pulsenet/session/SessionState.hpp>

#include <cstdint>
#include <string_view>

namespace pulsenet::session
{

/// 클라이언트 세션 수명 상태 머신 (세 가지 connect 모드 공용)
///
///   Idle -> Connecting -> Connected -> Disconnected
///                    \-> ConnectionFailed
///
/// - Disconnected / ConnectionFailed 는 흡수 상태. 빠져나가는 유일한 길은 beginConnect().
/// - 허용되지 않는 전이는 상태를 바꾸지 않고 false 를 반환한다.
class SessionStateMachine
{
  public:
    explicit SessionStateMachine(std::string_view owner = "Client") noexcept : owner_(owner) {}

    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] ConnectMode mode() const noexcept { return mode_; }
    [[nodiscard]] FailReason reason() const noexcept { return reason_; }

    [[nodiscard]] bool is(SessionState s) const noexcept { return state_ == s; }
    [[nodiscard]] bool isTerminal() const noexcept
    {
        return state_ == SessionState::Disconnected || state_ == SessionState::ConnectionFailed;
    }

    /// Idle 또는 종료 상태 -> Connecting. 사유/모드를 새로 잡는다.
    bool beginConnect(ConnectMode mode);

    /// Connecting -> Connected
    bool onHandshakeComplete();

    /// Connecting -> ConnectionFailed
    bool onConnectFailed(FailReason reason);

    /// Connected -> Disconnected
    bool onDisconnected(FailReason reason);

    /// 전이 테이블 조회 (from 상태에서 to 로 갈 수 있는지)
    [[nodiscard]] static bool isAllowed(SessionState from, SessionState to) noexcept;

  private:
    bool transition(SessionState to, FailReason reason);

    std::string_view owner_;
    SessionState state_{SessionState::Idle};
    ConnectMode mode_{ConnectMode::None};
    FailReason reason_{FailReason::None};
};

} // namespace pulsenet::session
