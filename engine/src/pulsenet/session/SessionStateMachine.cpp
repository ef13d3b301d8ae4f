#include <pulsenet/session/SessionStateMachine.hpp>

#include <pulsenet/core/Logger.hpp>

#include <array>

namespace pulsenet::session
{

namespace
{
// from 상태별 허용 to 마스크
constexpr std::array<std::uint32_t, 5> kAllowed = {
    /* Idle             */ stateBit(SessionState::Connecting),
    /* Connecting       */ stateBit(SessionState::Connected) |
        stateBit(SessionState::ConnectionFailed),
    /* Connected        */ stateBit(SessionState::Disconnected),
    /* Disconnected     */ stateBit(SessionState::Connecting),
    /* ConnectionFailed */ stateBit(SessionState::Connecting),
};
} // namespace

std::string_view sessionStateName(SessionState s) noexcept
{
    switch (s)
    {
    case SessionState::Idle:
        return "Idle";
    case SessionState::Connecting:
        return "Connecting";
    case SessionState::Connected:
        return "Connected";
    case SessionState::Disconnected:
        return "Disconnected";
    case SessionState::ConnectionFailed:
        return "ConnectionFailed";
    }
    return "Unknown";
}

std::string_view connectModeName(ConnectMode m) noexcept
{
    switch (m)
    {
    case ConnectMode::None:
        return "none";
    case ConnectMode::Insecure:
        return "insecure";
    case ConnectMode::Secure:
        return "secure";
    case ConnectMode::Loopback:
        return "loopback";
    }
    return "unknown";
}

std::string_view failReasonName(FailReason r) noexcept
{
    switch (r)
    {
    case FailReason::None:
        return "none";
    case FailReason::HandshakeTimeout:
        return "handshake_timeout";
    case FailReason::TokenExpired:
        return "token_expired";
    case FailReason::InvalidToken:
        return "invalid_token";
    case FailReason::Denied:
        return "denied";
    case FailReason::Cancelled:
        return "cancelled";
    case FailReason::SocketError:
        return "socket_error";
    case FailReason::ConnectionTimeout:
        return "connection_timeout";
    case FailReason::PeerDisconnect:
        return "peer_disconnect";
    case FailReason::LocalDisconnect:
        return "local_disconnect";
    }
    return "unknown";
}

bool SessionStateMachine::isAllowed(SessionState from, SessionState to) noexcept
{
    const auto idx = static_cast<std::size_t>(from);
    if (idx >= kAllowed.size())
        return false;
    return (kAllowed[idx] & stateBit(to)) != 0;
}

bool SessionStateMachine::transition(SessionState to, FailReason reason)
{
    if (!isAllowed(state_, to))
    {
        SLOG_WARN(owner_, "IllegalTransition", "from={} to={}", sessionStateName(state_),
                  sessionStateName(to));
        return false;
    }

    SLOG_DEBUG(owner_, "StateChange", "from={} to={} mode={} reason={}", sessionStateName(state_),
               sessionStateName(to), connectModeName(mode_), failReasonName(reason));
    state_ = to;
    reason_ = reason;
    return true;
}

bool SessionStateMachine::beginConnect(ConnectMode mode)
{
    if (mode == ConnectMode::None)
        return false;

    const ConnectMode prev = mode_;
    mode_ = mode;
    if (!transition(SessionState::Connecting, FailReason::None))
    {
        mode_ = prev;
        return false;
    }
    return true;
}

bool SessionStateMachine::onHandshakeComplete()
{
    return transition(SessionState::Connected, FailReason::None);
}

bool SessionStateMachine::onConnectFailed(FailReason reason)
{
    return transition(SessionState::ConnectionFailed, reason);
}

bool SessionStateMachine::onDisconnected(FailReason reason)
{
    return transition(SessionState::Disconnected, reason);
}

} // namespace pulsenet::session
