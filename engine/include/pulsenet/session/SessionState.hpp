#pragma once

#include <cstdint>
#include <string_view>

namespace pulsenet::session
{

enum class SessionState : std::uint8_t
{
    Idle = 0,
    Connecting = 1,
    Connected = 2,
    Disconnected = 3,     // 정상 종료 (peer disconnect / timeout / 명시적 disconnect)
    ConnectionFailed = 4  // handshake 실패
};

inline constexpr std::uint32_t stateBit(SessionState s) noexcept
{
    return 1u << static_cast<std::uint32_t>(s);
}

enum class ConnectMode : std::uint8_t
{
    None = 0,
    Insecure,
    Secure,
    Loopback
};

/// ConnectionFailed / Disconnected 로 간 이유
enum class FailReason : std::uint8_t
{
    None = 0,
    HandshakeTimeout,
    TokenExpired,
    InvalidToken,
    Denied,
    Cancelled,    // Connecting 중 명시적 disconnect
    SocketError,
    ConnectionTimeout,
    PeerDisconnect,
    LocalDisconnect
};

[[nodiscard]] std::string_view sessionStateName(SessionState s) noexcept;
[[nodiscard]] std::string_view connectModeName(ConnectMode m) noexcept;
[[nodiscard]] std::string_view failReasonName(FailReason r) noexcept;

} // namespace pulsenet::session
