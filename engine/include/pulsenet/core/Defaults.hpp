#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace pulsenet::core::defaults
{

// ===== Protocol / endpoints =====
inline constexpr std::uint64_t kProtocolId = 0x11223344556677ULL;
inline constexpr std::uint16_t kServerPort = 40001;
inline constexpr std::uint16_t kMatcherPort = 8080;
inline constexpr int kMaxClients = 64;

// 매처와 secure 서버가 공유하는 connect token 봉인 키 (insecure 모드는 0 키)
inline constexpr std::array<std::uint8_t, 32> kSecurePrivateKey = {
    0x60, 0x6a, 0xbe, 0x6e, 0xc9, 0x19, 0x10, 0xea, 0x9a, 0x65, 0x62, 0xf6, 0x6f, 0x2b, 0x30, 0xe4,
    0x43, 0x71, 0xd6, 0x2c, 0xd1, 0x99, 0x27, 0x26, 0x6b, 0x3c, 0x60, 0xf4, 0xb7, 0x15, 0xab, 0xa1};

// ===== Session timing =====
inline constexpr int kTimeoutSeconds = 10;
inline constexpr int kConnectTokenExpirySeconds = 30;
inline constexpr double kPacketSendRate = 10.0; // keep-alive / handshake 재전송 Hz
inline constexpr int kNumDisconnectPackets = 10;

// ===== Bit budget =====
inline constexpr std::size_t kMaxPacketSize = 8 * 1024;
inline constexpr int kMaxMessagesPerPacket = 64;
inline constexpr int kMessageSendQueueSize = 1024;
inline constexpr int kMessageReceiveQueueSize = 1024;
inline constexpr std::size_t kMaxBlockSize = 1024;
inline constexpr std::size_t kMaxBlockSizeLimit = 4096; // 16-bit 메시지 길이 필드 한도 내

// ===== Driver loop =====
inline constexpr double kStartTime = 100.0;
inline constexpr double kClientDeltaTime = 0.01;
inline constexpr double kDeltaTime = 0.1;

// ===== Matcher =====
inline constexpr std::uint32_t kMatcherTimeoutMs = 3000;
inline constexpr int kListenBacklog = 128;

} // namespace pulsenet::core::defaults
