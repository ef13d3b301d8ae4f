#pragma once

#include <pulsenet/core/Defaults.hpp>

#include <cstddef>
#include <cstdint>

namespace pulsenet
{

/// 클라이언트/서버 세션이 공유하는 설정 묶음입니다.
///
/// - 실행당 한 번 만들어지고, 세션 계층에는 const 참조로만 전달됩니다.
/// - 세션은 생성 시점에 값을 복사하지 않고 참조를 유지하므로, 설정 객체는
///   세션보다 오래 살아 있어야 합니다.
struct SessionConfig
{
    /// 클라이언트/서버/매처가 모두 같은 값을 써야 하는 프로토콜 식별자입니다.
    std::uint64_t protocolId = core::defaults::kProtocolId;

    /// 이 시간(초) 동안 상대에게서 아무 패킷도 받지 못하면 타임아웃입니다.
    int timeoutSeconds = core::defaults::kTimeoutSeconds;

    /// insecure connect 시 로컬에서 만드는 connect token 의 유효 기간(초)입니다.
    int connectTokenExpirySeconds = core::defaults::kConnectTokenExpirySeconds;

    /// 패킷 1개의 최대 크기(bytes). 메시지 배치의 비트 예산이 여기서 나온다.
    std::size_t maxPacketSize = core::defaults::kMaxPacketSize;

    /// handshake 재전송 / keep-alive 송신 빈도(Hz)
    double packetSendRate = core::defaults::kPacketSendRate;

    int maxMessagesPerPacket = core::defaults::kMaxMessagesPerPacket;
    int messageSendQueueSize = core::defaults::kMessageSendQueueSize;
    int messageReceiveQueueSize = core::defaults::kMessageReceiveQueueSize;

    /// TestBlockMessage 블록 최대 크기(bytes)
    std::size_t maxBlockSize = core::defaults::kMaxBlockSize;

    /// disconnect 시 중복 송신할 disconnect 패킷 수 (loopback은 1개)
    int numDisconnectPackets = core::defaults::kNumDisconnectPackets;
};

/// SessionConfig 필드 값에 대한 기본 검증을 수행합니다. 실패 시 std::invalid_argument.
void validateSessionConfig(const SessionConfig &config);

} // namespace pulsenet
