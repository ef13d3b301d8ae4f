#include <pulsenet/SessionConfig.hpp>

#include <pulsenet/core/Logger.hpp>

#include <stdexcept>
#include <string>

namespace pulsenet
{

namespace
{
[[noreturn]] void throwConfigError(const std::string &detail)
{
    auto msg = "[SessionConfig] " + detail;
    SLOG_ERROR("SessionConfig", "ValidationError", "msg={}", msg);
    throw std::invalid_argument{msg};
}

// 헤더(타입 1 + 시퀀스 8 + 메시지 수 2) 와 최소 메시지 1개를 담을 수 있어야 한다.
constexpr std::size_t kMinPacketSize = 256;
constexpr std::size_t kMaxPacketSizeLimit = 64 * 1024;
} // namespace

void validateSessionConfig(const SessionConfig &config)
{
    if (config.timeoutSeconds < 1)
    {
        throwConfigError("timeoutSeconds must be >= 1");
    }
    if (config.connectTokenExpirySeconds < 1)
    {
        throwConfigError("connectTokenExpirySeconds must be >= 1");
    }
    if (config.maxPacketSize < kMinPacketSize || config.maxPacketSize > kMaxPacketSizeLimit)
    {
        throwConfigError("maxPacketSize must be in [256, 65536]");
    }
    if (!(config.packetSendRate > 0.0))
    {
        throwConfigError("packetSendRate must be > 0");
    }
    if (config.maxMessagesPerPacket < 1 || config.maxMessagesPerPacket > 0xFFFF)
    {
        throwConfigError("maxMessagesPerPacket must be in [1, 65535]");
    }
    if (config.messageSendQueueSize < 1)
    {
        throwConfigError("messageSendQueueSize must be >= 1");
    }
    if (config.messageReceiveQueueSize < 1)
    {
        throwConfigError("messageReceiveQueueSize must be >= 1");
    }
    if (config.maxBlockSize < 1 || config.maxBlockSize > core::defaults::kMaxBlockSizeLimit)
    {
        throwConfigError("maxBlockSize must be in [1, 4096]");
    }
    if (config.maxBlockSize + 64 > config.maxPacketSize)
    {
        throwConfigError("maxBlockSize does not fit in maxPacketSize");
    }
    if (config.numDisconnectPackets < 1)
    {
        throwConfigError("numDisconnectPackets must be >= 1");
    }
}

} // namespace pulsenet
