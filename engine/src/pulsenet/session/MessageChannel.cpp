#include <pulsenet/session/MessageChannel.hpp>

#include <pulsenet/core/Logger.hpp>
#include <pulsenet/message/MessageCodec.hpp>
#include <pulsenet/protocol/BitPacker.hpp>
#include <pulsenet/protocol/Packets.hpp>

#include <variant>

namespace pulsenet::session
{

bool MessageChannel::canSend() const noexcept
{
    return sendQueue_.size() < static_cast<std::size_t>(config_.messageSendQueueSize);
}

bool MessageChannel::send(message::Message message)
{
    if (!canSend())
    {
        SLOG_DEBUG("MessageChannel", "SendQueueFull", "size={}", sendQueue_.size());
        return false;
    }

    if (const auto *block = std::get_if<message::TestBlockMessage>(&message))
    {
        if (block->block.size() > config_.maxBlockSize)
        {
            SLOG_WARN("MessageChannel", "BlockTooLarge", "size={} max={}", block->block.size(),
                      config_.maxBlockSize);
            return false;
        }
    }

    sendQueue_.push_back(std::move(message));
    return true;
}

std::optional<message::Message> MessageChannel::receive()
{
    if (receiveQueue_.empty())
        return std::nullopt;

    message::Message m = std::move(receiveQueue_.front());
    receiveQueue_.pop_front();
    return m;
}

std::vector<std::uint8_t> MessageChannel::takeNextPayload()
{
    if (sendQueue_.empty())
        return {};

    const std::size_t capacityBits =
        (config_.maxPacketSize - protocol::PacketHeader::kWireBytes) * 8;
    protocol::BitWriter writer(capacityBits);

    const std::size_t n =
        message::encodeMessageBatch(sendQueue_, writer,
                                    static_cast<std::size_t>(config_.maxMessagesPerPacket),
                                    config_.maxBlockSize);
    if (n == 0)
    {
        // 빈 패킷에도 안 들어가는 메시지. 큐가 막히지 않게 버린다.
        SLOG_WARN("MessageChannel", "MessageDropped", "type={}",
                  message::messageTypeName(message::messageType(sendQueue_.front())));
        counters_.onMessageDropped();
        sendQueue_.erase(sendQueue_.begin());
        return {};
    }

    sendQueue_.erase(sendQueue_.begin(), sendQueue_.begin() + static_cast<std::ptrdiff_t>(n));
    counters_.onMessagesSent(n);

    const auto data = writer.data();
    return std::vector<std::uint8_t>(data.begin(), data.end());
}

void MessageChannel::processPayload(std::span<const std::uint8_t> bits)
{
    protocol::BitReader reader(bits);
    auto batch = message::decodeMessageBatch(reader, config_.maxBlockSize);

    if (batch.failed > 0)
        counters_.onMessageDecodeFailures(static_cast<std::uint64_t>(batch.failed));
    if (batch.truncated)
        counters_.onPacketInvalid();

    for (auto &m : batch.messages)
    {
        if (receiveQueue_.size() >= static_cast<std::size_t>(config_.messageReceiveQueueSize))
        {
            counters_.onMessageDropped();
            continue;
        }
        receiveQueue_.push_back(std::move(m));
        counters_.onMessagesReceived(1);
    }
}

void MessageChannel::reset() noexcept
{
    sendQueue_.clear();
    receiveQueue_.clear();
}

} // namespace pulsenet::session
