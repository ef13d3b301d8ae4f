#include <pulsenet/message/MessageCodec.hpp>

#include <pulsenet/core/Logger.hpp>

#include <algorithm>
#include <new>
#include <type_traits>
#include <variant>

namespace pulsenet::message
{

namespace
{
constexpr int kBlockLengthBits = 16;

// filler 내용은 의미 없음. 길이만 중요하다.
bool writeFiller(protocol::BitWriter &w, int numBits)
{
    const int numWords = numBits / 32;
    for (int i = 0; i < numWords; ++i)
    {
        if (!w.writeBits(0, 32))
            return false;
    }
    const int remainder = numBits - numWords * 32;
    if (remainder > 0)
        return w.writeBits(0, remainder);
    return true;
}

bool readFiller(protocol::BitReader &r, int numBits) noexcept
{
    std::uint32_t dummy = 0;
    const int numWords = numBits / 32;
    for (int i = 0; i < numWords; ++i)
    {
        if (!r.readBits(dummy, 32))
            return false;
    }
    const int remainder = numBits - numWords * 32;
    if (remainder > 0)
        return r.readBits(dummy, remainder);
    return true;
}
} // namespace

std::size_t messageBodyBits(const Message &message) noexcept
{
    return std::visit(
        [](const auto &m) -> std::size_t {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, TestMessage>)
                return 16 + static_cast<std::size_t>(messageBitWidth(m.sequence));
            else if constexpr (std::is_same_v<T, TestBlockMessage>)
                return 16 + kBlockLengthBits + m.block.size() * 8;
            else
                return 0;
        },
        message);
}

bool encodeMessage(const Message &message, protocol::BitWriter &writer, std::size_t maxBlockSize)
{
    if (const auto *block = std::get_if<TestBlockMessage>(&message))
    {
        if (block->block.size() > maxBlockSize)
            return false;
    }
    if (messageBodyBits(message) > writer.bitsAvailable())
        return false;

    return std::visit(
        [&writer](const auto &m) -> bool {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, TestMessage>)
            {
                return writer.writeBits(m.sequence, 16) &&
                       writeFiller(writer, messageBitWidth(m.sequence));
            }
            else if constexpr (std::is_same_v<T, TestBlockMessage>)
            {
                if (!writer.writeBits(m.sequence, 16) ||
                    !writer.writeBits(static_cast<std::uint32_t>(m.block.size()),
                                      kBlockLengthBits))
                    return false;
                for (const std::uint8_t b : m.block)
                {
                    if (!writer.writeBits(b, 8))
                        return false;
                }
                return true;
            }
            else
            {
                // 쓰기 모드는 빈 body 로 성공
                return true;
            }
        },
        message);
}

bool decodeMessage(MessageType type, protocol::BitReader &reader, Message &out,
                   std::size_t maxBlockSize) noexcept
{
    switch (type)
    {
    case MessageType::Test: {
        std::uint32_t seq = 0;
        if (!reader.readBits(seq, 16))
            return false;
        const auto sequence = static_cast<std::uint16_t>(seq);
        // 인코딩 쪽과 같은 테이블로 길이를 다시 계산한다.
        if (!readFiller(reader, messageBitWidth(sequence)))
            return false;
        out = TestMessage{sequence};
        return true;
    }
    case MessageType::TestBlock: {
        std::uint32_t seq = 0;
        std::uint32_t len = 0;
        if (!reader.readBits(seq, 16) || !reader.readBits(len, kBlockLengthBits))
            return false;
        if (len > maxBlockSize || static_cast<std::size_t>(len) * 8 > reader.bitsRemaining())
            return false;

        TestBlockMessage m;
        m.sequence = static_cast<std::uint16_t>(seq);
        try
        {
            m.block.resize(len);
        }
        catch (const std::bad_alloc &)
        {
            return false;
        }
        for (auto &b : m.block)
        {
            std::uint32_t v = 0;
            if (!reader.readBits(v, 8))
                return false;
            b = static_cast<std::uint8_t>(v);
        }
        out = std::move(m);
        return true;
    }
    case MessageType::SerializeFailOnRead:
        return false;
    }
    return false;
}

std::size_t encodeMessageBatch(std::span<const Message> messages, protocol::BitWriter &writer,
                               std::size_t maxMessages, std::size_t maxBlockSize)
{
    if (writer.bitsAvailable() < static_cast<std::size_t>(kMessageCountBits))
        return 0;

    // 개수를 먼저 써야 하므로 body 는 임시 writer 에 모은다.
    protocol::BitWriter bodies(writer.bitsAvailable() - kMessageCountBits);
    std::size_t count = 0;
    for (const auto &m : messages)
    {
        if (count >= maxMessages || count >= 0xFFFF)
            break;

        const auto *block = std::get_if<TestBlockMessage>(&m);
        if (block && block->block.size() > maxBlockSize)
        {
            SLOG_WARN("MessageCodec", "BlockTooLarge", "size={} max={}", block->block.size(),
                      maxBlockSize);
            break;
        }

        const std::size_t bodyBits = messageBodyBits(m);
        if (bodyBits > 0xFFFF || kMessageHeaderBits + bodyBits > bodies.bitsAvailable())
            break;

        if (!bodies.writeBits(static_cast<std::uint32_t>(messageType(m)), kMessageTypeBits) ||
            !bodies.writeBits(static_cast<std::uint32_t>(bodyBits), kBodyBitsFieldBits) ||
            !encodeMessage(m, bodies, maxBlockSize))
        {
            SLOG_WARN("MessageCodec", "EncodeFailed", "type={}", messageTypeName(messageType(m)));
            break;
        }
        ++count;
    }

    if (count == 0)
        return 0;

    if (!writer.writeBits(static_cast<std::uint32_t>(count), kMessageCountBits) ||
        !writer.append(bodies))
        return 0;
    return count;
}

DecodedBatch decodeMessageBatch(protocol::BitReader &reader, std::size_t maxBlockSize)
{
    DecodedBatch result;

    std::uint32_t count = 0;
    if (!reader.readBits(count, kMessageCountBits))
    {
        result.truncated = true;
        return result;
    }

    // count 는 상대가 보낸 값. 남은 비트로 담을 수 있는 헤더 수를 넘겨 잡지 않는다.
    const std::size_t maxFit = reader.bitsRemaining() / kMessageHeaderBits;
    result.messages.reserve(std::min<std::size_t>(count, maxFit));
    for (std::uint32_t i = 0; i < count; ++i)
    {
        std::uint32_t type = 0;
        std::uint32_t bodyBits = 0;
        protocol::BitReader body;
        if (!reader.readBits(type, kMessageTypeBits) ||
            !reader.readBits(bodyBits, kBodyBitsFieldBits) || !reader.slice(bodyBits, body))
        {
            result.truncated = true;
            break;
        }

        if (type >= static_cast<std::uint32_t>(kNumMessageTypes))
        {
            ++result.failed;
            SLOG_DEBUG("MessageCodec", "UnknownType", "type={}", type);
            continue;
        }

        Message m;
        const auto t = static_cast<MessageType>(type);
        if (!decodeMessage(t, body, m, maxBlockSize) || !body.atEnd())
        {
            ++result.failed;
            SLOG_DEBUG("MessageCodec", "DecodeFailed", "type={} bits={}", messageTypeName(t),
                       bodyBits);
            continue;
        }
        result.messages.push_back(std::move(m));
    }
    return result;
}

} // namespace pulsenet::message
