#pragma once

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace pulsenet::message
{

/// 와이어 타입 태그 (2 bits)
enum class MessageType : std::uint8_t
{
    Test = 0,
    TestBlock = 1,
    SerializeFailOnRead = 2
};

inline constexpr int kNumMessageTypes = 3;
inline constexpr int kMessageTypeBits = 2;

/// 시퀀스 번호 + 시퀀스로 길이가 정해지는 filler
struct TestMessage
{
    std::uint16_t sequence{0};
};

/// 시퀀스 번호 + 인라인 블록 (최대 maxBlockSize bytes)
struct TestBlockMessage
{
    std::uint16_t sequence{0};
    std::vector<std::uint8_t> block;
};

/// 쓰기는 빈 body 로 성공, 읽기는 항상 실패. 배치 격리 검증용.
struct SerializeFailOnReadMessage
{
};

using Message = std::variant<TestMessage, TestBlockMessage, SerializeFailOnReadMessage>;

[[nodiscard]] inline MessageType messageType(const Message &m) noexcept
{
    return static_cast<MessageType>(m.index());
}

[[nodiscard]] inline std::string_view messageTypeName(MessageType t) noexcept
{
    switch (t)
    {
    case MessageType::Test:
        return "TestMessage";
    case MessageType::TestBlock:
        return "TestBlockMessage";
    case MessageType::SerializeFailOnRead:
        return "SerializeFailOnReadMessage";
    }
    return "Unknown";
}

} // namespace pulsenet::message
