#pragma once

#include <pulsenet/message/Message.hpp>
#include <pulsenet/protocol/BitPacker.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace pulsenet::message
{

/// 시퀀스 번호 -> TestMessage filler 비트 수
inline constexpr std::array<int, 21> kMessageBitsTable = {
    1, 320, 120, 4, 256, 45, 11, 13, 101, 100, 84, 95, 203, 2, 3, 8, 512, 5, 3, 7, 50};

[[nodiscard]] constexpr int messageBitWidth(std::uint16_t sequence) noexcept
{
    return kMessageBitsTable[sequence % kMessageBitsTable.size()];
}

/// 배치 안 메시지 헤더: [type:2][bodyBits:16]
inline constexpr int kBodyBitsFieldBits = 16;
inline constexpr std::size_t kMessageHeaderBits = kMessageTypeBits + kBodyBitsFieldBits;
inline constexpr int kMessageCountBits = 16;

/// 메시지 body 하나를 인코딩합니다.
/// - 블록이 maxBlockSize 보다 크면 false (writer 는 건드리지 않는다)
[[nodiscard]] bool encodeMessage(const Message &message, protocol::BitWriter &writer,
                                 std::size_t maxBlockSize);

/// type 에 해당하는 body 를 디코딩합니다.
/// - body 가 손상됐거나 SerializeFailOnRead 면 false. 예외 없음.
[[nodiscard]] bool decodeMessage(MessageType type, protocol::BitReader &reader, Message &out,
                                 std::size_t maxBlockSize) noexcept;

/// 인코딩된 body 비트 수 (헤더 제외)
[[nodiscard]] std::size_t messageBodyBits(const Message &message) noexcept;

struct DecodedBatch
{
    std::vector<Message> messages;

    /// body 디코딩 실패(또는 선언 길이와 소비 길이 불일치)로 버린 메시지 수
    int failed{0};

    /// 헤더를 더 읽을 수 없어 배치를 중간에 끊었는지
    bool truncated{false};
};

/// 앞에서부터 들어가는 만큼 인코딩합니다. 반환값은 인코딩한 메시지 수.
/// - [count:16] 후 메시지마다 [type:2][bodyBits:16][body]
/// - 한 메시지라도 넣을 자리가 없으면 거기서 멈춘다(순서 유지).
std::size_t encodeMessageBatch(std::span<const Message> messages, protocol::BitWriter &writer,
                               std::size_t maxMessages, std::size_t maxBlockSize);

/// 배치 디코딩. 메시지 하나의 실패는 그 메시지만 버리고 다음 형제로 넘어간다.
[[nodiscard]] DecodedBatch decodeMessageBatch(protocol::BitReader &reader,
                                              std::size_t maxBlockSize);

} // namespace pulsenet::message
