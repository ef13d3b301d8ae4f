#pragma once

#include <pulsenet/protocol/Endian.hpp>

#include <cstddef>
#include <cstdint>

namespace pulsenet::protocol
{

/// TCP 스트림 프레이밍 (매처 요청/응답)
///   [Length:u32_be] + [Opcode:u16_be] + [Body...]
/// - Length == (Opcode + Body) bytes (length 필드 자신은 제외)
struct FrameHeader
{
    static constexpr std::size_t kLengthFieldBytes = 4;
    static constexpr std::size_t kOpcodeFieldBytes = 2;
    static constexpr std::size_t kWireBytes = kLengthFieldBytes + kOpcodeFieldBytes;

    /// 매처 프레임 상한. connect token(1024) + 여유
    static constexpr std::uint32_t kMaxPayloadLen = 4096;

    std::uint32_t payloadLen{0};
    std::uint16_t opcode{0};

    void encode(std::uint8_t out[kWireBytes]) const noexcept
    {
        storeU32Be(payloadLen, out);
        storeU16Be(opcode, out + kLengthFieldBytes);
    }

    /// payloadLen 이 opcode 보다 작거나 상한을 넘으면 false
    [[nodiscard]] bool decode(const std::uint8_t in[kWireBytes]) noexcept
    {
        payloadLen = loadU32Be(in);
        opcode = loadU16Be(in + kLengthFieldBytes);
        return payloadLen >= kOpcodeFieldBytes && payloadLen <= kMaxPayloadLen;
    }

    [[nodiscard]] std::size_t bodyLen() const noexcept { return payloadLen - kOpcodeFieldBytes; }

    [[nodiscard]] static constexpr std::uint32_t payloadLenForBody(std::size_t bodyLen) noexcept
    {
        return static_cast<std::uint32_t>(kOpcodeFieldBytes + bodyLen);
    }
};

} // namespace pulsenet::protocol
