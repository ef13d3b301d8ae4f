#pragma once

#include <pulsenet/crypto/ConnectToken.hpp>
#include <pulsenet/net/Socket.hpp>
#include <pulsenet/protocol/FrameHeader.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace pulsenet::runtime
{

// 매처 TCP 프레임 opcode. 요청 1개 -> 응답 1개 후 연결을 닫는다.
enum class MatchOpcode : std::uint16_t
{
    MatchRequest = 0x0101,
    MatchReply = 0x0102,
};

// [protocolId:u64][clientId:u64][loopback:u8]
struct MatchRequestBody
{
    static constexpr std::size_t kWireBytes = 8 + 8 + 1;

    std::uint64_t protocolId{0};
    std::uint64_t clientId{0};
    bool loopback{false};
};

enum class MatchReplyStatus : std::uint8_t
{
    Ok = 0,
    Rejected = 1,
};

// [status:u8] + (Ok 이면) [token:1024]
struct MatchReplyBody
{
    MatchReplyStatus status{MatchReplyStatus::Rejected};
    crypto::ConnectTokenBytes token{};
};

[[nodiscard]] std::vector<std::uint8_t> encodeMatchRequest(const MatchRequestBody &req);
[[nodiscard]] bool decodeMatchRequest(std::span<const std::uint8_t> body, MatchRequestBody &out);

[[nodiscard]] std::vector<std::uint8_t> encodeMatchReply(const MatchReplyBody &reply);
[[nodiscard]] bool decodeMatchReply(std::span<const std::uint8_t> body, MatchReplyBody &out);

/// 프레임 1개를 blocking 으로 주고받는다. 소켓 타임아웃/EOF/상한 초과는 false.
[[nodiscard]] bool writeFrame(net::Socket &socket, MatchOpcode opcode,
                              std::span<const std::uint8_t> body);
[[nodiscard]] bool readFrame(net::Socket &socket, std::uint16_t &opcode,
                             std::vector<std::uint8_t> &body);

} // namespace pulsenet::runtime
