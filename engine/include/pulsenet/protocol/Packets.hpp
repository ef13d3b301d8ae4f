#pragma once

#include <pulsenet/crypto/ConnectToken.hpp>
#include <pulsenet/protocol/ByteCodec.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace pulsenet::protocol
{

// ------------------------------------------------------------
// UDP 패킷: [type:u8][sequence:u64_be][body...]
// ------------------------------------------------------------
enum class PacketType : std::uint8_t
{
    ConnectionRequest = 0,
    ConnectionDenied = 1,
    ConnectionChallenge = 2,
    ConnectionResponse = 3,
    KeepAlive = 4,
    Payload = 5,
    Disconnect = 6,
};

inline constexpr std::uint8_t kNumPacketTypes = 7;

[[nodiscard]] std::string_view packetTypeName(PacketType type) noexcept;

struct PacketHeader
{
    static constexpr std::size_t kWireBytes = 1 + 8;

    PacketType type{PacketType::Disconnect};
    std::uint64_t sequence{0};

    bool read(ByteReader &r)
    {
        std::uint8_t t = 0;
        if (!r.readU8(t) || t >= kNumPacketTypes)
            return false;
        type = static_cast<PacketType>(t);
        return r.readU64Be(sequence);
    }

    void write(ByteWriter &w) const
    {
        w.writeU8(static_cast<std::uint8_t>(type));
        w.writeU64Be(sequence);
    }
};

enum class DenyReason : std::uint8_t
{
    ServerFull = 1,
    InvalidToken = 2,
    TokenExpired = 3,
};

// ------------------------------------------------------------
// Handshake
// ------------------------------------------------------------

/// 토큰 공개 헤더 중 서버가 봉인을 여는 데 필요한 필드만 싣는다.
struct ConnectionRequestPkt
{
    static constexpr PacketType kType = PacketType::ConnectionRequest;

    std::array<std::uint8_t, crypto::kVersionInfoBytes> versionInfo{};
    std::uint64_t protocolId{0};
    std::uint64_t expireTimestamp{0};
    crypto::Nonce nonce{};
    crypto::SealedPrivateBytes sealedPrivate{};

    bool read(ByteReader &r)
    {
        return r.readBytes(versionInfo) && r.readU64Be(protocolId) &&
               r.readU64Be(expireTimestamp) && r.readBytes(nonce) && r.readBytes(sealedPrivate);
    }

    void write(ByteWriter &w) const
    {
        w.writeBytes(versionInfo);
        w.writeU64Be(protocolId);
        w.writeU64Be(expireTimestamp);
        w.writeBytes(nonce);
        w.writeBytes(sealedPrivate);
    }
};

struct ConnectionDeniedPkt
{
    static constexpr PacketType kType = PacketType::ConnectionDenied;

    DenyReason reason{DenyReason::ServerFull};

    bool read(ByteReader &r)
    {
        std::uint8_t v = 0;
        if (!r.readU8(v))
            return false;
        reason = static_cast<DenyReason>(v);
        return true;
    }

    void write(ByteWriter &w) const { w.writeU8(static_cast<std::uint8_t>(reason)); }
};

/// 서버가 발급한 challenge. 클라이언트는 그대로 되돌려 보낸다.
struct ConnectionChallengePkt
{
    static constexpr PacketType kType = PacketType::ConnectionChallenge;

    std::uint64_t challengeSequence{0};
    std::uint64_t challengeToken{0};

    bool read(ByteReader &r) { return r.readU64Be(challengeSequence) && r.readU64Be(challengeToken); }

    void write(ByteWriter &w) const
    {
        w.writeU64Be(challengeSequence);
        w.writeU64Be(challengeToken);
    }
};

struct ConnectionResponsePkt
{
    static constexpr PacketType kType = PacketType::ConnectionResponse;

    std::uint64_t challengeSequence{0};
    std::uint64_t challengeToken{0};

    bool read(ByteReader &r) { return r.readU64Be(challengeSequence) && r.readU64Be(challengeToken); }

    void write(ByteWriter &w) const
    {
        w.writeU64Be(challengeSequence);
        w.writeU64Be(challengeToken);
    }
};

// ------------------------------------------------------------
// Connected
// ------------------------------------------------------------

/// 서버 -> 클라: 첫 keep-alive 가 handshake 완료 신호
struct KeepAlivePkt
{
    static constexpr PacketType kType = PacketType::KeepAlive;

    std::uint32_t clientIndex{0};
    std::uint32_t maxClients{0};

    bool read(ByteReader &r) { return r.readU32Be(clientIndex) && r.readU32Be(maxClients); }

    void write(ByteWriter &w) const
    {
        w.writeU32Be(clientIndex);
        w.writeU32Be(maxClients);
    }
};

/// body 는 메시지 배치 비트스트림 (MessageCodec)
struct PayloadPkt
{
    static constexpr PacketType kType = PacketType::Payload;

    std::span<const std::uint8_t> bits{};

    bool read(ByteReader &r) { return r.remaining() > 0 && r.readView(r.remaining(), bits); }

    void write(ByteWriter &w) const { w.writeBytes(bits); }
};

struct DisconnectPkt
{
    static constexpr PacketType kType = PacketType::Disconnect;

    bool read(ByteReader &) { return true; }
    void write(ByteWriter &) const {}
};

/// 헤더 + body 직렬화
template <typename PacketT>
[[nodiscard]] std::vector<std::uint8_t> buildPacket(const PacketT &pkt, std::uint64_t sequence)
{
    ByteWriter w(PacketHeader::kWireBytes + 64);
    PacketHeader{PacketT::kType, sequence}.write(w);
    pkt.write(w);
    return w.release();
}

/// body 파싱. 남는 바이트가 있으면 실패(strict)
template <typename PacketT> [[nodiscard]] bool parseBody(ByteReader &r, PacketT &out)
{
    return out.read(r) && r.atEnd();
}

} // namespace pulsenet::protocol
