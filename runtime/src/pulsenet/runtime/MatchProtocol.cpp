#include <pulsenet/runtime/MatchProtocol.hpp>

#include <pulsenet/protocol/ByteCodec.hpp>

#include <algorithm>

namespace pulsenet::runtime
{

std::vector<std::uint8_t> encodeMatchRequest(const MatchRequestBody &req)
{
    protocol::ByteWriter w(MatchRequestBody::kWireBytes);
    w.writeU64Be(req.protocolId);
    w.writeU64Be(req.clientId);
    w.writeU8(req.loopback ? 1 : 0);
    return w.release();
}

bool decodeMatchRequest(std::span<const std::uint8_t> body, MatchRequestBody &out)
{
    protocol::ByteReader r(body);
    std::uint8_t loopback = 0;
    if (!r.readU64Be(out.protocolId) || !r.readU64Be(out.clientId) || !r.readU8(loopback))
        return false;
    if (loopback > 1)
        return false;
    out.loopback = loopback == 1;
    return r.atEnd();
}

std::vector<std::uint8_t> encodeMatchReply(const MatchReplyBody &reply)
{
    protocol::ByteWriter w(1 + crypto::kConnectTokenBytes);
    w.writeU8(static_cast<std::uint8_t>(reply.status));
    if (reply.status == MatchReplyStatus::Ok)
        w.writeBytes(reply.token);
    return w.release();
}

bool decodeMatchReply(std::span<const std::uint8_t> body, MatchReplyBody &out)
{
    protocol::ByteReader r(body);
    std::uint8_t status = 0;
    if (!r.readU8(status))
        return false;

    switch (static_cast<MatchReplyStatus>(status))
    {
    case MatchReplyStatus::Ok:
        out.status = MatchReplyStatus::Ok;
        return r.readBytes(out.token) && r.atEnd();
    case MatchReplyStatus::Rejected:
        out.status = MatchReplyStatus::Rejected;
        return r.atEnd();
    }
    return false;
}

bool writeFrame(net::Socket &socket, MatchOpcode opcode, std::span<const std::uint8_t> body)
{
    using protocol::FrameHeader;
    if (body.size() + FrameHeader::kOpcodeFieldBytes > FrameHeader::kMaxPayloadLen)
        return false;

    protocol::FrameHeader h;
    h.payloadLen = protocol::FrameHeader::payloadLenForBody(body.size());
    h.opcode = static_cast<std::uint16_t>(opcode);

    std::vector<std::uint8_t> frame(protocol::FrameHeader::kWireBytes + body.size());
    h.encode(frame.data());
    std::copy(body.begin(), body.end(), frame.begin() + protocol::FrameHeader::kWireBytes);
    return socket.sendAll(frame.data(), frame.size());
}

bool readFrame(net::Socket &socket, std::uint16_t &opcode, std::vector<std::uint8_t> &body)
{
    std::uint8_t hdr[protocol::FrameHeader::kWireBytes];
    if (!socket.recvAll(hdr, sizeof(hdr)))
        return false;

    protocol::FrameHeader h;
    if (!h.decode(hdr))
        return false;

    body.resize(h.bodyLen());
    if (!body.empty() && !socket.recvAll(body.data(), body.size()))
        return false;

    opcode = h.opcode;
    return true;
}

} // namespace pulsenet::runtime
