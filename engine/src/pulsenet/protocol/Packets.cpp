#include <pulsenet/protocol/Packets.hpp>

namespace pulsenet::protocol
{

std::string_view packetTypeName(PacketType type) noexcept
{
    switch (type)
    {
    case PacketType::ConnectionRequest:
        return "ConnectionRequest";
    case PacketType::ConnectionDenied:
        return "ConnectionDenied";
    case PacketType::ConnectionChallenge:
        return "ConnectionChallenge";
    case PacketType::ConnectionResponse:
        return "ConnectionResponse";
    case PacketType::KeepAlive:
        return "KeepAlive";
    case PacketType::Payload:
        return "Payload";
    case PacketType::Disconnect:
        return "Disconnect";
    }
    return "Unknown";
}

} // namespace pulsenet::protocol
