#include <pulsenet/session/LoopbackBridge.hpp>

#include <pulsenet/core/Logger.hpp>

#include <stdexcept>

namespace pulsenet::session
{

void LoopbackBridge::deliver(LoopbackRole from, int clientIndex,
                             std::span<const std::uint8_t> packet, std::uint64_t sequence)
{
    if (!isRegistered())
    {
        SLOG_FATAL("LoopbackBridge", "NotRegistered", "from={} server={} client={}",
                   from == LoopbackRole::Client ? "client" : "server", server_ != nullptr,
                   client_ != nullptr);
        throw std::logic_error("LoopbackBridge: both endpoints must be attached before send");
    }

    ++delivered_;
    SLOG_TRACE("LoopbackBridge", "Deliver", "from={} index={} seq={} bytes={}",
               from == LoopbackRole::Client ? "client" : "server", clientIndex, sequence,
               packet.size());

    if (from == LoopbackRole::Client)
    {
        server_->processLoopbackPacket(clientIndex, packet, sequence);
    }
    else
    {
        client_->processLoopbackPacket(packet, sequence);
    }
}

} // namespace pulsenet::session
