#include <pulsenet/session/Server.hpp>

#include <pulsenet/core/Defaults.hpp>
#include <pulsenet/core/Logger.hpp>
#include <pulsenet/protocol/ByteCodec.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace pulsenet::session
{

namespace
{
constexpr double kNever = -std::numeric_limits<double>::infinity();
constexpr int kSocketBufferBytes = 4 * 1024 * 1024;

bool wouldBlock(int err) noexcept
{
    return err == EAGAIN || err == EWOULDBLOCK;
}

// 봉인 데이터의 마지막 16바이트(GCM tag)를 재사용 판별 키로 쓴다.
std::vector<std::uint8_t> tokenKey(const crypto::SealedPrivateBytes &sealed)
{
    return {sealed.end() - crypto::kTagBytes, sealed.end()};
}
} // namespace

Server::Server(const Runtime &runtime, const SessionConfig &config, const crypto::Key &privateKey,
               const net::Address &address, double time)
    : runtime_(runtime), config_(config), privateKey_(privateKey), address_(address), time_(time)
{
    runtime_.requireInitialized("Server");
    if (!address_.isValid())
    {
        throw std::invalid_argument("Server: invalid bind address");
    }
    // 한 바이트 더 받아서 잘린 datagram 을 구분한다.
    recvBuf_.resize(config_.maxPacketSize + 1);
}

Server::~Server()
{
    try
    {
        stop();
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("Server", "DestructorStopFailed", "err={}", e.what());
    }
}

template <typename PacketT> void Server::sendToClient(int clientIndex, const PacketT &pkt)
{
    ClientSlot &slot = slots_[static_cast<std::size_t>(clientIndex)];
    const std::uint64_t seq = slot.sequence++;
    const auto packet = protocol::buildPacket(pkt, seq);
    slot.lastPacketSendTime = time_;

    if (slot.loopback)
    {
        if (bridge_ == nullptr)
        {
            throw std::logic_error("Server: loopback send without LoopbackBridge");
        }
        bridge_->deliver(LoopbackRole::Server, clientIndex, packet, seq);
        counters_.onPacketSent();
        return;
    }

    sendRaw(slot.address, packet);
}

template <typename PacketT> void Server::sendHandshake(const net::Address &to, const PacketT &pkt)
{
    sendRaw(to, protocol::buildPacket(pkt, handshakeSequence_++));
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

bool Server::start(int maxClients, bool openSocket)
{
    if (running_)
    {
        SLOG_WARN("Server", "AlreadyRunning", "address={}", address_.toString());
        return true;
    }
    if (maxClients < 1 || maxClients > core::defaults::kMaxClients)
    {
        throw std::invalid_argument("Server: maxClients out of range [1, " +
                                    std::to_string(core::defaults::kMaxClients) + "]");
    }

    if (openSocket)
    {
        socket_ = net::Socket::createUdp(address_.type());
        if (!socket_.isValid() || !socket_.bind(address_) || !socket_.setNonBlocking(true))
        {
            const int err = errno;
            SLOG_ERROR("Server", "SocketOpenFailed", "address={} errno={} err={}",
                       address_.toString(), err, std::strerror(err));
            socket_.close();
            return false;
        }
        if (!socket_.setBufferSizes(kSocketBufferBytes))
        {
            SLOG_WARN("Server", "SetBufferSizesFailed", "errno={}", errno);
        }
        address_ = socket_.localAddress();
    }

    slots_.clear();
    slots_.resize(static_cast<std::size_t>(maxClients));
    for (auto &slot : slots_)
    {
        slot.channel = std::make_unique<MessageChannel>(config_, counters_);
    }
    pending_.clear();
    usedTokens_.clear();
    maxClients_ = maxClients;
    running_ = true;

    SLOG_INFO("Server", "Started", "address={} max_clients={} socket={}", address_.toString(),
              maxClients, openSocket ? "udp" : "none");
    return true;
}

void Server::stop()
{
    if (!running_)
        return;

    disconnectAllClients();
    socket_.close();
    slots_.clear();
    pending_.clear();
    usedTokens_.clear();
    maxClients_ = 0;
    running_ = false;

    SLOG_INFO("Server", "Stopped", "address={}", address_.toString());
}

// -----------------------------------------------------------------------------
// Slots
// -----------------------------------------------------------------------------

bool Server::validIndex(int clientIndex) const noexcept
{
    return clientIndex >= 0 && clientIndex < maxClients_;
}

int Server::findFreeSlot() const noexcept
{
    for (int i = 0; i < maxClients_; ++i)
    {
        if (!slots_[static_cast<std::size_t>(i)].connected)
            return i;
    }
    return -1;
}

int Server::findClientByAddress(const net::Address &address) const noexcept
{
    for (int i = 0; i < maxClients_; ++i)
    {
        const auto &slot = slots_[static_cast<std::size_t>(i)];
        if (slot.connected && !slot.loopback && slot.address == address)
            return i;
    }
    return -1;
}

int Server::findClientById(std::uint64_t clientId) const noexcept
{
    for (int i = 0; i < maxClients_; ++i)
    {
        const auto &slot = slots_[static_cast<std::size_t>(i)];
        if (slot.connected && slot.clientId == clientId)
            return i;
    }
    return -1;
}

bool Server::isClientConnected(int clientIndex) const noexcept
{
    return validIndex(clientIndex) && slots_[static_cast<std::size_t>(clientIndex)].connected;
}

int Server::numConnectedClients() const noexcept
{
    return static_cast<int>(std::count_if(slots_.begin(), slots_.end(),
                                          [](const ClientSlot &s) { return s.connected; }));
}

std::uint64_t Server::clientId(int clientIndex) const noexcept
{
    return isClientConnected(clientIndex) ? slots_[static_cast<std::size_t>(clientIndex)].clientId
                                          : 0;
}

std::optional<net::Address> Server::clientAddress(int clientIndex) const
{
    if (!isClientConnected(clientIndex))
        return std::nullopt;
    const auto &slot = slots_[static_cast<std::size_t>(clientIndex)];
    if (slot.loopback)
        return std::nullopt;
    return slot.address;
}

void Server::connectLoopbackClient(int clientIndex, std::uint64_t clientId)
{
    if (!running_)
    {
        throw std::logic_error("Server: connectLoopbackClient before start");
    }
    if (!validIndex(clientIndex))
    {
        throw std::logic_error("Server: loopback client index out of range");
    }
    ClientSlot &slot = slots_[static_cast<std::size_t>(clientIndex)];
    if (slot.connected)
    {
        throw std::logic_error("Server: loopback client slot already in use");
    }

    slot.connected = true;
    slot.loopback = true;
    slot.clientId = clientId;
    slot.address = net::Address{};
    slot.lastPacketReceiveTime = time_;
    // 첫 keep-alive 는 다음 sendPackets() 에서 나간다 (bridge 등록 이후)
    slot.lastPacketSendTime = kNever;
    slot.sequence = 0;
    slot.timeoutSeconds = config_.timeoutSeconds;
    slot.channel->reset();

    SLOG_INFO("Server", "LoopbackClientConnected", "client_index={} client_id={:016x}",
              clientIndex, clientId);
}

void Server::disconnectLoopbackClient(int clientIndex)
{
    if (!isClientConnected(clientIndex))
        return;
    ClientSlot &slot = slots_[static_cast<std::size_t>(clientIndex)];
    if (!slot.loopback)
    {
        throw std::logic_error("Server: disconnectLoopbackClient on a network client");
    }
    freeSlot(clientIndex, FailReason::LocalDisconnect);
}

void Server::disconnectClient(int clientIndex)
{
    if (!isClientConnected(clientIndex))
        return;

    const ClientSlot &slot = slots_[static_cast<std::size_t>(clientIndex)];
    const int count = slot.loopback ? 1 : config_.numDisconnectPackets;
    for (int i = 0; i < count; ++i)
    {
        sendToClient(clientIndex, protocol::DisconnectPkt{});
    }
    freeSlot(clientIndex, FailReason::LocalDisconnect);
}

void Server::disconnectAllClients()
{
    for (int i = 0; i < maxClients_; ++i)
    {
        if (!isClientConnected(i))
            continue;
        // loopback 상대는 이미 detach 됐을 수 있으므로 조용히 비운다.
        if (slots_[static_cast<std::size_t>(i)].loopback)
            freeSlot(i, FailReason::LocalDisconnect);
        else
            disconnectClient(i);
    }
}

void Server::freeSlot(int clientIndex, FailReason reason)
{
    ClientSlot &slot = slots_[static_cast<std::size_t>(clientIndex)];
    SLOG_INFO("Server", "ClientDisconnected", "client_index={} client_id={:016x} reason={}",
              clientIndex, slot.clientId, failReasonName(reason));

    slot.connected = false;
    slot.loopback = false;
    slot.clientId = 0;
    slot.address = net::Address{};
    slot.sequence = 0;
    slot.channel->reset();
}

// -----------------------------------------------------------------------------
// Send / Receive
// -----------------------------------------------------------------------------

void Server::sendRaw(const net::Address &to, const std::vector<std::uint8_t> &packet)
{
    if (!socket_.isValid())
    {
        counters_.onSendError();
        return;
    }

    const ::ssize_t n = socket_.sendTo(to, packet.data(), packet.size());
    if (n < 0)
    {
        const int err = errno;
        counters_.onSendError();
        if (!wouldBlock(err))
        {
            SLOG_WARN("Server", "SendFailed", "to={} errno={} err={}", to.toString(), err,
                      std::strerror(err));
        }
        return;
    }
    counters_.onPacketSent();
}

void Server::sendPackets()
{
    if (!running_)
        return;

    const double interval = 1.0 / config_.packetSendRate;
    for (int i = 0; i < maxClients_; ++i)
    {
        ClientSlot &slot = slots_[static_cast<std::size_t>(i)];
        if (!slot.connected)
            continue;

        while (slot.connected && slot.channel->hasPending())
        {
            auto bits = slot.channel->takeNextPayload();
            if (bits.empty())
                continue;
            protocol::PayloadPkt payload;
            payload.bits = bits;
            sendToClient(i, payload);
        }

        if (slot.connected && time_ - slot.lastPacketSendTime >= interval)
        {
            protocol::KeepAlivePkt keepAlive;
            keepAlive.clientIndex = static_cast<std::uint32_t>(i);
            keepAlive.maxClients = static_cast<std::uint32_t>(maxClients_);
            sendToClient(i, keepAlive);
        }
    }
}

void Server::receivePackets()
{
    if (!running_ || !socket_.isValid())
        return;

    while (true)
    {
        net::Address from;
        const ::ssize_t n = socket_.recvFrom(recvBuf_.data(), recvBuf_.size(), from);
        if (n < 0)
        {
            const int err = errno;
            if (!wouldBlock(err) && err != EINTR)
            {
                SLOG_WARN("Server", "RecvFailed", "errno={} err={}", err, std::strerror(err));
            }
            break;
        }
        if (static_cast<std::size_t>(n) > config_.maxPacketSize)
        {
            counters_.onPacketInvalid();
            SLOG_DEBUG("Server", "OversizedPacket", "from={} bytes>{}", from.toString(),
                       config_.maxPacketSize);
            continue;
        }
        processPacket(from,
                      std::span<const std::uint8_t>(recvBuf_.data(), static_cast<std::size_t>(n)));
    }
}

void Server::processLoopbackPacket(int clientIndex, std::span<const std::uint8_t> packet,
                                   std::uint64_t sequence)
{
    if (!isClientConnected(clientIndex) || !slots_[static_cast<std::size_t>(clientIndex)].loopback)
    {
        SLOG_DEBUG("Server", "LoopbackPacketIgnored", "client_index={} seq={}", clientIndex,
                   sequence);
        counters_.onPacketInvalid();
        return;
    }

    protocol::ByteReader r(packet);
    protocol::PacketHeader header;
    if (!header.read(r))
    {
        counters_.onPacketInvalid();
        return;
    }
    processConnectedPacket(clientIndex, header, r);
}

void Server::processPacket(const net::Address &from, std::span<const std::uint8_t> packet)
{
    protocol::ByteReader r(packet);
    protocol::PacketHeader header;
    if (!header.read(r))
    {
        counters_.onPacketInvalid();
        return;
    }

    switch (header.type)
    {
    case protocol::PacketType::ConnectionRequest:
        processConnectionRequest(from, r);
        return;
    case protocol::PacketType::ConnectionResponse:
        processConnectionResponse(from, r);
        return;
    default:
        break;
    }

    const int clientIndex = findClientByAddress(from);
    if (clientIndex < 0)
    {
        counters_.onPacketInvalid();
        SLOG_TRACE("Server", "UnknownSender", "from={} type={}", from.toString(),
                   protocol::packetTypeName(header.type));
        return;
    }
    processConnectedPacket(clientIndex, header, r);
}

void Server::processConnectionRequest(const net::Address &from, protocol::ByteReader &r)
{
    protocol::ConnectionRequestPkt req;
    if (!protocol::parseBody(r, req))
    {
        counters_.onPacketInvalid();
        return;
    }

    // 이미 연결된 주소의 재전송 request 는 무시
    if (findClientByAddress(from) >= 0)
        return;

    if (req.versionInfo != crypto::kVersionInfo || req.protocolId != config_.protocolId)
    {
        counters_.onPacketInvalid();
        SLOG_DEBUG("Server", "RequestRejected", "from={} why=version_or_protocol",
                   from.toString());
        return;
    }

    const std::uint64_t now = runtime_.unixTimeSeconds();
    if (req.expireTimestamp <= now)
    {
        counters_.onPacketInvalid();
        SLOG_DEBUG("Server", "RequestRejected", "from={} why=token_expired", from.toString());
        return;
    }

    crypto::ConnectTokenPrivate priv;
    if (!crypto::openConnectTokenPrivate(req.sealedPrivate, req.versionInfo, req.protocolId,
                                         req.expireTimestamp, req.nonce, privateKey_, priv))
    {
        counters_.onPacketInvalid();
        SLOG_DEBUG("Server", "RequestRejected", "from={} why=token_open_failed", from.toString());
        return;
    }

    const bool listed = std::any_of(priv.serverAddresses.begin(), priv.serverAddresses.end(),
                                    [this](const net::Address &a) { return a == address_; });
    if (!listed)
    {
        counters_.onPacketInvalid();
        SLOG_DEBUG("Server", "RequestRejected", "from={} why=server_not_in_token",
                   from.toString());
        return;
    }

    if (findClientById(priv.clientId) >= 0)
    {
        SLOG_DEBUG("Server", "RequestRejected", "from={} why=client_id_connected",
                   from.toString());
        return;
    }

    if (tokenAlreadyUsed(req.sealedPrivate, from, req.expireTimestamp))
    {
        counters_.onPacketInvalid();
        SLOG_WARN("Server", "TokenReuse", "from={} client_id={:016x}", from.toString(),
                  priv.clientId);
        return;
    }

    counters_.onPacketReceived();

    if (numConnectedClients() >= maxClients_)
    {
        protocol::ConnectionDeniedPkt denied;
        denied.reason = protocol::DenyReason::ServerFull;
        sendHandshake(from, denied);
        SLOG_INFO("Server", "ConnectionDenied", "from={} reason=server_full", from.toString());
        return;
    }

    const std::string key = from.toString();
    auto it = pending_.find(key);
    if (it == pending_.end())
    {
        PendingClient pc;
        pc.clientId = priv.clientId;
        pc.timeoutSeconds = priv.timeoutSeconds;
        pc.challengeSequence = challengeSequence_++;
        pc.challengeToken = runtime_.randomU64();
        pc.createTime = time_;
        it = pending_.emplace(key, pc).first;
        SLOG_DEBUG("Server", "ChallengeIssued", "from={} client_id={:016x}", key, priv.clientId);
    }

    protocol::ConnectionChallengePkt challenge;
    challenge.challengeSequence = it->second.challengeSequence;
    challenge.challengeToken = it->second.challengeToken;
    sendHandshake(from, challenge);
}

void Server::processConnectionResponse(const net::Address &from, protocol::ByteReader &r)
{
    protocol::ConnectionResponsePkt resp;
    if (!protocol::parseBody(r, resp))
    {
        counters_.onPacketInvalid();
        return;
    }

    const int existing = findClientByAddress(from);
    if (existing >= 0)
    {
        // keep-alive 가 유실됐을 수 있으므로 한 번 더 보낸다.
        protocol::KeepAlivePkt keepAlive;
        keepAlive.clientIndex = static_cast<std::uint32_t>(existing);
        keepAlive.maxClients = static_cast<std::uint32_t>(maxClients_);
        sendToClient(existing, keepAlive);
        return;
    }

    const auto it = pending_.find(from.toString());
    if (it == pending_.end() || it->second.challengeSequence != resp.challengeSequence ||
        it->second.challengeToken != resp.challengeToken)
    {
        counters_.onPacketInvalid();
        SLOG_DEBUG("Server", "ResponseRejected", "from={}", from.toString());
        return;
    }

    counters_.onPacketReceived();

    const int clientIndex = findFreeSlot();
    if (clientIndex < 0)
    {
        protocol::ConnectionDeniedPkt denied;
        denied.reason = protocol::DenyReason::ServerFull;
        sendHandshake(from, denied);
        pending_.erase(it);
        return;
    }

    ClientSlot &slot = slots_[static_cast<std::size_t>(clientIndex)];
    slot.connected = true;
    slot.loopback = false;
    slot.clientId = it->second.clientId;
    slot.address = from;
    slot.lastPacketReceiveTime = time_;
    slot.sequence = 0;
    slot.timeoutSeconds = it->second.timeoutSeconds;
    slot.channel->reset();
    pending_.erase(it);

    SLOG_INFO("Server", "ClientConnected", "client_index={} client_id={:016x} address={}",
              clientIndex, slot.clientId, from.toString());

    protocol::KeepAlivePkt keepAlive;
    keepAlive.clientIndex = static_cast<std::uint32_t>(clientIndex);
    keepAlive.maxClients = static_cast<std::uint32_t>(maxClients_);
    sendToClient(clientIndex, keepAlive);
}

void Server::processConnectedPacket(int clientIndex, const protocol::PacketHeader &header,
                                    protocol::ByteReader &r)
{
    ClientSlot &slot = slots_[static_cast<std::size_t>(clientIndex)];

    switch (header.type)
    {
    case protocol::PacketType::KeepAlive: {
        protocol::KeepAlivePkt pkt;
        if (!protocol::parseBody(r, pkt))
            break;
        counters_.onPacketReceived();
        slot.lastPacketReceiveTime = time_;
        return;
    }
    case protocol::PacketType::Payload: {
        protocol::PayloadPkt pkt;
        if (!protocol::parseBody(r, pkt))
            break;
        counters_.onPacketReceived();
        slot.lastPacketReceiveTime = time_;
        slot.channel->processPayload(pkt.bits);
        return;
    }
    case protocol::PacketType::Disconnect: {
        protocol::DisconnectPkt pkt;
        if (!protocol::parseBody(r, pkt))
            break;
        counters_.onPacketReceived();
        freeSlot(clientIndex, FailReason::PeerDisconnect);
        return;
    }
    default:
        break;
    }

    counters_.onPacketInvalid();
}

bool Server::tokenAlreadyUsed(const crypto::SealedPrivateBytes &sealed, const net::Address &from,
                              std::uint64_t expireTimestamp)
{
    auto key = tokenKey(sealed);
    const auto it = usedTokens_.find(key);
    if (it == usedTokens_.end())
    {
        usedTokens_.emplace(std::move(key), UsedToken{from, expireTimestamp});
        return false;
    }
    // 같은 주소의 재전송은 허용
    return !(it->second.address == from);
}

// -----------------------------------------------------------------------------
// Time
// -----------------------------------------------------------------------------

void Server::advanceTime(double time)
{
    time_ = time;
    if (!running_)
        return;

    for (int i = 0; i < maxClients_; ++i)
    {
        const ClientSlot &slot = slots_[static_cast<std::size_t>(i)];
        if (!slot.connected || slot.timeoutSeconds <= 0)
            continue;
        if (slot.lastPacketReceiveTime + static_cast<double>(slot.timeoutSeconds) < time_)
        {
            freeSlot(i, FailReason::ConnectionTimeout);
        }
    }

    for (auto it = pending_.begin(); it != pending_.end();)
    {
        // 토큰 timeout 이 0 이하여도 pending 은 반드시 만료시킨다.
        const int timeout = it->second.timeoutSeconds > 0 ? it->second.timeoutSeconds
                                                          : config_.timeoutSeconds;
        if (it->second.createTime + static_cast<double>(timeout) < time_)
            it = pending_.erase(it);
        else
            ++it;
    }

    const std::uint64_t now = runtime_.unixTimeSeconds();
    std::erase_if(usedTokens_, [now](const auto &kv) { return kv.second.expireTimestamp <= now; });
}

// -----------------------------------------------------------------------------
// Messages
// -----------------------------------------------------------------------------

bool Server::canSendMessage(int clientIndex) const noexcept
{
    return isClientConnected(clientIndex) &&
           slots_[static_cast<std::size_t>(clientIndex)].channel->canSend();
}

bool Server::sendMessage(int clientIndex, message::Message message)
{
    if (!isClientConnected(clientIndex))
        return false;
    return slots_[static_cast<std::size_t>(clientIndex)].channel->send(std::move(message));
}

std::optional<message::Message> Server::receiveMessage(int clientIndex)
{
    if (!isClientConnected(clientIndex))
        return std::nullopt;
    return slots_[static_cast<std::size_t>(clientIndex)].channel->receive();
}

} // namespace pulsenet::session
