#include <pulsenet/session/Client.hpp>

#include <pulsenet/core/Logger.hpp>
#include <pulsenet/protocol/ByteCodec.hpp>

#include <cerrno>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace pulsenet::session
{

namespace
{
constexpr double kNever = -std::numeric_limits<double>::infinity();

bool wouldBlock(int err) noexcept
{
    return err == EAGAIN || err == EWOULDBLOCK;
}
} // namespace

Client::Client(const Runtime &runtime, const SessionConfig &config,
               const net::Address &bindAddress, double time)
    : runtime_(runtime), config_(config), bindAddress_(bindAddress), address_(bindAddress),
      channel_(config, counters_), time_(time)
{
    runtime_.requireInitialized("Client");
    recvBuf_.resize(config_.maxPacketSize + 1);
}

template <typename PacketT> void Client::sendPacketT(const PacketT &pkt)
{
    sendPacket(protocol::buildPacket(pkt, sequence_++));
}

Client::~Client()
{
    // loopback 은 bridge 상대가 먼저 사라졌을 수 있으므로 로컬 정리만 한다.
    if (fsm_.mode() == ConnectMode::Loopback)
    {
        bridge_ = nullptr;
        socket_.close();
        return;
    }

    try
    {
        disconnect();
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("Client", "DestructorDisconnectFailed", "err={}", e.what());
    }
}

// -----------------------------------------------------------------------------
// Connect
// -----------------------------------------------------------------------------

void Client::connectInsecure(const crypto::Key &privateKey, std::uint64_t clientId,
                             const net::Address &serverAddress)
{
    resetConnection();

    crypto::ConnectTokenParams params;
    params.protocolId = config_.protocolId;
    params.clientId = clientId;
    params.timeoutSeconds = config_.timeoutSeconds;
    params.expirySeconds = config_.connectTokenExpirySeconds;
    params.nowUnixSeconds = runtime_.unixTimeSeconds();
    runtime_.randomBytes(params.nonce);
    params.serverAddresses.push_back(serverAddress);

    crypto::ConnectTokenBytes token{};
    if (!crypto::generateConnectToken(params, privateKey, token))
    {
        clientId_ = clientId;
        if (fsm_.beginConnect(ConnectMode::Insecure))
            failConnect(FailReason::InvalidToken);
        return;
    }

    SLOG_INFO("Client", "InsecureConnect", "client_id={:016x} server={}", clientId,
              serverAddress.toString());
    connectWithToken(ConnectMode::Insecure, clientId, token);
}

void Client::connectSecure(std::uint64_t clientId, std::span<const std::uint8_t> connectToken)
{
    resetConnection();
    SLOG_INFO("Client", "SecureConnect", "client_id={:016x}", clientId);
    connectWithToken(ConnectMode::Secure, clientId, connectToken);
}

void Client::connectWithToken(ConnectMode mode, std::uint64_t clientId,
                              std::span<const std::uint8_t> connectToken)
{
    if (!fsm_.beginConnect(mode))
        return;

    clientId_ = clientId;
    connectStartTime_ = time_;

    if (!crypto::readConnectToken(connectToken, token_))
    {
        SLOG_ERROR("Client", "InvalidConnectToken", "bytes={}", connectToken.size());
        failConnect(FailReason::InvalidToken);
        return;
    }
    if (token_.protocolId != config_.protocolId)
    {
        SLOG_ERROR("Client", "ProtocolIdMismatch", "token={:x} config={:x}", token_.protocolId,
                   config_.protocolId);
        failConnect(FailReason::InvalidToken);
        return;
    }
    if (token_.expireTimestamp <= token_.createTimestamp)
    {
        failConnect(FailReason::TokenExpired);
        return;
    }

    request_.versionInfo = token_.versionInfo;
    request_.protocolId = token_.protocolId;
    request_.expireTimestamp = token_.expireTimestamp;
    request_.nonce = token_.nonce;
    request_.sealedPrivate = token_.sealedPrivate;

    timeoutSeconds_ = token_.timeoutSeconds;
    tokenLifetime_ = static_cast<double>(token_.expireTimestamp - token_.createTimestamp);

    beginServerAttempt(0);
}

void Client::connectLoopback(int clientIndex, std::uint64_t clientId, int maxClients)
{
    resetConnection();

    if (bridge_ == nullptr)
    {
        throw std::logic_error("Client: connectLoopback requires a LoopbackBridge");
    }
    if (!fsm_.beginConnect(ConnectMode::Loopback))
        return;

    clientId_ = clientId;
    clientIndex_ = clientIndex;
    maxClients_ = maxClients;
    timeoutSeconds_ = config_.timeoutSeconds;
    connectStartTime_ = time_;
    lastPacketReceiveTime_ = time_;
    lastPacketSendTime_ = kNever;
    address_ = bindAddress_;

    SLOG_INFO("Client", "LoopbackConnect", "client_id={:016x} index={} max_clients={}", clientId,
              clientIndex, maxClients);
}

bool Client::openSocket(const net::Address &serverAddress)
{
    // bind 주소 family 가 서버와 다르면 같은 포트의 any 주소로 맞춘다.
    net::Address bindAddr = bindAddress_;
    if (bindAddr.type() != serverAddress.type())
    {
        bindAddr = net::Address(serverAddress.type() == net::AddressType::IPv6 ? "::" : "0.0.0.0",
                                bindAddress_.port());
    }

    socket_ = net::Socket::createUdp(bindAddr.type());
    if (!socket_.isValid() || !socket_.bind(bindAddr) || !socket_.setNonBlocking(true))
    {
        const int err = errno;
        SLOG_ERROR("Client", "SocketOpenFailed", "bind={} errno={} err={}", bindAddr.toString(),
                   err, std::strerror(err));
        socket_.close();
        return false;
    }

    address_ = socket_.localAddress();
    SLOG_INFO("Client", "SocketOpened", "address={}", address_.toString());
    return true;
}

void Client::beginServerAttempt(std::size_t index)
{
    serverIndex_ = index;
    serverAddress_ = token_.serverAddresses[index];
    step_ = HandshakeStep::SendingRequest;
    challenge_ = {};
    lastPacketReceiveTime_ = time_;
    lastPacketSendTime_ = kNever;

    if (!socket_.isValid() || socket_.localAddress().type() != serverAddress_.type())
    {
        socket_.close();
        if (!openSocket(serverAddress_))
        {
            failConnect(FailReason::SocketError);
            return;
        }
    }

    SLOG_INFO("Client", "ConnectingToServer", "server={} attempt={}/{}",
              serverAddress_.toString(), index + 1, token_.serverAddresses.size());
}

// -----------------------------------------------------------------------------
// Disconnect
// -----------------------------------------------------------------------------

void Client::disconnect()
{
    if (fsm_.is(SessionState::Connected))
    {
        const int count = fsm_.mode() == ConnectMode::Loopback ? 1 : config_.numDisconnectPackets;
        for (int i = 0; i < count; ++i)
        {
            sendPacketT(protocol::DisconnectPkt{});
        }
        finishDisconnect(FailReason::LocalDisconnect);
    }
    else if (fsm_.is(SessionState::Connecting))
    {
        failConnect(FailReason::Cancelled);
    }
}

void Client::resetConnection()
{
    // 새 connect 전에 진행 중인 세션을 정리한다.
    disconnect();

    socket_.close();
    channel_.reset();
    clientIndex_ = -1;
    maxClients_ = 0;
    serverAddress_ = net::Address{};
    token_ = crypto::ConnectToken{};
    address_ = bindAddress_;
}

void Client::failConnect(FailReason reason)
{
    if (fsm_.onConnectFailed(reason))
    {
        SLOG_WARN("Client", "ConnectionFailed", "mode={} reason={}",
                  connectModeName(fsm_.mode()), failReasonName(reason));
    }
    socket_.close();
    channel_.reset();
}

void Client::finishDisconnect(FailReason reason)
{
    if (fsm_.onDisconnected(reason))
    {
        SLOG_INFO("Client", "Disconnected", "mode={} reason={} client_index={}",
                  connectModeName(fsm_.mode()), failReasonName(reason), clientIndex_);
    }
    socket_.close();
    channel_.reset();
    clientIndex_ = -1;
}

// -----------------------------------------------------------------------------
// Send / Receive
// -----------------------------------------------------------------------------

bool Client::sendIntervalElapsed() const noexcept
{
    return time_ - lastPacketSendTime_ >= 1.0 / config_.packetSendRate;
}

int Client::effectiveTimeoutSeconds() const noexcept
{
    return fsm_.mode() == ConnectMode::Loopback ? config_.timeoutSeconds : timeoutSeconds_;
}

void Client::sendPacket(const std::vector<std::uint8_t> &packet)
{
    lastPacketSendTime_ = time_;

    if (fsm_.mode() == ConnectMode::Loopback)
    {
        if (bridge_ == nullptr)
        {
            throw std::logic_error("Client: loopback send without LoopbackBridge");
        }
        bridge_->deliver(LoopbackRole::Client, clientIndex_, packet, sequence_ - 1);
        counters_.onPacketSent();
        return;
    }

    const ::ssize_t n = socket_.sendTo(serverAddress_, packet.data(), packet.size());
    if (n < 0)
    {
        const int err = errno;
        counters_.onSendError();
        if (!wouldBlock(err))
        {
            SLOG_WARN("Client", "SendFailed", "to={} errno={} err={}", serverAddress_.toString(),
                      err, std::strerror(err));
        }
        return;
    }
    counters_.onPacketSent();
}

void Client::sendPackets()
{
    if (fsm_.is(SessionState::Connecting))
    {
        if (fsm_.mode() == ConnectMode::Loopback || !sendIntervalElapsed())
            return;

        if (step_ == HandshakeStep::SendingRequest)
        {
            sendPacketT(request_);
        }
        else
        {
            protocol::ConnectionResponsePkt response;
            response.challengeSequence = challenge_.challengeSequence;
            response.challengeToken = challenge_.challengeToken;
            sendPacketT(response);
        }
        return;
    }

    if (!fsm_.is(SessionState::Connected))
        return;

    while (channel_.hasPending())
    {
        auto bits = channel_.takeNextPayload();
        if (bits.empty())
            continue;
        protocol::PayloadPkt payload;
        payload.bits = bits;
        sendPacketT(payload);
    }

    if (fsm_.is(SessionState::Connected) && sendIntervalElapsed())
    {
        protocol::KeepAlivePkt keepAlive;
        keepAlive.clientIndex = static_cast<std::uint32_t>(clientIndex_);
        keepAlive.maxClients = static_cast<std::uint32_t>(maxClients_);
        sendPacketT(keepAlive);
    }
}

void Client::receivePackets()
{
    if (!socket_.isValid())
        return;

    while (socket_.isValid())
    {
        net::Address from;
        const ::ssize_t n = socket_.recvFrom(recvBuf_.data(), recvBuf_.size(), from);
        if (n < 0)
        {
            const int err = errno;
            if (!wouldBlock(err) && err != EINTR)
            {
                SLOG_WARN("Client", "RecvFailed", "errno={} err={}", err, std::strerror(err));
            }
            break;
        }

        if (static_cast<std::size_t>(n) > config_.maxPacketSize)
        {
            counters_.onPacketInvalid();
            SLOG_DEBUG("Client", "OversizedPacket", "from={} bytes>{}", from.toString(),
                       config_.maxPacketSize);
            continue;
        }

        if (!(from == serverAddress_))
        {
            counters_.onPacketInvalid();
            SLOG_DEBUG("Client", "UnexpectedSender", "from={}", from.toString());
            continue;
        }

        processPacket(std::span<const std::uint8_t>(recvBuf_.data(), static_cast<std::size_t>(n)));
    }
}

void Client::processLoopbackPacket(std::span<const std::uint8_t> packet, std::uint64_t sequence)
{
    if (fsm_.mode() != ConnectMode::Loopback ||
        !(fsm_.is(SessionState::Connecting) || fsm_.is(SessionState::Connected)))
    {
        SLOG_DEBUG("Client", "LoopbackPacketIgnored", "seq={} state={}", sequence,
                   sessionStateName(fsm_.state()));
        return;
    }
    processPacket(packet);
}

void Client::processPacket(std::span<const std::uint8_t> packet)
{
    protocol::ByteReader r(packet);
    protocol::PacketHeader header;
    if (!header.read(r))
    {
        counters_.onPacketInvalid();
        return;
    }

    const bool connecting = fsm_.is(SessionState::Connecting);
    const bool connected = fsm_.is(SessionState::Connected);
    const bool loopback = fsm_.mode() == ConnectMode::Loopback;

    switch (header.type)
    {
    case protocol::PacketType::ConnectionDenied: {
        protocol::ConnectionDeniedPkt pkt;
        if (!connecting || loopback || !protocol::parseBody(r, pkt))
            break;
        counters_.onPacketReceived();
        SLOG_WARN("Client", "ConnectionDenied", "server={} reason={}", serverAddress_.toString(),
                  static_cast<int>(pkt.reason));
        failConnect(FailReason::Denied);
        return;
    }
    case protocol::PacketType::ConnectionChallenge: {
        protocol::ConnectionChallengePkt pkt;
        if (!connecting || loopback || step_ != HandshakeStep::SendingRequest ||
            !protocol::parseBody(r, pkt))
            break;
        counters_.onPacketReceived();
        challenge_ = pkt;
        step_ = HandshakeStep::SendingResponse;
        lastPacketReceiveTime_ = time_;
        lastPacketSendTime_ = kNever;
        SLOG_DEBUG("Client", "ChallengeReceived", "challenge_seq={}", pkt.challengeSequence);
        return;
    }
    case protocol::PacketType::KeepAlive: {
        protocol::KeepAlivePkt pkt;
        if (!(connecting || connected) || !protocol::parseBody(r, pkt))
            break;
        if (connecting && !loopback && step_ != HandshakeStep::SendingResponse)
            break;
        counters_.onPacketReceived();
        lastPacketReceiveTime_ = time_;
        if (connecting)
        {
            clientIndex_ = static_cast<int>(pkt.clientIndex);
            maxClients_ = static_cast<int>(pkt.maxClients);
            if (fsm_.onHandshakeComplete())
            {
                SLOG_INFO("Client", "Connected", "mode={} client_index={} max_clients={}",
                          connectModeName(fsm_.mode()), clientIndex_, maxClients_);
            }
        }
        return;
    }
    case protocol::PacketType::Payload: {
        protocol::PayloadPkt pkt;
        if (!connected || !protocol::parseBody(r, pkt))
            break;
        counters_.onPacketReceived();
        lastPacketReceiveTime_ = time_;
        channel_.processPayload(pkt.bits);
        return;
    }
    case protocol::PacketType::Disconnect: {
        protocol::DisconnectPkt pkt;
        if (!connected || !protocol::parseBody(r, pkt))
            break;
        counters_.onPacketReceived();
        finishDisconnect(FailReason::PeerDisconnect);
        return;
    }
    case protocol::PacketType::ConnectionRequest:
    case protocol::PacketType::ConnectionResponse:
        break;
    }

    counters_.onPacketInvalid();
    SLOG_TRACE("Client", "PacketIgnored", "type={} state={}",
               protocol::packetTypeName(header.type), sessionStateName(fsm_.state()));
}

// -----------------------------------------------------------------------------
// Time
// -----------------------------------------------------------------------------

void Client::advanceTime(double time)
{
    time_ = time;

    const int timeout = effectiveTimeoutSeconds();
    const bool timedOut =
        timeout > 0 && lastPacketReceiveTime_ + static_cast<double>(timeout) < time_;

    if (fsm_.is(SessionState::Connecting))
    {
        if (fsm_.mode() != ConnectMode::Loopback && time_ - connectStartTime_ >= tokenLifetime_)
        {
            failConnect(FailReason::TokenExpired);
            return;
        }
        if (timedOut)
        {
            // 다음 서버 주소로 넘어가고, 다 떨어지면 실패
            if (fsm_.mode() != ConnectMode::Loopback &&
                serverIndex_ + 1 < token_.serverAddresses.size())
            {
                SLOG_INFO("Client", "ServerTimedOut", "server={}", serverAddress_.toString());
                beginServerAttempt(serverIndex_ + 1);
                return;
            }
            failConnect(FailReason::HandshakeTimeout);
        }
        return;
    }

    if (fsm_.is(SessionState::Connected) && timedOut)
    {
        finishDisconnect(FailReason::ConnectionTimeout);
    }
}

// -----------------------------------------------------------------------------
// Status / Messages
// -----------------------------------------------------------------------------

bool Client::isConnecting() const noexcept
{
    return fsm_.is(SessionState::Connecting);
}

bool Client::isConnected() const noexcept
{
    return fsm_.is(SessionState::Connected);
}

bool Client::isDisconnected() const noexcept
{
    return !isConnecting() && !isConnected();
}

bool Client::connectionFailed() const noexcept
{
    return fsm_.is(SessionState::ConnectionFailed);
}

bool Client::canSendMessage() const noexcept
{
    return isConnected() && channel_.canSend();
}

bool Client::sendMessage(message::Message message)
{
    if (!isConnected())
        return false;
    return channel_.send(std::move(message));
}

std::optional<message::Message> Client::receiveMessage()
{
    return channel_.receive();
}

} // namespace pulsenet::session
