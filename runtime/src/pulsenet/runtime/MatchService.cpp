#include <pulsenet/runtime/MatchService.hpp>

#include <pulsenet/core/Defaults.hpp>
#include <pulsenet/core/Logger.hpp>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace pulsenet::runtime
{

MatchService::MatchService(const Runtime &runtime, MatchServiceSettings settings)
    : runtime_(runtime), settings_(std::move(settings))
{
    runtime_.requireInitialized("MatchService");
    if (!settings_.serverAddress.isValid())
    {
        throw std::invalid_argument("MatchService: invalid server address");
    }
    if (settings_.tokenExpirySeconds <= 0)
    {
        throw std::invalid_argument("MatchService: token expiry must be positive");
    }
}

std::optional<crypto::ConnectTokenBytes>
MatchService::issueToken(const MatchRequestBody &request) const
{
    if (request.protocolId != settings_.protocolId)
    {
        SLOG_WARN("MatchService", "ProtocolIdMismatch", "got={:x} want={:x}", request.protocolId,
                  settings_.protocolId);
        return std::nullopt;
    }

    crypto::ConnectTokenParams params;
    params.protocolId = settings_.protocolId;
    params.clientId = request.clientId;
    params.timeoutSeconds = settings_.timeoutSeconds;
    params.expirySeconds = settings_.tokenExpirySeconds;
    params.nowUnixSeconds = runtime_.unixTimeSeconds();
    runtime_.randomBytes(params.nonce);

    if (request.loopback)
        params.serverAddresses.emplace_back("127.0.0.1", settings_.serverAddress.port());
    else
        params.serverAddresses.push_back(settings_.serverAddress);

    crypto::ConnectTokenBytes token{};
    if (!crypto::generateConnectToken(params, settings_.privateKey, token))
    {
        SLOG_ERROR("MatchService", "TokenGenerateFailed", "client_id={:016x}", request.clientId);
        return std::nullopt;
    }

    issued_.fetch_add(1, std::memory_order_relaxed);
    SLOG_INFO("MatchService", "TokenIssued", "client_id={:016x} server={} loopback={}",
              request.clientId, params.serverAddresses.front().toString(), request.loopback);
    return token;
}

std::vector<std::uint8_t> MatchService::handleRequest(std::span<const std::uint8_t> body) const
{
    MatchReplyBody reply;
    MatchRequestBody req;
    if (!decodeMatchRequest(body, req))
    {
        SLOG_WARN("MatchService", "MalformedRequest", "bytes={}", body.size());
        return encodeMatchReply(reply);
    }

    if (auto token = issueToken(req))
    {
        reply.status = MatchReplyStatus::Ok;
        reply.token = *token;
    }
    return encodeMatchReply(reply);
}

// -----------------------------------------------------------------------------
// MatchServer
// -----------------------------------------------------------------------------

MatchServer::MatchServer(const MatchService &service, const net::Address &listenAddress)
    : service_(service), address_(listenAddress),
      ioTimeoutMs_(static_cast<int>(core::defaults::kMatcherTimeoutMs))
{
}

bool MatchServer::open()
{
    listener_ = net::Socket::createTcp(address_.type());
    if (!listener_.isValid() || !listener_.setReuseAddr(true) || !listener_.bind(address_) ||
        !listener_.listen(core::defaults::kListenBacklog))
    {
        const int err = errno;
        SLOG_ERROR("MatchServer", "ListenFailed", "address={} errno={} err={}",
                   address_.toString(), err, std::strerror(err));
        listener_.close();
        errno = err;
        return false;
    }

    address_ = listener_.localAddress();
    SLOG_INFO("MatchServer", "Listening", "address={}", address_.toString());
    return true;
}

void MatchServer::run(const core::QuitFlag &quit, int pollMs)
{
    if (!listener_.isValid())
    {
        throw std::logic_error("MatchServer: run before open");
    }
    // accept 가 pollMs 마다 깨어나 quit 을 확인한다.
    if (!listener_.setTimeouts(pollMs))
    {
        SLOG_WARN("MatchServer", "SetTimeoutsFailed", "errno={}", errno);
    }

    while (!quit.requested())
    {
        serveOnce();
    }
    SLOG_INFO("MatchServer", "Stopped", "issued={}", service_.issuedCount());
}

bool MatchServer::serveOnce()
{
    net::Address peer;
    net::Socket conn = listener_.accept(&peer);
    if (!conn.isValid())
    {
        const int err = errno;
        if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR)
        {
            SLOG_WARN("MatchServer", "AcceptFailed", "errno={} err={}", err, std::strerror(err));
        }
        return false;
    }

    handleConnection(conn, peer);
    return true;
}

void MatchServer::handleConnection(net::Socket &conn, const net::Address &peer)
{
    if (!conn.setTimeouts(ioTimeoutMs_))
    {
        SLOG_WARN("MatchServer", "SetTimeoutsFailed", "peer={} errno={}", peer.toString(), errno);
    }

    std::uint16_t opcode = 0;
    std::vector<std::uint8_t> body;
    if (!readFrame(conn, opcode, body))
    {
        SLOG_WARN("MatchServer", "RequestReadFailed", "peer={} errno={}", peer.toString(), errno);
        return;
    }
    if (opcode != static_cast<std::uint16_t>(MatchOpcode::MatchRequest))
    {
        SLOG_WARN("MatchServer", "UnexpectedOpcode", "peer={} opcode={}", peer.toString(), opcode);
        return;
    }

    const auto reply = service_.handleRequest(body);
    if (!writeFrame(conn, MatchOpcode::MatchReply, reply))
    {
        SLOG_WARN("MatchServer", "ReplySendFailed", "peer={} errno={}", peer.toString(), errno);
    }
}

} // namespace pulsenet::runtime
