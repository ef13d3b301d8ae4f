#include <pulsenet/runtime/Matcher.hpp>

#include <pulsenet/core/Logger.hpp>
#include <pulsenet/runtime/MatchProtocol.hpp>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace pulsenet::runtime
{

std::string_view matchStatusName(MatchStatus status) noexcept
{
    switch (status)
    {
    case MatchStatus::Pending:
        return "Pending";
    case MatchStatus::Found:
        return "Found";
    case MatchStatus::Failed:
        return "Failed";
    }
    return "Unknown";
}

Matcher::Matcher(const Runtime &runtime, const core::MatcherSettings &settings)
    : runtime_(runtime), settings_(settings)
{
    runtime_.requireInitialized("Matcher");
}

bool Matcher::initialize()
{
    endpoint_ = net::Address(settings_.host, settings_.port);
    initialized_ = endpoint_.isValid() && endpoint_.port() != 0 && settings_.timeoutMs > 0;
    if (!initialized_)
    {
        SLOG_ERROR("Matcher", "InitFailed", "host={} port={} timeout_ms={}", settings_.host,
                   settings_.port, settings_.timeoutMs);
        return false;
    }
    SLOG_INFO("Matcher", "Initialized", "endpoint={} timeout_ms={} retry_once={}",
              endpoint_.toString(), settings_.timeoutMs, settings_.retryOnce);
    return true;
}

MatchStatus Matcher::requestMatch(std::uint64_t protocolId, std::uint64_t clientId,
                                  bool loopback)
{
    status_ = MatchStatus::Pending;
    token_.fill(0);

    if (!initialized_)
    {
        SLOG_ERROR("Matcher", "NotInitialized");
        status_ = MatchStatus::Failed;
        return status_;
    }

    const int attempts = settings_.retryOnce ? 2 : 1;
    for (int attempt = 1; attempt <= attempts; ++attempt)
    {
        if (tryOnce(protocolId, clientId, loopback, attempt))
        {
            status_ = MatchStatus::Found;
            SLOG_INFO("Matcher", "MatchFound", "client_id={:016x} loopback={}", clientId,
                      loopback);
            return status_;
        }
    }

    status_ = MatchStatus::Failed;
    SLOG_WARN("Matcher", "MatchFailed", "endpoint={} client_id={:016x}", endpoint_.toString(),
              clientId);
    return status_;
}

bool Matcher::tryOnce(std::uint64_t protocolId, std::uint64_t clientId, bool loopback,
                      int attempt)
{
    net::Socket sock = net::Socket::createTcp(endpoint_.type());
    if (!sock.isValid())
    {
        SLOG_ERROR("Matcher", "SocketCreateFailed", "errno={}", errno);
        return false;
    }
    if (!sock.setTimeouts(settings_.timeoutMs) || !sock.setNoDelay(true))
    {
        SLOG_WARN("Matcher", "SocketOptionFailed", "errno={}", errno);
    }

    if (!sock.connect(endpoint_))
    {
        const int err = errno;
        SLOG_WARN("Matcher", "ConnectFailed", "endpoint={} attempt={} errno={} err={}",
                  endpoint_.toString(), attempt, err, std::strerror(err));
        return false;
    }

    MatchRequestBody req;
    req.protocolId = protocolId;
    req.clientId = clientId;
    req.loopback = loopback;
    if (!writeFrame(sock, MatchOpcode::MatchRequest, encodeMatchRequest(req)))
    {
        SLOG_WARN("Matcher", "RequestSendFailed", "attempt={} errno={}", attempt, errno);
        return false;
    }

    std::uint16_t opcode = 0;
    std::vector<std::uint8_t> body;
    if (!readFrame(sock, opcode, body))
    {
        SLOG_WARN("Matcher", "ReplyReadFailed", "attempt={} errno={}", attempt, errno);
        return false;
    }

    MatchReplyBody reply;
    if (opcode != static_cast<std::uint16_t>(MatchOpcode::MatchReply) ||
        !decodeMatchReply(body, reply))
    {
        SLOG_WARN("Matcher", "MalformedReply", "opcode={} bytes={}", opcode, body.size());
        return false;
    }
    if (reply.status != MatchReplyStatus::Ok)
    {
        SLOG_WARN("Matcher", "MatchRejected", "client_id={:016x}", clientId);
        return false;
    }

    token_ = reply.token;
    return true;
}

void Matcher::getConnectToken(crypto::ConnectTokenBytes &out) const
{
    if (status_ != MatchStatus::Found)
    {
        throw std::logic_error("Matcher: getConnectToken without a found match");
    }
    out = token_;
}

} // namespace pulsenet::runtime
