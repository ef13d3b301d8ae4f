#include <pulsenet/runtime/Drivers.hpp>

#include <pulsenet/core/Defaults.hpp>
#include <pulsenet/core/Logger.hpp>
#include <pulsenet/runtime/MatchService.hpp>
#include <pulsenet/runtime/SessionLoop.hpp>
#include <pulsenet/session/Client.hpp>
#include <pulsenet/session/LoopbackBridge.hpp>
#include <pulsenet/session/Server.hpp>

#include <random>
#include <stdexcept>
#include <variant>

namespace pulsenet::runtime
{

namespace
{
// insecure 모드는 클라이언트가 키를 알고 있다 (0 키)
constexpr crypto::Key kInsecurePrivateKey{};

constexpr int kMatcherPollMs = 100;

int exitCodeFor(const LoopResult &result) noexcept
{
    return result.exit == LoopExit::ConnectionFailed ? 1 : 0;
}

int runServerWithKey(const DriverEnv &env, const crypto::Key &key, const char *mode)
{
    const auto &cfg = env.config;
    const net::Address address = configuredServerAddress(cfg);

    session::Server server(env.runtime, cfg.session, key, address, cfg.driver.startTime);
    if (!server.start(cfg.server.maxClients))
    {
        SLOG_FATAL("Driver", "ServerStartFailed", "mode={} address={}", mode, address.toString());
        return 1;
    }
    SLOG_INFO("Driver", "ServerRunning", "mode={} address={}", mode, server.address().toString());

    runServerLoop(server, LoopContext{env.quit, cfg.driver.deltaTime}, server.time());

    server.stop();
    return 0;
}

// -----------------------------------------------------------------------------
// soak: 메시지 생성/검증
// -----------------------------------------------------------------------------

class SoakPeer
{
  public:
    SoakPeer(const char *name, std::size_t maxBlockSize, std::uint64_t seed)
        : name_(name), maxBlockSize_(maxBlockSize), rng_(seed)
    {
    }

    template <typename SendFn, typename CanSendFn> void sendBurst(SendFn send, CanSendFn canSend)
    {
        const int count = std::uniform_int_distribution<int>(0, 64)(rng_);
        for (int i = 0; i < count && canSend(); ++i)
        {
            const auto seq = static_cast<std::uint16_t>(sent_);
            if (std::uniform_int_distribution<int>(0, 24)(rng_) == 0)
            {
                message::TestBlockMessage m;
                m.sequence = seq;
                m.block.resize(blockSizeFor(seq));
                for (std::size_t j = 0; j < m.block.size(); ++j)
                    m.block[j] = static_cast<std::uint8_t>(seq + j);
                if (!send(message::Message{std::move(m)}))
                    break;
            }
            else
            {
                if (!send(message::Message{message::TestMessage{seq}}))
                    break;
            }
            ++sent_;
        }
    }

    /// 내용이 시퀀스와 맞지 않으면 false
    bool verify(const message::Message &m)
    {
        std::uint16_t seq = 0;
        if (const auto *t = std::get_if<message::TestMessage>(&m))
        {
            seq = t->sequence;
        }
        else if (const auto *b = std::get_if<message::TestBlockMessage>(&m))
        {
            seq = b->sequence;
            if (b->block.size() != blockSizeFor(seq))
            {
                SLOG_ERROR("Soak", "BlockSizeMismatch", "peer={} seq={} size={} want={}", name_,
                           seq, b->block.size(), blockSizeFor(seq));
                return false;
            }
            for (std::size_t j = 0; j < b->block.size(); ++j)
            {
                if (b->block[j] != static_cast<std::uint8_t>(seq + j))
                {
                    SLOG_ERROR("Soak", "BlockContentMismatch", "peer={} seq={} offset={}", name_,
                               seq, j);
                    return false;
                }
            }
        }
        else
        {
            SLOG_ERROR("Soak", "UnexpectedMessageType", "peer={} type={}", name_,
                       message::messageTypeName(message::messageType(m)));
            return false;
        }

        // unreliable 채널이므로 빈 시퀀스는 유실로만 센다.
        if (seq != expected_)
        {
            gaps_ += static_cast<std::uint16_t>(seq - expected_);
        }
        expected_ = static_cast<std::uint16_t>(seq + 1);
        ++received_;
        return true;
    }

    [[nodiscard]] std::uint64_t sent() const noexcept { return sent_; }
    [[nodiscard]] std::uint64_t received() const noexcept { return received_; }
    [[nodiscard]] std::uint64_t gaps() const noexcept { return gaps_; }

  private:
    [[nodiscard]] std::size_t blockSizeFor(std::uint16_t seq) const noexcept
    {
        return 1 + (static_cast<std::size_t>(seq) * 33) % maxBlockSize_;
    }

    const char *name_;
    std::size_t maxBlockSize_;
    std::mt19937_64 rng_;
    std::uint64_t sent_{0};
    std::uint64_t received_{0};
    std::uint64_t gaps_{0};
    std::uint16_t expected_{0};
};
} // namespace

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

net::Address serverAddressOverride(std::span<const std::string> args, std::size_t position,
                                   const net::Address &fallback)
{
    if (args.size() <= position)
        return fallback;

    net::Address candidate(args[position]);
    if (!candidate.isValid())
    {
        SLOG_WARN("Driver", "InvalidAddressArgument", "arg={} using={}", args[position],
                  fallback.toString());
        return fallback;
    }
    if (candidate.port() == 0)
        candidate.setPort(core::defaults::kServerPort);
    return candidate;
}

net::Address configuredServerAddress(const core::GlobalConfig &config)
{
    net::Address address(config.server.address, config.server.port);
    if (!address.isValid())
    {
        throw std::invalid_argument("invalid server.address: " + config.server.address);
    }
    return address;
}

net::Address clientBindAddress(const core::GlobalConfig &config)
{
    net::Address bind(config.client.bindAddress, config.client.port);
    if (!bind.isValid())
    {
        throw std::invalid_argument("invalid client.bind_address: " + config.client.bindAddress);
    }
    return bind;
}

std::uint64_t generateClientId(const Runtime &runtime)
{
    return runtime.randomU64();
}

// -----------------------------------------------------------------------------
// Client drivers
// -----------------------------------------------------------------------------

int runInsecureClient(const DriverEnv &env, std::span<const std::string> args)
{
    const auto &cfg = env.config;
    const std::uint64_t clientId = generateClientId(env.runtime);
    SLOG_INFO("Driver", "ClientId", "client_id={:016x}", clientId);

    session::Client client(env.runtime, cfg.session, clientBindAddress(cfg),
                           cfg.driver.startTime);

    const net::Address serverAddress =
        serverAddressOverride(args, 0, configuredServerAddress(cfg));
    client.connectInsecure(kInsecurePrivateKey, clientId, serverAddress);

    const auto result =
        runClientLoop(client, LoopContext{env.quit, cfg.driver.clientDeltaTime}, client.time());

    client.disconnect();
    return exitCodeFor(result);
}

int runSecureClient(const DriverEnv &env, IMatcher &matcher, session::IClientSession &client,
                    std::span<const std::string> args)
{
    const auto &cfg = env.config;
    const std::uint64_t clientId = generateClientId(env.runtime);
    SLOG_INFO("Driver", "ClientId", "client_id={:016x}", clientId);

    if (matcher.requestMatch(cfg.session.protocolId, clientId, false) == MatchStatus::Failed)
    {
        SLOG_ERROR("Driver", "RequestMatchFailed", "hint=is_the_matcher_running");
        return 1;
    }
    if (matcher.matchStatus() != MatchStatus::Found)
    {
        SLOG_ERROR("Driver", "RequestMatchIncomplete", "status={}",
                   matchStatusName(matcher.matchStatus()));
        return 1;
    }

    crypto::ConnectTokenBytes token{};
    matcher.getConnectToken(token);

    // 두 번째 인자 위치는 다른 드라이버와 어긋나지만 그대로 둔다. 주소는 토큰이 정한다.
    if (args.size() > 1)
    {
        const net::Address ignored =
            serverAddressOverride(args, 1, configuredServerAddress(cfg));
        SLOG_WARN("Driver", "SecureAddressOverrideIgnored", "arg={} parsed={}", args[1],
                  ignored.toString());
    }

    client.connectSecure(clientId, token);
    if (client.isDisconnected())
    {
        SLOG_ERROR("Driver", "SecureConnectRejected", "client_id={:016x}", clientId);
        return 1;
    }

    const auto result =
        runClientLoop(client, LoopContext{env.quit, cfg.driver.deltaTime}, client.time());

    client.disconnect();
    return exitCodeFor(result);
}

// -----------------------------------------------------------------------------
// Server drivers
// -----------------------------------------------------------------------------

int runServer(const DriverEnv &env)
{
    return runServerWithKey(env, kInsecurePrivateKey, "insecure");
}

int runSecureServer(const DriverEnv &env)
{
    return runServerWithKey(env, env.config.server.privateKey, "secure");
}

// -----------------------------------------------------------------------------
// Client + Server in one process
// -----------------------------------------------------------------------------

int runClientServer(const DriverEnv &env, std::span<const std::string> args)
{
    const auto &cfg = env.config;
    const net::Address serverAddress =
        serverAddressOverride(args, 0, configuredServerAddress(cfg));

    session::Server server(env.runtime, cfg.session, kInsecurePrivateKey, serverAddress,
                           cfg.driver.startTime);
    if (!server.start(cfg.server.maxClients))
    {
        SLOG_FATAL("Driver", "ServerStartFailed", "address={}", serverAddress.toString());
        return 1;
    }

    const std::uint64_t clientId = generateClientId(env.runtime);
    SLOG_INFO("Driver", "ClientId", "client_id={:016x}", clientId);

    session::Client client(env.runtime, cfg.session, clientBindAddress(cfg),
                           cfg.driver.startTime);
    client.connectInsecure(kInsecurePrivateKey, clientId, server.address());

    const auto result =
        runPairLoop(server, client, LoopContext{env.quit, cfg.driver.deltaTime}, server.time());

    client.disconnect();
    server.stop();
    return exitCodeFor(result);
}

int runLoopback(const DriverEnv &env, std::span<const std::string> args)
{
    const auto &cfg = env.config;
    const net::Address serverAddress =
        serverAddressOverride(args, 0, configuredServerAddress(cfg));
    const int maxClients = cfg.server.maxClients;

    session::Server server(env.runtime, cfg.session, kInsecurePrivateKey, serverAddress,
                           cfg.driver.startTime);
    if (!server.start(maxClients, /*openSocket=*/false))
    {
        SLOG_FATAL("Driver", "ServerStartFailed", "mode=loopback");
        return 1;
    }

    session::Client client(env.runtime, cfg.session, clientBindAddress(cfg),
                           cfg.driver.startTime);

    session::LoopbackBridge bridge;
    client.setLoopbackBridge(&bridge);
    server.setLoopbackBridge(&bridge);

    const std::uint64_t clientId = generateClientId(env.runtime);
    SLOG_INFO("Driver", "ClientId", "client_id={:016x}", clientId);

    client.connectLoopback(0, clientId, maxClients);
    server.connectLoopbackClient(0, clientId);
    bridge.attachServer(server);
    bridge.attachClient(client);

    const auto result =
        runPairLoop(server, client, LoopContext{env.quit, cfg.driver.deltaTime}, server.time());

    client.disconnect();
    server.stop();
    bridge.detachClient();
    bridge.detachServer();
    return exitCodeFor(result);
}

// -----------------------------------------------------------------------------
// Soak
// -----------------------------------------------------------------------------

int runSoak(const DriverEnv &env, const SoakOptions &options)
{
    const auto &cfg = env.config;
    const net::Address serverAddress = configuredServerAddress(cfg);
    const double dt = cfg.driver.deltaTime;
    double time = 0.0;

    session::Server server(env.runtime, cfg.session, kInsecurePrivateKey, serverAddress, time);
    if (!server.start(cfg.server.maxClients))
    {
        SLOG_FATAL("Driver", "ServerStartFailed", "mode=soak address={}",
                   serverAddress.toString());
        return 1;
    }

    session::Client client(env.runtime, cfg.session, clientBindAddress(cfg), time);
    const std::uint64_t clientId = generateClientId(env.runtime);
    client.connectInsecure(kInsecurePrivateKey, clientId, server.address());

    SoakPeer clientSide("client", cfg.session.maxBlockSize, env.runtime.randomU64());
    SoakPeer serverSide("server", cfg.session.maxBlockSize, env.runtime.randomU64());

    bool clientConnected = false;
    bool serverHadClient = false;
    int rc = 0;
    std::uint64_t iterations = 0;

    while (!env.quit.requested())
    {
        if (options.maxIterations != 0 && iterations >= options.maxIterations)
            break;
        ++iterations;

        client.sendPackets();
        server.sendPackets();
        client.receivePackets();
        server.receivePackets();

        if (client.connectionFailed())
        {
            SLOG_ERROR("Soak", "ClientConnectFailed", "reason={}",
                       session::failReasonName(client.failReason()));
            rc = 1;
            break;
        }

        time += dt;

        if (client.isConnected())
        {
            clientConnected = true;
            clientSide.sendBurst(
                [&](message::Message m) { return client.sendMessage(std::move(m)); },
                [&] { return client.canSendMessage(); });

            while (auto m = client.receiveMessage())
            {
                if (!serverSide.verify(*m))
                {
                    rc = 1;
                    break;
                }
            }
        }

        const int index = client.clientIndex();
        if (server.isClientConnected(index))
        {
            serverHadClient = true;
            serverSide.sendBurst(
                [&](message::Message m) { return server.sendMessage(index, std::move(m)); },
                [&] { return server.canSendMessage(index); });

            while (auto m = server.receiveMessage(index))
            {
                if (!clientSide.verify(*m))
                {
                    rc = 1;
                    break;
                }
            }
        }

        if (rc != 0)
            break;

        client.advanceTime(time);
        server.advanceTime(time);

        if (clientConnected && client.isDisconnected())
            break;
        if (serverHadClient && server.numConnectedClients() == 0)
            break;
    }

    SLOG_INFO("Soak", "Summary",
              "iterations={} c2s_sent={} c2s_recv={} c2s_gaps={} s2c_sent={} s2c_recv={} "
              "s2c_gaps={}",
              iterations, clientSide.sent(), clientSide.received(), clientSide.gaps(),
              serverSide.sent(), serverSide.received(), serverSide.gaps());

    client.disconnect();
    server.stop();
    return rc;
}

// -----------------------------------------------------------------------------
// Matcher
// -----------------------------------------------------------------------------

int runMatcher(const DriverEnv &env)
{
    const auto &cfg = env.config;

    MatchServiceSettings settings;
    settings.protocolId = cfg.session.protocolId;
    settings.privateKey = cfg.server.privateKey;
    settings.serverAddress = configuredServerAddress(cfg);
    settings.timeoutSeconds = cfg.session.timeoutSeconds;
    settings.tokenExpirySeconds = cfg.matcher.tokenExpirySeconds;

    MatchService service(env.runtime, settings);
    MatchServer matchServer(service, net::Address(cfg.matcher.host, cfg.matcher.port));
    if (!matchServer.open())
    {
        SLOG_FATAL("Driver", "MatcherListenFailed", "host={} port={}", cfg.matcher.host,
                   cfg.matcher.port);
        return 1;
    }

    matchServer.run(env.quit, kMatcherPollMs);
    return 0;
}

} // namespace pulsenet::runtime
