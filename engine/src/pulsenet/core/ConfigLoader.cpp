#include <pulsenet/core/ConfigLoader.hpp>

#include <pulsenet/core/Logger.hpp>

#include <toml++/toml.hpp>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
using namespace pulsenet;
using namespace pulsenet::core;

// -----------------------------------------------------------------------------
// Helper Functions (Validation & Parsing)
// -----------------------------------------------------------------------------

LogLevel parseLogLevel(std::string_view s)
{
    std::string v(s);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (v == "trace")
        return LogLevel::Trace;
    if (v == "debug")
        return LogLevel::Debug;
    if (v == "info")
        return LogLevel::Info;
    if (v == "warn" || v == "warning")
        return LogLevel::Warn;
    if (v == "error")
        return LogLevel::Error;
    if (v == "fatal")
        return LogLevel::Fatal;

    throw std::invalid_argument("Invalid log.level: " + std::string(s));
}

std::uint16_t checkedPortFromI64(std::int64_t v, const char *key)
{
    if (v < 0 || v > 65535)
        throw std::invalid_argument(std::string(key) + " out of range (0..65535): " +
                                    std::to_string(v));
    return static_cast<std::uint16_t>(v);
}

int checkedPositiveIntFromI64(std::int64_t v, const char *key)
{
    if (v < 1 || v > static_cast<std::int64_t>(std::numeric_limits<int>::max()))
        throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(v));
    return static_cast<int>(v);
}

std::size_t checkedSizeFromI64(std::int64_t v, const char *key)
{
    if (v < 0)
        throw std::invalid_argument(std::string(key) + " must be non-negative: " +
                                    std::to_string(v));
    return static_cast<std::size_t>(v);
}

double checkedPositiveDouble(double v, const char *key)
{
    if (!(v > 0.0))
        throw std::invalid_argument(std::string(key) + " must be > 0");
    return v;
}

// 정수/실수 둘 다 허용 (start_time = 100 도 받아준다)
std::optional<double> numberValue(const toml::table &t, std::string_view key)
{
    if (auto d = t[key].value<double>())
        return d;
    if (auto i = t[key].value<std::int64_t>())
        return static_cast<double>(*i);
    return std::nullopt;
}

int hexNibble(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

void parsePrivateKeyHex(std::string_view hex, std::array<std::uint8_t, 32> &out)
{
    if (hex.size() != out.size() * 2)
        throw std::invalid_argument("server.private_key must be 64 hex characters");

    for (std::size_t i = 0; i < out.size(); ++i)
    {
        const int hi = hexNibble(hex[i * 2]);
        const int lo = hexNibble(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0)
            throw std::invalid_argument("server.private_key contains non-hex character");
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
}

// -----------------------------------------------------------------------------
// Section Parsing
// -----------------------------------------------------------------------------

void applyLogToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *t = root["log"].as_table();
    if (!t)
        return;

    if (auto s = (*t)["level"].value<std::string>())
        cfg.log.level = parseLogLevel(*s);
    if (auto s = (*t)["file_path"].value<std::string>())
        cfg.log.filePath = *s;
}

void applySessionToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *t = root["session"].as_table();
    if (!t)
        return;

    SessionConfig &s = cfg.session;

    if (auto v = (*t)["protocol_id"].value<std::int64_t>())
    {
        if (*v < 0)
            throw std::invalid_argument("session.protocol_id must be non-negative");
        s.protocolId = static_cast<std::uint64_t>(*v);
    }
    if (auto v = (*t)["timeout_seconds"].value<std::int64_t>())
        s.timeoutSeconds = checkedPositiveIntFromI64(*v, "session.timeout_seconds");
    if (auto v = (*t)["connect_token_expiry_seconds"].value<std::int64_t>())
        s.connectTokenExpirySeconds =
            checkedPositiveIntFromI64(*v, "session.connect_token_expiry_seconds");
    if (auto v = (*t)["max_packet_size"].value<std::int64_t>())
        s.maxPacketSize = checkedSizeFromI64(*v, "session.max_packet_size");
    if (auto v = numberValue(*t, "packet_send_rate"))
        s.packetSendRate = checkedPositiveDouble(*v, "session.packet_send_rate");
    if (auto v = (*t)["max_messages_per_packet"].value<std::int64_t>())
        s.maxMessagesPerPacket = checkedPositiveIntFromI64(*v, "session.max_messages_per_packet");
    if (auto v = (*t)["message_send_queue_size"].value<std::int64_t>())
        s.messageSendQueueSize = checkedPositiveIntFromI64(*v, "session.message_send_queue_size");
    if (auto v = (*t)["message_receive_queue_size"].value<std::int64_t>())
        s.messageReceiveQueueSize =
            checkedPositiveIntFromI64(*v, "session.message_receive_queue_size");
    if (auto v = (*t)["max_block_size"].value<std::int64_t>())
        s.maxBlockSize = checkedSizeFromI64(*v, "session.max_block_size");
    if (auto v = (*t)["num_disconnect_packets"].value<std::int64_t>())
        s.numDisconnectPackets = checkedPositiveIntFromI64(*v, "session.num_disconnect_packets");
}

void applyServerToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *t = root["server"].as_table();
    if (!t)
        return;

    if (auto s = (*t)["address"].value<std::string>())
        cfg.server.address = *s;
    if (auto v = (*t)["port"].value<std::int64_t>())
        cfg.server.port = checkedPortFromI64(*v, "server.port");
    if (auto v = (*t)["max_clients"].value<std::int64_t>())
    {
        cfg.server.maxClients = checkedPositiveIntFromI64(*v, "server.max_clients");
        if (cfg.server.maxClients > defaults::kMaxClients)
            throw std::invalid_argument("server.max_clients exceeds " +
                                        std::to_string(defaults::kMaxClients));
    }
    if (auto s = (*t)["private_key"].value<std::string>())
        parsePrivateKeyHex(*s, cfg.server.privateKey);
}

void applyClientToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *t = root["client"].as_table();
    if (!t)
        return;

    if (auto s = (*t)["bind_address"].value<std::string>())
        cfg.client.bindAddress = *s;
    if (auto v = (*t)["port"].value<std::int64_t>())
        cfg.client.port = checkedPortFromI64(*v, "client.port");
}

void applyMatcherToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *t = root["matcher"].as_table();
    if (!t)
        return;

    if (auto s = (*t)["host"].value<std::string>())
        cfg.matcher.host = *s;
    if (auto v = (*t)["port"].value<std::int64_t>())
        cfg.matcher.port = checkedPortFromI64(*v, "matcher.port");
    if (auto v = (*t)["timeout_ms"].value<std::int64_t>())
        cfg.matcher.timeoutMs = checkedPositiveIntFromI64(*v, "matcher.timeout_ms");
    if (auto b = (*t)["retry_once"].value<bool>())
        cfg.matcher.retryOnce = *b;
    if (auto v = (*t)["token_expiry_seconds"].value<std::int64_t>())
        cfg.matcher.tokenExpirySeconds =
            checkedPositiveIntFromI64(*v, "matcher.token_expiry_seconds");
}

void applyDriverToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *t = root["driver"].as_table();
    if (!t)
        return;

    if (auto v = numberValue(*t, "start_time"))
    {
        if (*v < 0.0)
            throw std::invalid_argument("driver.start_time must be >= 0");
        cfg.driver.startTime = *v;
    }
    if (auto v = numberValue(*t, "delta_time"))
        cfg.driver.deltaTime = checkedPositiveDouble(*v, "driver.delta_time");
    if (auto v = numberValue(*t, "client_delta_time"))
        cfg.driver.clientDeltaTime = checkedPositiveDouble(*v, "driver.client_delta_time");
}

void validateFailFast(const GlobalConfig &cfg)
{
    if (cfg.server.port == 0)
        throw std::invalid_argument("server.port must not be 0");
    if (cfg.matcher.port == 0)
        throw std::invalid_argument("matcher.port must not be 0");
    if (cfg.server.address.empty())
        throw std::invalid_argument("server.address must not be empty");
    if (cfg.matcher.host.empty())
        throw std::invalid_argument("matcher.host must not be empty");

    validateSessionConfig(cfg.session);
}

GlobalConfig fromTable(const toml::table &root)
{
    GlobalConfig cfg{};
    applyLogToml(cfg, root);
    applySessionToml(cfg, root);
    applyServerToml(cfg, root);
    applyClientToml(cfg, root);
    applyMatcherToml(cfg, root);
    applyDriverToml(cfg, root);

    validateFailFast(cfg);
    return cfg;
}

} // namespace

namespace pulsenet::core
{

GlobalConfig ConfigLoader::load()
{
    const char *path = std::getenv(kConfigEnvVar);
    if (path == nullptr || *path == '\0')
    {
        GlobalConfig cfg{};
        validateFailFast(cfg);
        return cfg;
    }
    return loadFile(path);
}

GlobalConfig ConfigLoader::loadFile(const std::string &path)
{
    if (!std::filesystem::exists(path))
    {
        throw std::runtime_error("Config file not found: " + path);
    }

    toml::table root;
    try
    {
        root = toml::parse_file(path);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.description()));
    }

    GlobalConfig cfg = fromTable(root);
    SLOG_INFO("ConfigLoader", "Loaded", "path={}", path);
    return cfg;
}

GlobalConfig ConfigLoader::parse(std::string_view tomlText)
{
    toml::table root;
    try
    {
        root = toml::parse(tomlText);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.description()));
    }
    return fromTable(root);
}

} // namespace pulsenet::core
