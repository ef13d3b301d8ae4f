#include <pulsenet/core/ConfigLoader.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using pulsenet::core::ConfigLoader;
using pulsenet::core::GlobalConfig;
using pulsenet::core::LogLevel;

namespace {

template <typename Ex> bool throwsOn(std::string_view toml) {
    try {
        (void)ConfigLoader::parse(toml);
    } catch (const Ex &) {
        return true;
    } catch (const std::exception &e) {
        std::cerr << "  unexpected exception type: " << e.what() << "\n";
        return false;
    }
    return false;
}

/// 빈 문서는 기본값 그대로
bool test_defaults() {
    const GlobalConfig cfg = ConfigLoader::parse("");
    namespace d = pulsenet::core::defaults;

    if (cfg.session.protocolId != d::kProtocolId || cfg.session.timeoutSeconds != 10 ||
        cfg.session.maxPacketSize != d::kMaxPacketSize || cfg.server.port != 40001 ||
        cfg.server.maxClients != d::kMaxClients || cfg.server.privateKey != d::kSecurePrivateKey ||
        cfg.client.port != 0 || cfg.matcher.port != 8080 || cfg.matcher.timeoutMs != 3000 ||
        !cfg.matcher.retryOnce || cfg.driver.startTime != 100.0 ||
        cfg.driver.deltaTime != 0.1 || cfg.driver.clientDeltaTime != 0.01 ||
        cfg.log.level != LogLevel::Info) {
        std::cerr << "[defaults] default values mismatch\n";
        return false;
    }
    return true;
}

bool test_overrides() {
    const GlobalConfig cfg = ConfigLoader::parse(R"(
[log]
level = "debug"

[session]
protocol_id = 42
timeout_seconds = 3
packet_send_rate = 20
max_block_size = 256

[server]
address = "::1"
port = 50000
max_clients = 4
private_key = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"

[client]
bind_address = "::"
port = 45000

[matcher]
host = "10.0.0.9"
port = 9090
timeout_ms = 500
retry_once = false

[driver]
start_time = 0
delta_time = 0.05
)");

    if (cfg.log.level != LogLevel::Debug || cfg.session.protocolId != 42 ||
        cfg.session.timeoutSeconds != 3 || cfg.session.packetSendRate != 20.0 ||
        cfg.session.maxBlockSize != 256) {
        std::cerr << "[overrides] session/log mismatch\n";
        return false;
    }
    if (cfg.server.address != "::1" || cfg.server.port != 50000 || cfg.server.maxClients != 4 ||
        cfg.server.privateKey[0] != 0x00 || cfg.server.privateKey[15] != 0x0f ||
        cfg.server.privateKey[31] != 0x1f) {
        std::cerr << "[overrides] server mismatch\n";
        return false;
    }
    if (cfg.client.bindAddress != "::" || cfg.client.port != 45000 ||
        cfg.matcher.host != "10.0.0.9" || cfg.matcher.port != 9090 ||
        cfg.matcher.timeoutMs != 500 || cfg.matcher.retryOnce) {
        std::cerr << "[overrides] client/matcher mismatch\n";
        return false;
    }
    if (cfg.driver.startTime != 0.0 || cfg.driver.deltaTime != 0.05) {
        std::cerr << "[overrides] driver mismatch\n";
        return false;
    }
    return true;
}

bool test_invalid_values() {
    struct Case {
        const char *name;
        const char *toml;
    };
    const Case cases[] = {
        {"log_level", "[log]\nlevel = \"loud\"\n"},
        {"timeout_zero", "[session]\ntimeout_seconds = 0\n"},
        {"negative_protocol", "[session]\nprotocol_id = -1\n"},
        {"send_rate_zero", "[session]\npacket_send_rate = 0\n"},
        {"port_range", "[server]\nport = 70000\n"},
        {"port_zero", "[server]\nport = 0\n"},
        {"max_clients_zero", "[server]\nmax_clients = 0\n"},
        {"max_clients_over", "[server]\nmax_clients = 65\n"},
        {"key_short", "[server]\nprivate_key = \"abcd\"\n"},
        {"key_nonhex",
         "[server]\nprivate_key = "
         "\"zz0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f\"\n"},
        {"matcher_timeout", "[matcher]\ntimeout_ms = -5\n"},
        {"empty_host", "[matcher]\nhost = \"\"\n"},
        {"negative_start", "[driver]\nstart_time = -1.0\n"},
        {"delta_zero", "[driver]\ndelta_time = 0\n"},
    };

    for (const auto &c : cases) {
        if (!throwsOn<std::invalid_argument>(c.toml)) {
            std::cerr << "[invalid] case '" << c.name << "' did not throw invalid_argument\n";
            return false;
        }
    }
    return true;
}

bool test_syntax_error() {
    if (!throwsOn<std::runtime_error>("[session\ntimeout_seconds = ")) {
        std::cerr << "[syntax] broken TOML did not throw runtime_error\n";
        return false;
    }
    return true;
}

bool test_load_file() {
    const auto path = std::filesystem::temp_directory_path() / "pulsenet_config_test.toml";
    {
        std::ofstream out(path);
        out << "[server]\nmax_clients = 2\n";
    }

    bool ok = true;
    const GlobalConfig cfg = ConfigLoader::loadFile(path.string());
    if (cfg.server.maxClients != 2) {
        std::cerr << "[file] max_clients not applied\n";
        ok = false;
    }

    // 환경 변수 경유
    ::setenv(pulsenet::core::kConfigEnvVar, path.string().c_str(), 1);
    if (ConfigLoader::load().server.maxClients != 2) {
        std::cerr << "[file] env var path not honored\n";
        ok = false;
    }
    ::unsetenv(pulsenet::core::kConfigEnvVar);
    if (ConfigLoader::load().server.maxClients != pulsenet::core::defaults::kMaxClients) {
        std::cerr << "[file] defaults not used without env var\n";
        ok = false;
    }

    std::filesystem::remove(path);

    try {
        (void)ConfigLoader::loadFile(path.string());
        std::cerr << "[file] missing file did not throw\n";
        ok = false;
    } catch (const std::runtime_error &) {
    }
    return ok;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_defaults();
    ok = ok && test_overrides();
    ok = ok && test_invalid_values();
    ok = ok && test_syntax_error();
    ok = ok && test_load_file();

    if (!ok) {
        std::cerr << "ConfigLoader tests FAILED\n";
        return 1;
    }

    std::cout << "ConfigLoader tests PASSED\n";
    return 0;
}
