#include <pulsenet/Runtime.hpp>
#include <pulsenet/core/GlobalConfig.hpp>
#include <pulsenet/core/QuitFlag.hpp>
#include <pulsenet/runtime/Drivers.hpp>
#include <pulsenet/runtime/SessionLoop.hpp>
#include <pulsenet/session/Client.hpp>
#include <pulsenet/session/LoopbackBridge.hpp>
#include <pulsenet/session/Server.hpp>

#include <iostream>

using pulsenet::Runtime;
using pulsenet::core::QuitFlag;
using pulsenet::net::Address;
using namespace pulsenet::runtime;

namespace {

const pulsenet::crypto::Key kZeroKey{};

void noIdle(double) {}

bool test_loopback_pair_loop(const Runtime &rt) {
    pulsenet::SessionConfig cfg;
    QuitFlag quit;

    pulsenet::session::Server server(rt, cfg, kZeroKey, Address("127.0.0.1:40001"), 100.0);
    if (!server.start(4, false))
        return false;
    pulsenet::session::Client client(rt, cfg, Address("0.0.0.0", 0), 100.0);

    pulsenet::session::LoopbackBridge bridge;
    client.setLoopbackBridge(&bridge);
    server.setLoopbackBridge(&bridge);
    client.connectLoopback(2, 99, 4);
    server.connectLoopbackClient(2, 99);
    bridge.attachServer(server);
    bridge.attachClient(client);

    const auto result = runPairLoop(server, client, LoopContext{quit, 0.1, noIdle, 50}, 100.0);
    if (result.exit != LoopExit::IterationLimit || result.iterations != 50 ||
        !client.isConnected() || client.clientIndex() != 2) {
        std::cerr << "[pair] exit=" << loopExitName(result.exit) << " iterations="
                  << result.iterations << "\n";
        return false;
    }
    // iteration 마다 client/server 가 각각 dt 를 더한다.
    if (result.time < 109.99 || result.time > 110.01) {
        std::cerr << "[pair] time=" << result.time << "\n";
        return false;
    }

    client.disconnect();
    server.stop();
    return true;
}

bool test_quit_before_first_iteration(const Runtime &rt) {
    pulsenet::SessionConfig cfg;
    QuitFlag quit;
    quit.request();

    pulsenet::session::Client client(rt, cfg, Address("0.0.0.0", 0), 100.0);
    const auto result = runClientLoop(client, LoopContext{quit, 0.1, noIdle}, 100.0);
    if (result.exit != LoopExit::QuitRequested || result.iterations != 0 || result.time != 100.0) {
        std::cerr << "[quit] exit=" << loopExitName(result.exit) << "\n";
        return false;
    }
    return true;
}

/// 응답 없는 서버 -> 클라이언트 루프가 ConnectionFailed 로 끝난다.
bool test_client_loop_connection_failed(const Runtime &rt) {
    pulsenet::SessionConfig cfg;
    cfg.timeoutSeconds = 1;
    QuitFlag quit;

    std::uint16_t port = 0;
    {
        auto probe = pulsenet::net::Socket::createUdp(pulsenet::net::AddressType::IPv4);
        if (!probe.bind(Address("127.0.0.1", 0)))
            return false;
        port = probe.localAddress().port();
    }

    pulsenet::session::Client client(rt, cfg, Address("0.0.0.0", 0), 100.0);
    client.connectInsecure(kZeroKey, 3, Address("127.0.0.1", port));

    const auto result = runClientLoop(client, LoopContext{quit, 0.1, noIdle, 1000}, 100.0);
    if (result.exit != LoopExit::ConnectionFailed) {
        std::cerr << "[failed] exit=" << loopExitName(result.exit) << "\n";
        return false;
    }
    return true;
}

bool test_server_loop_stops(const Runtime &rt) {
    pulsenet::SessionConfig cfg;
    QuitFlag quit;

    pulsenet::session::Server server(rt, cfg, kZeroKey, Address("127.0.0.1", 0), 0.0);
    if (!server.start(2))
        return false;

    const auto result = runServerLoop(
        server, LoopContext{quit, 0.1, [&server](double) { server.stop(); }, 10}, 0.0);
    if (result.exit != LoopExit::ServerStopped || result.iterations != 2) {
        std::cerr << "[server] exit=" << loopExitName(result.exit)
                  << " iterations=" << result.iterations << "\n";
        return false;
    }
    return true;
}

/// soak 드라이버를 짧게 돌린다. 검증 실패나 연결 실패가 없으면 0.
bool test_soak_driver(const Runtime &rt) {
    pulsenet::core::GlobalConfig cfg;
    cfg.server.port = 0;
    cfg.session.maxBlockSize = 256;
    QuitFlag quit;
    DriverEnv env{rt, cfg, quit};

    const int rc = runSoak(env, SoakOptions{400});
    if (rc != 0) {
        std::cerr << "[soak] rc=" << rc << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    Runtime rt;
    bool ok = true;

    ok = ok && test_loopback_pair_loop(rt);
    ok = ok && test_quit_before_first_iteration(rt);
    ok = ok && test_client_loop_connection_failed(rt);
    ok = ok && test_server_loop_stops(rt);
    ok = ok && test_soak_driver(rt);

    if (!ok) {
        std::cerr << "SessionLoop tests FAILED\n";
        return 1;
    }

    std::cout << "SessionLoop tests PASSED\n";
    return 0;
}
