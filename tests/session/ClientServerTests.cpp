#include <pulsenet/Runtime.hpp>
#include <pulsenet/SessionConfig.hpp>
#include <pulsenet/core/Defaults.hpp>
#include <pulsenet/crypto/ConnectToken.hpp>
#include <pulsenet/protocol/Packets.hpp>
#include <pulsenet/session/Client.hpp>
#include <pulsenet/session/LoopbackBridge.hpp>
#include <pulsenet/session/Server.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

using pulsenet::Runtime;
using pulsenet::SessionConfig;
using pulsenet::crypto::Key;
using pulsenet::net::Address;
using pulsenet::session::Client;
using pulsenet::session::FailReason;
using pulsenet::session::LoopbackBridge;
using pulsenet::session::Server;
using pulsenet::session::SessionState;

namespace {

const Key kZeroKey{};
const Address kAnyBind("0.0.0.0", 0);

/// 한 스레드 pair 루프 한 번. UDP 왕복을 위해 짧게 쉰다.
void pump(Server &server, Client &client, double &time, double dt, bool sleep = true) {
    server.sendPackets();
    client.sendPackets();
    if (sleep)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    server.receivePackets();
    client.receivePackets();
    time += dt;
    client.advanceTime(time);
    server.advanceTime(time);
}

bool test_insecure_udp_connect(const Runtime &rt) {
    SessionConfig cfg;
    double time = 100.0;

    Server server(rt, cfg, kZeroKey, Address("127.0.0.1", pulsenet::core::defaults::kServerPort),
                  time);
    if (!server.start(4)) {
        std::cerr << "[udp] server start failed on 127.0.0.1:40001\n";
        return false;
    }

    Client client(rt, cfg, kAnyBind, time);
    client.connectInsecure(kZeroKey, 0x1234, Address("127.0.0.1:40001"));
    if (!client.isConnecting()) {
        std::cerr << "[udp] not connecting after connectInsecure\n";
        return false;
    }

    for (int i = 0; i < 200 && !client.isConnected(); ++i)
        pump(server, client, time, 0.1);

    if (!client.isConnected() || server.numConnectedClients() != 1) {
        std::cerr << "[udp] state=" << pulsenet::session::sessionStateName(client.state())
                  << " server_clients=" << server.numConnectedClients() << "\n";
        return false;
    }
    const int idx = client.clientIndex();
    if (!server.isClientConnected(idx) || server.clientId(idx) != 0x1234 ||
        client.address().port() == 0) {
        std::cerr << "[udp] slot bookkeeping idx=" << idx << "\n";
        return false;
    }

    // 메시지 한 통씩 주고받기
    (void)client.sendMessage(pulsenet::message::TestMessage{16});
    (void)server.sendMessage(idx, pulsenet::message::TestMessage{1});
    bool gotOnServer = false;
    bool gotOnClient = false;
    for (int i = 0; i < 50 && !(gotOnServer && gotOnClient); ++i) {
        pump(server, client, time, 0.01);
        if (auto m = server.receiveMessage(idx))
            gotOnServer = std::get<pulsenet::message::TestMessage>(*m).sequence == 16;
        if (auto m = client.receiveMessage())
            gotOnClient = std::get<pulsenet::message::TestMessage>(*m).sequence == 1;
    }
    if (!gotOnServer || !gotOnClient) {
        std::cerr << "[udp] message exchange server=" << gotOnServer << " client=" << gotOnClient
                  << "\n";
        return false;
    }

    // 클라이언트 disconnect 가 서버 슬롯을 비운다.
    client.disconnect();
    if (client.state() != SessionState::Disconnected ||
        client.failReason() != FailReason::LocalDisconnect) {
        std::cerr << "[udp] local disconnect state\n";
        return false;
    }
    for (int i = 0; i < 20 && server.numConnectedClients() != 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        server.receivePackets();
    }
    if (server.numConnectedClients() != 0) {
        std::cerr << "[udp] server did not observe disconnect\n";
        return false;
    }

    server.stop();
    return true;
}

/// 서버가 끊으면 클라이언트는 Disconnected(PeerDisconnect)
bool test_server_initiated_disconnect(const Runtime &rt) {
    SessionConfig cfg;
    double time = 0.0;
    Server server(rt, cfg, kZeroKey, Address("127.0.0.1", 0), time);
    if (!server.start(2))
        return false;

    Client client(rt, cfg, kAnyBind, time);
    client.connectInsecure(kZeroKey, 77, server.address());
    for (int i = 0; i < 200 && !client.isConnected(); ++i)
        pump(server, client, time, 0.1);
    if (!client.isConnected()) {
        std::cerr << "[peer] did not connect\n";
        return false;
    }

    server.disconnectClient(client.clientIndex());
    for (int i = 0; i < 20 && client.isConnected(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        client.receivePackets();
    }
    if (client.state() != SessionState::Disconnected ||
        client.failReason() != FailReason::PeerDisconnect || !client.isDisconnected()) {
        std::cerr << "[peer] state=" << pulsenet::session::sessionStateName(client.state())
                  << "\n";
        return false;
    }
    return true;
}

/// 서버가 없으면 handshake timeout 으로 ConnectionFailed
bool test_handshake_timeout(const Runtime &rt) {
    SessionConfig cfg;
    cfg.timeoutSeconds = 2;

    double time = 100.0;
    Client client(rt, cfg, kAnyBind, time);
    // 아무도 듣지 않는 포트 (방금 열고 닫은 소켓의 포트)
    std::uint16_t port = 0;
    {
        auto probe = pulsenet::net::Socket::createUdp(pulsenet::net::AddressType::IPv4);
        if (!probe.bind(Address("127.0.0.1", 0)))
            return false;
        port = probe.localAddress().port();
    }
    client.connectInsecure(kZeroKey, 5, Address("127.0.0.1", port));

    for (int i = 0; i < 40 && client.isConnecting(); ++i) {
        client.sendPackets();
        client.receivePackets();
        time += 0.1;
        client.advanceTime(time);
    }
    if (!client.connectionFailed() || client.failReason() != FailReason::HandshakeTimeout) {
        std::cerr << "[timeout] state=" << pulsenet::session::sessionStateName(client.state())
                  << " reason=" << pulsenet::session::failReasonName(client.failReason())
                  << "\n";
        return false;
    }

    // 실패 상태에서 빠져나가는 길은 새 connect
    client.connectInsecure(kZeroKey, 6, Address("127.0.0.1", port));
    if (!client.isConnecting()) {
        std::cerr << "[timeout] fresh connect did not restart\n";
        return false;
    }
    client.disconnect();
    if (client.failReason() != FailReason::Cancelled || !client.connectionFailed()) {
        std::cerr << "[timeout] cancel while connecting\n";
        return false;
    }
    return true;
}

bool test_invalid_token(const Runtime &rt) {
    SessionConfig cfg;
    Client client(rt, cfg, kAnyBind, 0.0);

    std::vector<std::uint8_t> garbage(pulsenet::crypto::kConnectTokenBytes, 0xEE);
    client.connectSecure(1, garbage);
    if (!client.connectionFailed() || client.failReason() != FailReason::InvalidToken) {
        std::cerr << "[token] garbage token not rejected\n";
        return false;
    }

    std::vector<std::uint8_t> shortToken(10, 0);
    client.connectSecure(1, shortToken);
    if (!client.isDisconnected()) {
        std::cerr << "[token] short token not rejected\n";
        return false;
    }
    return true;
}

/// 다른 키로 만든 토큰은 서버가 무시한다 -> handshake timeout
bool test_wrong_key_ignored(const Runtime &rt) {
    SessionConfig cfg;
    cfg.timeoutSeconds = 1;
    double time = 0.0;

    Server server(rt, cfg, pulsenet::core::defaults::kSecurePrivateKey, Address("127.0.0.1", 0),
                  time);
    if (!server.start(2))
        return false;

    Client client(rt, cfg, kAnyBind, time);
    client.connectInsecure(kZeroKey, 9, server.address());
    for (int i = 0; i < 40 && client.isConnecting(); ++i)
        pump(server, client, time, 0.1);

    if (client.failReason() != FailReason::HandshakeTimeout ||
        server.numConnectedClients() != 0 || server.counters().snapshot().packetsInvalid == 0) {
        std::cerr << "[wrong_key] reason="
                  << pulsenet::session::failReasonName(client.failReason()) << "\n";
        return false;
    }
    return true;
}

/// 슬롯이 다 차면 ConnectionDenied -> 클라이언트 ConnectionFailed(Denied)
bool test_server_full_denied(const Runtime &rt) {
    SessionConfig cfg;
    double time = 0.0;
    Server server(rt, cfg, kZeroKey, Address("127.0.0.1", 0), time);
    if (!server.start(1))
        return false;

    Client first(rt, cfg, kAnyBind, time);
    first.connectInsecure(kZeroKey, 1, server.address());
    for (int i = 0; i < 200 && !first.isConnected(); ++i)
        pump(server, first, time, 0.1);
    if (!first.isConnected()) {
        std::cerr << "[full] first client did not connect\n";
        return false;
    }

    Client second(rt, cfg, kAnyBind, time);
    second.connectInsecure(kZeroKey, 2, server.address());
    for (int i = 0; i < 200 && second.isConnecting(); ++i) {
        pump(server, second, time, 0.01);
        first.sendPackets();
        first.receivePackets();
        first.advanceTime(time);
    }
    if (second.failReason() != FailReason::Denied || !first.isConnected()) {
        std::cerr << "[full] reason=" << pulsenet::session::failReasonName(second.failReason())
                  << "\n";
        return false;
    }
    return true;
}

/// start -> stop -> start 후에도 같은 주소로 다시 연결된다.
bool test_server_start_stop_restart(const Runtime &rt) {
    SessionConfig cfg;
    double time = 0.0;
    Server server(rt, cfg, kZeroKey, Address("127.0.0.1", 0), time);
    Client client(rt, cfg, kAnyBind, time);

    for (int round = 0; round < 3; ++round) {
        if (!server.start(4)) {
            std::cerr << "[restart] start failed round=" << round << "\n";
            return false;
        }
        client.connectInsecure(kZeroKey, 1000 + round, server.address());
        for (int i = 0; i < 200 && !client.isConnected(); ++i)
            pump(server, client, time, 0.1);
        if (!client.isConnected() || server.numConnectedClients() != 1 ||
            server.clientId(client.clientIndex()) != static_cast<std::uint64_t>(1000 + round)) {
            std::cerr << "[restart] round=" << round << " state="
                      << pulsenet::session::sessionStateName(client.state()) << "\n";
            return false;
        }

        server.stop();
        if (server.isRunning() || server.numConnectedClients() != 0) {
            std::cerr << "[restart] stop left state behind round=" << round << "\n";
            return false;
        }
        // stop 이 보낸 disconnect 를 클라이언트가 본다.
        for (int i = 0; i < 20 && client.isConnected(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            client.receivePackets();
        }
        if (client.failReason() != FailReason::PeerDisconnect) {
            std::cerr << "[restart] client reason="
                      << pulsenet::session::failReasonName(client.failReason()) << "\n";
            return false;
        }
    }
    return true;
}

/// 배치 안에서 디코딩에 실패하는 메시지만 빠지고 앞뒤 메시지는 도착한다.
bool test_failing_message_isolated_end_to_end(const Runtime &rt) {
    using pulsenet::message::SerializeFailOnReadMessage;
    using pulsenet::message::TestMessage;

    SessionConfig cfg;
    double time = 0.0;
    Server server(rt, cfg, kZeroKey, Address("127.0.0.1", 0), time);
    if (!server.start(2))
        return false;

    Client client(rt, cfg, kAnyBind, time);
    client.connectInsecure(kZeroKey, 31, server.address());
    for (int i = 0; i < 200 && !client.isConnected(); ++i)
        pump(server, client, time, 0.1);
    if (!client.isConnected()) {
        std::cerr << "[isolate] did not connect\n";
        return false;
    }
    const int idx = client.clientIndex();

    if (!client.sendMessage(TestMessage{5}) || !client.sendMessage(SerializeFailOnReadMessage{}) ||
        !client.sendMessage(TestMessage{16})) {
        std::cerr << "[isolate] send rejected\n";
        return false;
    }

    std::vector<std::uint16_t> got;
    for (int i = 0; i < 50 && got.size() < 2; ++i) {
        pump(server, client, time, 0.01);
        while (auto m = server.receiveMessage(idx))
            got.push_back(std::get<TestMessage>(*m).sequence);
    }
    const auto snap = server.counters().snapshot();
    if (got != std::vector<std::uint16_t>{5, 16} || snap.messageDecodeFailures != 1 ||
        !client.isConnected()) {
        std::cerr << "[isolate] received=" << got.size()
                  << " decode_failures=" << snap.messageDecodeFailures << "\n";
        return false;
    }
    server.stop();
    return true;
}

/// 새 토큰을 봉인해 만든 connection request 패킷 (토큰 timeout 지정)
std::vector<std::uint8_t> makeRequestPacket(const Runtime &rt, const SessionConfig &cfg,
                                            const Address &server, std::int32_t timeoutSeconds) {
    pulsenet::crypto::ConnectTokenParams params;
    params.protocolId = cfg.protocolId;
    params.clientId = 4242;
    params.timeoutSeconds = timeoutSeconds;
    params.expirySeconds = 30;
    params.nowUnixSeconds = rt.unixTimeSeconds();
    rt.randomBytes(params.nonce);
    params.serverAddresses.push_back(server);

    pulsenet::crypto::ConnectTokenBytes bytes{};
    pulsenet::crypto::ConnectToken token;
    if (!pulsenet::crypto::generateConnectToken(params, kZeroKey, bytes) ||
        !pulsenet::crypto::readConnectToken(bytes, token))
        return {};

    pulsenet::protocol::ConnectionRequestPkt req;
    req.versionInfo = token.versionInfo;
    req.protocolId = token.protocolId;
    req.expireTimestamp = token.expireTimestamp;
    req.nonce = token.nonce;
    req.sealedPrivate = token.sealedPrivate;
    return pulsenet::protocol::buildPacket(req, 0);
}

void pollServer(Server &server) {
    for (int i = 0; i < 5; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        server.receivePackets();
    }
}

/// 토큰 timeout 이 0 이어도 응답 없는 handshake 는 설정 timeout 뒤 정리된다.
bool test_pending_handshake_expires(const Runtime &rt) {
    SessionConfig cfg;
    cfg.timeoutSeconds = 2;
    double time = 100.0;
    Server server(rt, cfg, kZeroKey, Address("127.0.0.1", 0), time);
    if (!server.start(2))
        return false;

    const auto request = makeRequestPacket(rt, cfg, server.address(), 0);
    auto sock = pulsenet::net::Socket::createUdp(pulsenet::net::AddressType::IPv4);
    if (request.empty() || !sock.bind(Address("127.0.0.1", 0)) ||
        sock.sendTo(server.address(), request.data(), request.size()) < 0) {
        std::cerr << "[pending] request send failed\n";
        return false;
    }
    pollServer(server);
    if (server.numPendingClients() != 1) {
        std::cerr << "[pending] pending=" << server.numPendingClients() << "\n";
        return false;
    }

    time += 1.0;
    server.advanceTime(time);
    if (server.numPendingClients() != 1) {
        std::cerr << "[pending] expired too early\n";
        return false;
    }
    time += 2.0;
    server.advanceTime(time);
    if (server.numPendingClients() != 0) {
        std::cerr << "[pending] zero-timeout handshake never expired\n";
        return false;
    }
    return true;
}

/// maxPacketSize 를 넘는 datagram 은 잘라 읽지 않고 통째로 버린다.
bool test_oversized_datagram_dropped(const Runtime &rt) {
    SessionConfig cfg;
    double time = 100.0;

    // request 크기는 주소와 무관하다. 정상 request 가 정확히 한도를 채우게 한다.
    const auto sizing = makeRequestPacket(rt, cfg, Address("127.0.0.1", 9), 5);
    if (sizing.empty())
        return false;
    cfg.maxPacketSize = sizing.size();

    Server tight(rt, cfg, kZeroKey, Address("127.0.0.1", 0), time);
    if (!tight.start(2))
        return false;
    const auto tightRequest = makeRequestPacket(rt, cfg, tight.address(), 5);

    auto sock = pulsenet::net::Socket::createUdp(pulsenet::net::AddressType::IPv4);
    if (!sock.bind(Address("127.0.0.1", 0)))
        return false;

    std::vector<std::uint8_t> padded = tightRequest;
    padded.resize(padded.size() + 16, 0xCD);
    if (sock.sendTo(tight.address(), padded.data(), padded.size()) < 0)
        return false;
    pollServer(tight);
    if (tight.numPendingClients() != 0 || tight.counters().snapshot().packetsInvalid != 1) {
        std::cerr << "[oversized] truncated datagram was processed pending="
                  << tight.numPendingClients() << "\n";
        return false;
    }

    // 같은 request 를 한도 안으로 보내면 challenge 단계로 간다.
    if (sock.sendTo(tight.address(), tightRequest.data(), tightRequest.size()) < 0)
        return false;
    pollServer(tight);
    if (tight.numPendingClients() != 1) {
        std::cerr << "[oversized] exact-size request rejected\n";
        return false;
    }
    tight.stop();
    return true;
}

/// loopback: 소켓 없이 Connected, 메시지 왕복, disconnect 전파
bool test_loopback_connect(const Runtime &rt) {
    SessionConfig cfg;
    double time = 100.0;

    Server server(rt, cfg, kZeroKey, Address("127.0.0.1:40001"), time);
    if (!server.start(8, /*openSocket=*/false)) {
        std::cerr << "[loopback] server start\n";
        return false;
    }
    Client client(rt, cfg, kAnyBind, time);
    LoopbackBridge bridge;
    client.setLoopbackBridge(&bridge);
    server.setLoopbackBridge(&bridge);

    client.connectLoopback(0, 0xABCD, 8);
    server.connectLoopbackClient(0, 0xABCD);
    bridge.attachServer(server);
    bridge.attachClient(client);

    if (!client.isConnecting() || !server.isClientConnected(0)) {
        std::cerr << "[loopback] initial state\n";
        return false;
    }

    pump(server, client, time, 0.1, /*sleep=*/false);
    if (!client.isConnected() || client.clientIndex() != 0 || client.maxClients() != 8) {
        std::cerr << "[loopback] not connected after one iteration\n";
        return false;
    }

    pulsenet::message::TestBlockMessage blk;
    blk.sequence = 3;
    blk.block = {1, 2, 3, 4, 5};
    (void)client.sendMessage(blk);
    (void)server.sendMessage(0, pulsenet::message::TestMessage{20});
    pump(server, client, time, 0.1, false);

    auto onServer = server.receiveMessage(0);
    auto onClient = client.receiveMessage();
    if (!onServer || !onClient ||
        std::get<pulsenet::message::TestBlockMessage>(*onServer).block != blk.block ||
        std::get<pulsenet::message::TestMessage>(*onClient).sequence != 20) {
        std::cerr << "[loopback] message exchange\n";
        return false;
    }

    // 몇 초 돌려도 keep-alive 덕분에 유지된다.
    for (int i = 0; i < 300; ++i)
        pump(server, client, time, 0.1, false);
    if (!client.isConnected() || !server.isClientConnected(0)) {
        std::cerr << "[loopback] timed out despite keep-alives\n";
        return false;
    }

    client.disconnect();
    if (client.state() != SessionState::Disconnected || server.isClientConnected(0)) {
        std::cerr << "[loopback] disconnect did not free the slot\n";
        return false;
    }
    if (client.counters().snapshot().sendErrors != 0) {
        std::cerr << "[loopback] unexpected send errors\n";
        return false;
    }

    server.stop();
    return true;
}

bool test_loopback_requires_bridge(const Runtime &rt) {
    SessionConfig cfg;
    Client client(rt, cfg, kAnyBind, 0.0);
    try {
        client.connectLoopback(0, 1, 4);
    } catch (const std::logic_error &) {
        return client.state() == SessionState::Idle;
    }
    std::cerr << "[loopback_bridge] connectLoopback without bridge did not throw\n";
    return false;
}

/// Runtime 은 프로세스에 하나만 살아 있을 수 있다.
bool test_second_runtime_rejected() {
    bool threw = false;
    try {
        Runtime second;
        (void)second;
    } catch (const std::logic_error &) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[runtime] second live Runtime accepted\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    Runtime rt;
    bool ok = true;

    ok = ok && test_insecure_udp_connect(rt);
    ok = ok && test_server_initiated_disconnect(rt);
    ok = ok && test_handshake_timeout(rt);
    ok = ok && test_invalid_token(rt);
    ok = ok && test_wrong_key_ignored(rt);
    ok = ok && test_server_full_denied(rt);
    ok = ok && test_server_start_stop_restart(rt);
    ok = ok && test_failing_message_isolated_end_to_end(rt);
    ok = ok && test_pending_handshake_expires(rt);
    ok = ok && test_oversized_datagram_dropped(rt);
    ok = ok && test_loopback_connect(rt);
    ok = ok && test_loopback_requires_bridge(rt);
    ok = ok && test_second_runtime_rejected();

    if (!ok) {
        std::cerr << "ClientServer tests FAILED\n";
        return 1;
    }

    std::cout << "ClientServer tests PASSED\n";
    return 0;
}
