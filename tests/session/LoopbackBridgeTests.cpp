#include <pulsenet/session/LoopbackBridge.hpp>

#include <cstdint>
#include <iostream>
#include <span>
#include <stdexcept>
#include <vector>

using pulsenet::session::ILoopbackClientEndpoint;
using pulsenet::session::ILoopbackServerEndpoint;
using pulsenet::session::LoopbackBridge;
using pulsenet::session::LoopbackRole;

namespace {

struct Received {
    int clientIndex;
    std::vector<std::uint8_t> bytes;
    std::uint64_t sequence;
    const std::uint8_t *data;
};

class RecordingServer final : public ILoopbackServerEndpoint {
  public:
    void processLoopbackPacket(int clientIndex, std::span<const std::uint8_t> packet,
                               std::uint64_t sequence) override {
        log.push_back({clientIndex, {packet.begin(), packet.end()}, sequence, packet.data()});
        if (arrivals)
            arrivals->push_back('s');
    }
    std::vector<Received> log;
    std::vector<char> *arrivals = nullptr;
};

class RecordingClient final : public ILoopbackClientEndpoint {
  public:
    void processLoopbackPacket(std::span<const std::uint8_t> packet,
                               std::uint64_t sequence) override {
        log.push_back({-1, {packet.begin(), packet.end()}, sequence, packet.data()});
        if (arrivals)
            arrivals->push_back('c');
    }
    std::vector<Received> log;
    std::vector<char> *arrivals = nullptr;
};

/// 양방향을 번갈아 보내도 각자 보낸 순서 그대로, 같은 바이트(같은 버퍼)로 도착하는지
bool test_interleaved_ordering_and_identity() {
    std::vector<char> arrivals;
    RecordingServer server;
    RecordingClient client;
    server.arrivals = &arrivals;
    client.arrivals = &arrivals;
    LoopbackBridge bridge;
    bridge.attachServer(server);
    bridge.attachClient(client);

    std::vector<std::vector<std::uint8_t>> up;
    std::vector<std::vector<std::uint8_t>> down;
    for (std::uint8_t i = 0; i < 5; ++i) {
        up.push_back({i, static_cast<std::uint8_t>(i * 3), 0xAA});
        down.push_back({static_cast<std::uint8_t>(0xF0 | i), i, 0x55,
                        static_cast<std::uint8_t>(i + 1)});
    }

    // c s c s ... 순서로 전달
    for (std::size_t i = 0; i < up.size(); ++i) {
        bridge.deliver(LoopbackRole::Client, 7, up[i], 100 + i);
        bridge.deliver(LoopbackRole::Server, 7, down[i], 200 + i);
    }

    if (server.log.size() != 5 || client.log.size() != 5 || bridge.deliveredCount() != 10) {
        std::cerr << "[order] counts server=" << server.log.size()
                  << " client=" << client.log.size() << "\n";
        return false;
    }
    // 동기 전달: 도착 순서가 deliver 호출 순서와 같다.
    for (std::size_t i = 0; i < arrivals.size(); ++i) {
        if (arrivals[i] != (i % 2 == 0 ? 's' : 'c')) {
            std::cerr << "[order] arrival " << i << " was " << arrivals[i] << "\n";
            return false;
        }
    }
    for (std::size_t i = 0; i < up.size(); ++i) {
        const auto &r = server.log[i];
        if (r.clientIndex != 7 || r.sequence != 100 + i || r.bytes != up[i] ||
            r.data != up[i].data()) {
            std::cerr << "[order] client->server mismatch at " << i << "\n";
            return false;
        }
        const auto &c = client.log[i];
        if (c.sequence != 200 + i || c.bytes != down[i] || c.data != down[i].data()) {
            std::cerr << "[order] server->client mismatch at " << i << "\n";
            return false;
        }
    }
    return true;
}

/// 한쪽이라도 등록이 안 된 bridge 로 보내면 logic_error
bool test_unregistered_throws() {
    const std::vector<std::uint8_t> pkt = {1, 2, 3};

    LoopbackBridge empty;
    bool threw = false;
    try {
        empty.deliver(LoopbackRole::Client, 0, pkt, 0);
    } catch (const std::logic_error &) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[unregistered] empty bridge did not throw\n";
        return false;
    }

    RecordingServer server;
    LoopbackBridge half;
    half.attachServer(server);
    threw = false;
    try {
        half.deliver(LoopbackRole::Client, 0, pkt, 0);
    } catch (const std::logic_error &) {
        threw = true;
    }
    if (!threw || !server.log.empty() || half.deliveredCount() != 0) {
        std::cerr << "[unregistered] half-registered bridge delivered\n";
        return false;
    }

    RecordingClient client;
    half.attachClient(client);
    half.detachServer();
    threw = false;
    try {
        half.deliver(LoopbackRole::Server, 0, pkt, 0);
    } catch (const std::logic_error &) {
        threw = true;
    }
    if (!threw || !client.log.empty()) {
        std::cerr << "[unregistered] detached bridge delivered\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_interleaved_ordering_and_identity();
    ok = ok && test_unregistered_throws();

    if (!ok) {
        std::cerr << "LoopbackBridge tests FAILED\n";
        return 1;
    }

    std::cout << "LoopbackBridge tests PASSED\n";
    return 0;
}
