#pragma once

#include <pulsenet/Runtime.hpp>
#include <pulsenet/SessionConfig.hpp>
#include <pulsenet/crypto/ConnectToken.hpp>
#include <pulsenet/message/Message.hpp>
#include <pulsenet/monitoring/SessionCounters.hpp>
#include <pulsenet/net/Address.hpp>
#include <pulsenet/net/Socket.hpp>
#include <pulsenet/protocol/Packets.hpp>
#include <pulsenet/session/ISession.hpp>
#include <pulsenet/session/LoopbackBridge.hpp>
#include <pulsenet/session/MessageChannel.hpp>
#include <pulsenet/session/SessionState.hpp>
#include <pulsenet/util/NonCopyable.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace pulsenet::session
{

/// 서버 세션. 고정 크기 클라이언트 슬롯 테이블을 관리한다.
///
/// - 네트워크 클라이언트는 request -> challenge -> response -> keep-alive 로 슬롯을 얻는다.
/// - loopback 클라이언트는 connectLoopbackClient() 로 슬롯을 직접 점유한다.
/// - 단일 스레드. send -> receive -> advanceTime 순으로 드라이버가 돌린다.
class Server final : public ISession, public ILoopbackServerEndpoint, private util::NonCopyable
{
  public:
    /// privateKey: connect token 봉인 키 (매처와 공유)
    /// address: bind 주소이자 토큰 안의 공개 주소와 비교하는 주소
    Server(const Runtime &runtime, const SessionConfig &config, const crypto::Key &privateKey,
           const net::Address &address, double time);
    ~Server() override;

    Server(Server &&) = delete;
    Server &operator=(Server &&) = delete;

    /// maxClients 슬롯으로 시작. openSocket=false 면 loopback 전용(소켓 없음).
    /// - 이미 실행 중이면 무시. 인자 오류는 std::invalid_argument.
    /// - 소켓 열기 실패는 false.
    bool start(int maxClients, bool openSocket = true);
    void stop();
    [[nodiscard]] bool isRunning() const noexcept { return running_; }

    // ----- ISession -----
    void sendPackets() override;
    void receivePackets() override;
    void advanceTime(double time) override;
    [[nodiscard]] double time() const noexcept override { return time_; }

    // ----- 슬롯 -----
    void connectLoopbackClient(int clientIndex, std::uint64_t clientId);
    void disconnectLoopbackClient(int clientIndex);
    void disconnectClient(int clientIndex);
    void disconnectAllClients();

    [[nodiscard]] bool isClientConnected(int clientIndex) const noexcept;
    [[nodiscard]] int numConnectedClients() const noexcept;
    [[nodiscard]] int maxClients() const noexcept { return maxClients_; }
    [[nodiscard]] std::uint64_t clientId(int clientIndex) const noexcept;
    [[nodiscard]] std::optional<net::Address> clientAddress(int clientIndex) const;

    /// challenge 를 보내고 response 를 기다리는 주소 수
    [[nodiscard]] std::size_t numPendingClients() const noexcept { return pending_.size(); }

    // ----- 메시지 -----
    [[nodiscard]] bool canSendMessage(int clientIndex) const noexcept;
    bool sendMessage(int clientIndex, message::Message message);
    [[nodiscard]] std::optional<message::Message> receiveMessage(int clientIndex);

    // ----- loopback -----
    void setLoopbackBridge(LoopbackBridge *bridge) noexcept { bridge_ = bridge; }
    void processLoopbackPacket(int clientIndex, std::span<const std::uint8_t> packet,
                               std::uint64_t sequence) override;

    /// 실제 bind 된 주소 (port 0 으로 열었으면 커널이 고른 포트)
    [[nodiscard]] const net::Address &address() const noexcept { return address_; }

    [[nodiscard]] const monitoring::SessionCounters &counters() const noexcept
    {
        return counters_;
    }

  private:
    struct ClientSlot
    {
        bool connected{false};
        bool loopback{false};
        std::uint64_t clientId{0};
        net::Address address;
        double lastPacketReceiveTime{0.0};
        double lastPacketSendTime{0.0};
        std::uint64_t sequence{0};
        int timeoutSeconds{0};
        std::unique_ptr<MessageChannel> channel;
    };

    /// challenge 를 보낸 뒤 response 를 기다리는 주소
    struct PendingClient
    {
        std::uint64_t clientId{0};
        int timeoutSeconds{0};
        std::uint64_t challengeSequence{0};
        std::uint64_t challengeToken{0};
        double createTime{0.0};
    };

    /// 이미 사용된 토큰 (봉인 tag 기준). 만료 시각이 지나면 지운다.
    struct UsedToken
    {
        net::Address address;
        std::uint64_t expireTimestamp{0};
    };

    void processPacket(const net::Address &from, std::span<const std::uint8_t> packet);
    void processConnectionRequest(const net::Address &from, protocol::ByteReader &r);
    void processConnectionResponse(const net::Address &from, protocol::ByteReader &r);
    void processConnectedPacket(int clientIndex, const protocol::PacketHeader &header,
                                protocol::ByteReader &r);

    [[nodiscard]] int findFreeSlot() const noexcept;
    [[nodiscard]] int findClientByAddress(const net::Address &address) const noexcept;
    [[nodiscard]] int findClientById(std::uint64_t clientId) const noexcept;
    [[nodiscard]] bool validIndex(int clientIndex) const noexcept;
    [[nodiscard]] bool tokenAlreadyUsed(const crypto::SealedPrivateBytes &sealed,
                                        const net::Address &from,
                                        std::uint64_t expireTimestamp);

    void sendRaw(const net::Address &to, const std::vector<std::uint8_t> &packet);
    template <typename PacketT> void sendToClient(int clientIndex, const PacketT &pkt);
    template <typename PacketT> void sendHandshake(const net::Address &to, const PacketT &pkt);

    void freeSlot(int clientIndex, FailReason reason);

    const Runtime &runtime_;
    const SessionConfig &config_;
    crypto::Key privateKey_;
    net::Address address_;
    net::Socket socket_;
    LoopbackBridge *bridge_{nullptr};

    monitoring::SessionCounters counters_;

    bool running_{false};
    int maxClients_{0};
    double time_;
    std::uint64_t challengeSequence_{0};
    std::uint64_t handshakeSequence_{0};

    std::vector<ClientSlot> slots_;
    std::unordered_map<std::string, PendingClient> pending_;
    std::map<std::vector<std::uint8_t>, UsedToken> usedTokens_;

    std::vector<std::uint8_t> recvBuf_;
};

} // namespace pulsenet::session
