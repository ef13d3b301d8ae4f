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
#include <pulsenet/session/SessionStateMachine.hpp>
#include <pulsenet/util/NonCopyable.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace pulsenet::session
{

/// 클라이언트 세션.
///
/// - insecure / secure / loopback 세 가지 connect 모드를 하나의 상태 머신으로 다룬다.
/// - 단일 스레드. send -> receive -> advanceTime 순으로 드라이버가 돌린다.
/// - 네트워크 모드는 connect 시점에 UDP 소켓을 열고, 종료 상태로 가면 닫는다.
/// - loopback 모드는 소켓 없이 LoopbackBridge 로만 주고받는다.
class Client final : public IClientSession,
                     public ILoopbackClientEndpoint,
                     private util::NonCopyable
{
  public:
    /// bindAddress: 네트워크 모드에서 bind 할 로컬 주소 (보통 0.0.0.0:0)
    /// - runtime 이 활성 상태가 아니면 std::logic_error
    Client(const Runtime &runtime, const SessionConfig &config, const net::Address &bindAddress,
           double time);
    ~Client() override;

    Client(Client &&) = delete;
    Client &operator=(Client &&) = delete;

    // ----- IClientSession -----
    void connectInsecure(const crypto::Key &privateKey, std::uint64_t clientId,
                         const net::Address &serverAddress) override;
    void connectSecure(std::uint64_t clientId,
                       std::span<const std::uint8_t> connectToken) override;
    void connectLoopback(int clientIndex, std::uint64_t clientId, int maxClients) override;
    void disconnect() override;

    void sendPackets() override;
    void receivePackets() override;
    void advanceTime(double time) override;
    [[nodiscard]] double time() const noexcept override { return time_; }

    [[nodiscard]] bool isConnecting() const noexcept override;
    [[nodiscard]] bool isConnected() const noexcept override;
    [[nodiscard]] bool isDisconnected() const noexcept override;
    [[nodiscard]] bool connectionFailed() const noexcept override;

    // ----- 상태 조회 -----
    [[nodiscard]] SessionState state() const noexcept { return fsm_.state(); }
    [[nodiscard]] FailReason failReason() const noexcept { return fsm_.reason(); }
    [[nodiscard]] ConnectMode connectMode() const noexcept { return fsm_.mode(); }
    [[nodiscard]] std::uint64_t clientId() const noexcept { return clientId_; }

    /// 서버가 keep-alive 로 알려준 슬롯 번호. 연결 전이면 -1.
    [[nodiscard]] int clientIndex() const noexcept { return clientIndex_; }
    [[nodiscard]] int maxClients() const noexcept { return maxClients_; }

    /// 실제로 bind 된 로컬 주소 (loopback/미연결이면 생성자 bindAddress)
    [[nodiscard]] const net::Address &address() const noexcept { return address_; }
    [[nodiscard]] const net::Address &serverAddress() const noexcept { return serverAddress_; }

    // ----- 메시지 -----
    [[nodiscard]] bool canSendMessage() const noexcept;
    bool sendMessage(message::Message message);
    [[nodiscard]] std::optional<message::Message> receiveMessage();

    // ----- loopback -----
    void setLoopbackBridge(LoopbackBridge *bridge) noexcept { bridge_ = bridge; }
    void processLoopbackPacket(std::span<const std::uint8_t> packet,
                               std::uint64_t sequence) override;

    [[nodiscard]] const monitoring::SessionCounters &counters() const noexcept
    {
        return counters_;
    }

  private:
    enum class HandshakeStep : std::uint8_t
    {
        SendingRequest,
        SendingResponse
    };

    void connectWithToken(ConnectMode mode, std::uint64_t clientId,
                          std::span<const std::uint8_t> connectToken);
    bool openSocket(const net::Address &serverAddress);
    void beginServerAttempt(std::size_t index);
    void resetConnection();
    void failConnect(FailReason reason);
    void finishDisconnect(FailReason reason);

    void processPacket(std::span<const std::uint8_t> packet);
    void sendPacket(const std::vector<std::uint8_t> &packet);
    template <typename PacketT> void sendPacketT(const PacketT &pkt);

    [[nodiscard]] bool sendIntervalElapsed() const noexcept;
    [[nodiscard]] int effectiveTimeoutSeconds() const noexcept;

    const Runtime &runtime_;
    const SessionConfig &config_;
    net::Address bindAddress_;
    net::Address address_;
    net::Socket socket_;
    LoopbackBridge *bridge_{nullptr};

    SessionStateMachine fsm_{"Client"};
    monitoring::SessionCounters counters_;
    MessageChannel channel_;

    double time_;
    double connectStartTime_{0.0};
    double lastPacketSendTime_{0.0};
    double lastPacketReceiveTime_{0.0};

    std::uint64_t clientId_{0};
    int clientIndex_{-1};
    int maxClients_{0};
    std::uint64_t sequence_{0};

    // handshake
    crypto::ConnectToken token_{};
    protocol::ConnectionRequestPkt request_{};
    protocol::ConnectionChallengePkt challenge_{};
    HandshakeStep step_{HandshakeStep::SendingRequest};
    std::size_t serverIndex_{0};
    net::Address serverAddress_;
    int timeoutSeconds_{0};
    double tokenLifetime_{0.0};

    std::vector<std::uint8_t> recvBuf_;
};

} // namespace pulsenet::session
