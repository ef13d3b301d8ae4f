#pragma once

#include <pulsenet/crypto/Aead.hpp>
#include <pulsenet/net/Address.hpp>

#include <cstdint>
#include <span>

namespace pulsenet::session
{

/// 고정 timestep 루프가 돌리는 공통 능력 집합 (Client / Server)
class ISession
{
  public:
    virtual ~ISession() = default;

    virtual void sendPackets() = 0;
    virtual void receivePackets() = 0;
    virtual void advanceTime(double time) = 0;
    [[nodiscard]] virtual double time() const noexcept = 0;
};

/// 클라이언트 세션 능력 집합. 네트워크/loopback 클라이언트가 같은 인터페이스를 만족한다.
class IClientSession : public ISession
{
  public:
    /// 매처 없이 로컬에서 토큰을 만들어 접속 (private key 를 클라이언트가 안다)
    virtual void connectInsecure(const crypto::Key &privateKey, std::uint64_t clientId,
                                 const net::Address &serverAddress) = 0;

    /// 매처가 발급한 1024-byte connect token 으로 접속
    virtual void connectSecure(std::uint64_t clientId,
                               std::span<const std::uint8_t> connectToken) = 0;

    /// 같은 프로세스 서버의 clientIndex 슬롯으로 접속 (네트워크 경로 없음)
    virtual void connectLoopback(int clientIndex, std::uint64_t clientId, int maxClients) = 0;

    virtual void disconnect() = 0;

    [[nodiscard]] virtual bool isConnecting() const noexcept = 0;
    [[nodiscard]] virtual bool isConnected() const noexcept = 0;

    /// Connecting/Connected 가 아니면 true (Idle, Disconnected, ConnectionFailed)
    [[nodiscard]] virtual bool isDisconnected() const noexcept = 0;
    [[nodiscard]] virtual bool connectionFailed() const noexcept = 0;
};

} // namespace pulsenet::session
