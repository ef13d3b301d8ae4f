#pragma once

#include <pulsenet/net/Address.hpp>
#include <pulsenet/util/NonCopyable.hpp>

#include <cstddef>
#include <cstdint>

#include <sys/socket.h> // sockaddr, socklen_t
#include <sys/types.h>  // ssize_t

namespace pulsenet::net
{

/// POSIX 소켓 fd 를 RAII 로 감싸는 얇은 래퍼입니다.
///
/// - move-only. 소유권은 항상 정확히 한 Socket 인스턴스에만 존재합니다.
/// - 실패는 bool / ssize_t(-1) + errno 로 보고합니다. 예외 없음.
/// - UDP(세션 트랜스포트)와 TCP(매처 요청/응답) 둘 다 여기서 만든다.
class Socket : private pulsenet::util::NonCopyable
{
  public:
    using Handle = int;

    Socket() noexcept = default;
    explicit Socket(Handle fd) noexcept;
    ~Socket() noexcept;

    Socket(Socket &&other) noexcept;
    Socket &operator=(Socket &&other) noexcept;

    [[nodiscard]] bool isValid() const noexcept { return fd_ >= 0; }
    [[nodiscard]] Handle nativeHandle() const noexcept { return fd_; }

    /// family 는 주소 타입으로 정한다. AddressType::None 이면 invalid Socket.
    [[nodiscard]] static Socket createUdp(AddressType family) noexcept;
    [[nodiscard]] static Socket createTcp(AddressType family) noexcept;

    /// 이미 닫힌 소켓에 대해 호출해도 안전합니다.
    void close() noexcept;

    [[nodiscard]] bool setNonBlocking(bool enable) noexcept;
    [[nodiscard]] bool setReuseAddr(bool enable) noexcept;
    [[nodiscard]] bool setNoDelay(bool enable) noexcept;

    /// SO_RCVTIMEO / SO_SNDTIMEO. 0 이면 무제한.
    [[nodiscard]] bool setTimeouts(int timeoutMs) noexcept;

    /// UDP 송수신 버퍼 크기 (SO_SNDBUF/SO_RCVBUF)
    [[nodiscard]] bool setBufferSizes(int bytes) noexcept;

    [[nodiscard]] bool bind(const Address &address) noexcept;
    [[nodiscard]] bool listen(int backlog) noexcept;

    /// 실패 시 isValid()==false 인 Socket. peer 가 nullptr 이 아니면 원격 주소를 채운다.
    [[nodiscard]] Socket accept(Address *peer = nullptr) noexcept;

    [[nodiscard]] bool connect(const Address &address) noexcept;

    /// getsockname 결과. 포트 0 으로 bind 한 뒤 실제 포트를 알아낼 때 쓴다.
    [[nodiscard]] Address localAddress() const noexcept;

    /// send(2)/recv(2) thin 래퍼. 반환값과 errno 의미는 시스템 콜과 동일.
    [[nodiscard]] ::ssize_t send(const void *data, std::size_t len, int flags = 0) noexcept;
    [[nodiscard]] ::ssize_t recv(void *buffer, std::size_t len, int flags = 0) noexcept;

    /// len 바이트를 모두 보낼 때까지 반복. EINTR 은 재시도.
    [[nodiscard]] bool sendAll(const void *data, std::size_t len) noexcept;

    /// len 바이트를 모두 받을 때까지 반복. 상대가 먼저 닫으면 false (errno=ECONNRESET).
    [[nodiscard]] bool recvAll(void *buffer, std::size_t len) noexcept;

    /// sendto(2)/recvfrom(2) thin 래퍼 (UDP)
    [[nodiscard]] ::ssize_t sendTo(const Address &to, const void *data,
                                   std::size_t len) noexcept;
    [[nodiscard]] ::ssize_t recvFrom(void *buffer, std::size_t len, Address &from) noexcept;

  private:
    Handle fd_{-1};
};

} // namespace pulsenet::net
