#include <pulsenet/net/Socket.hpp>

#include <cerrno>

#include <fcntl.h>       // fcntl, O_NONBLOCK
#include <netinet/in.h>  // AF_INET, AF_INET6
#include <netinet/tcp.h> // TCP_NODELAY
#include <sys/time.h>    // timeval
#include <unistd.h>      // close

namespace pulsenet::net
{

namespace
{
int toFamily(AddressType type) noexcept
{
    switch (type)
    {
    case AddressType::IPv4:
        return AF_INET;
    case AddressType::IPv6:
        return AF_INET6;
    case AddressType::None:
        break;
    }
    return -1;
}

Socket createSocket(AddressType type, int sockType) noexcept
{
    const int family = toFamily(type);
    if (family < 0)
    {
        errno = EAFNOSUPPORT;
        return Socket{};
    }

    const int fd = ::socket(family, sockType | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        return Socket{};
    }
    return Socket{fd};
}
} // namespace

Socket::Socket(Handle fd) noexcept : fd_(fd) {}

Socket::~Socket() noexcept
{
    close();
}

Socket::Socket(Socket &&other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

Socket &Socket::operator=(Socket &&other) noexcept
{
    if (this != &other)
    {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Socket Socket::createUdp(AddressType family) noexcept
{
    return createSocket(family, SOCK_DGRAM);
}

Socket Socket::createTcp(AddressType family) noexcept
{
    return createSocket(family, SOCK_STREAM);
}

void Socket::close() noexcept
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

bool Socket::setNonBlocking(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags == -1)
    {
        return false;
    }

    const int newFlags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd_, F_SETFL, newFlags) != -1;
}

bool Socket::setReuseAddr(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int opt = enable ? 1 : 0;
    return ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != -1;
}

bool Socket::setNoDelay(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int opt = enable ? 1 : 0;
    return ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) != -1;
}

bool Socket::setTimeouts(int timeoutMs) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    ::timeval tv{};
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1)
    {
        return false;
    }
    return ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != -1;
}

bool Socket::setBufferSizes(int bytes) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    if (::setsockopt(fd_, SOL_SOCKET, SO_SNDBUF, &bytes, sizeof(bytes)) == -1)
    {
        return false;
    }
    return ::setsockopt(fd_, SOL_SOCKET, SO_RCVBUF, &bytes, sizeof(bytes)) != -1;
}

bool Socket::bind(const Address &address) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    ::sockaddr_storage ss{};
    const ::socklen_t len = address.toSockaddr(ss);
    if (len == 0)
    {
        errno = EINVAL;
        return false;
    }
    return ::bind(fd_, reinterpret_cast<const ::sockaddr *>(&ss), len) != -1;
}

bool Socket::listen(int backlog) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }
    return ::listen(fd_, backlog) != -1;
}

Socket Socket::accept(Address *peer) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return Socket{};
    }

    ::sockaddr_storage ss{};
    ::socklen_t len = sizeof(ss);
    const int newFd = ::accept4(fd_, reinterpret_cast<::sockaddr *>(&ss), &len, SOCK_CLOEXEC);
    if (newFd < 0)
    {
        return Socket{};
    }

    if (peer)
    {
        *peer = Address::fromSockaddr(ss);
    }
    return Socket{newFd};
}

bool Socket::connect(const Address &address) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    ::sockaddr_storage ss{};
    const ::socklen_t len = address.toSockaddr(ss);
    if (len == 0)
    {
        errno = EINVAL;
        return false;
    }
    return ::connect(fd_, reinterpret_cast<const ::sockaddr *>(&ss), len) != -1;
}

Address Socket::localAddress() const noexcept
{
    ::sockaddr_storage ss{};
    ::socklen_t len = sizeof(ss);
    if (!isValid() || ::getsockname(fd_, reinterpret_cast<::sockaddr *>(&ss), &len) == -1)
    {
        return Address{};
    }
    return Address::fromSockaddr(ss);
}

::ssize_t Socket::send(const void *data, std::size_t len, int flags) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }
    return ::send(fd_, data, len, flags | MSG_NOSIGNAL);
}

::ssize_t Socket::recv(void *buffer, std::size_t len, int flags) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }
    return ::recv(fd_, buffer, len, flags);
}

bool Socket::sendAll(const void *data, std::size_t len) noexcept
{
    const auto *p = static_cast<const std::uint8_t *>(data);
    std::size_t sent = 0;
    while (sent < len)
    {
        const ::ssize_t n = send(p + sent, len - sent);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

bool Socket::recvAll(void *buffer, std::size_t len) noexcept
{
    auto *p = static_cast<std::uint8_t *>(buffer);
    std::size_t got = 0;
    while (got < len)
    {
        const ::ssize_t n = recv(p + got, len - got);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        if (n == 0)
        {
            errno = ECONNRESET;
            return false;
        }
        got += static_cast<std::size_t>(n);
    }
    return true;
}

::ssize_t Socket::sendTo(const Address &to, const void *data, std::size_t len) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }

    ::sockaddr_storage ss{};
    const ::socklen_t slen = to.toSockaddr(ss);
    if (slen == 0)
    {
        errno = EINVAL;
        return -1;
    }
    return ::sendto(fd_, data, len, MSG_NOSIGNAL, reinterpret_cast<const ::sockaddr *>(&ss),
                    slen);
}

::ssize_t Socket::recvFrom(void *buffer, std::size_t len, Address &from) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }

    ::sockaddr_storage ss{};
    ::socklen_t slen = sizeof(ss);
    const ::ssize_t n =
        ::recvfrom(fd_, buffer, len, 0, reinterpret_cast<::sockaddr *>(&ss), &slen);
    if (n >= 0)
    {
        from = Address::fromSockaddr(ss);
    }
    return n;
}

} // namespace pulsenet::net
