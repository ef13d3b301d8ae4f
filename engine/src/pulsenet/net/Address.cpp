#include <pulsenet/net/Address.hpp>

#include <charconv>
#include <cstring>
#include <format>

#include <arpa/inet.h>  // inet_pton, inet_ntop
#include <netinet/in.h> // sockaddr_in, sockaddr_in6

namespace pulsenet::net
{

namespace
{
bool parsePort(std::string_view s, std::uint16_t &out) noexcept
{
    if (s.empty())
        return false;
    unsigned v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || v > 65535)
        return false;
    out = static_cast<std::uint16_t>(v);
    return true;
}
} // namespace

Address::Address(std::string_view text)
{
    std::string_view host = text;
    std::uint16_t port = 0;

    if (!text.empty() && text.front() == '[')
    {
        // [v6] 또는 [v6]:port
        const auto close = text.find(']');
        if (close == std::string_view::npos)
            return;
        host = text.substr(1, close - 1);
        const auto rest = text.substr(close + 1);
        if (!rest.empty())
        {
            if (rest.front() != ':' || !parsePort(rest.substr(1), port))
                return;
        }
    }
    else
    {
        // ':' 가 정확히 하나면 host:port, 여러 개면 괄호 없는 v6 리터럴
        const auto colon = text.find(':');
        if (colon != std::string_view::npos && text.find(':', colon + 1) == std::string_view::npos)
        {
            host = text.substr(0, colon);
            if (!parsePort(text.substr(colon + 1), port))
                return;
        }
    }

    if (parseHost(host))
    {
        port_ = port;
    }
}

Address::Address(std::string_view host, std::uint16_t port)
{
    if (parseHost(host))
    {
        port_ = port;
    }
}

bool Address::parseHost(std::string_view host) noexcept
{
    // inet_pton 은 NUL 종료 문자열이 필요하다. INET6_ADDRSTRLEN(46) 이내만 허용.
    char buf[INET6_ADDRSTRLEN + 1];
    if (host.empty() || host.size() >= sizeof(buf))
        return false;
    std::memcpy(buf, host.data(), host.size());
    buf[host.size()] = '\0';

    ::in_addr v4{};
    if (::inet_pton(AF_INET, buf, &v4) == 1)
    {
        std::memcpy(bytes_.data(), &v4, 4);
        type_ = AddressType::IPv4;
        return true;
    }

    ::in6_addr v6{};
    if (::inet_pton(AF_INET6, buf, &v6) == 1)
    {
        std::memcpy(bytes_.data(), &v6, 16);
        type_ = AddressType::IPv6;
        return true;
    }
    return false;
}

Address Address::fromBytes(AddressType type, std::span<const std::uint8_t> ip,
                           std::uint16_t port) noexcept
{
    Address a;
    const std::size_t n = type == AddressType::IPv4 ? 4 : (type == AddressType::IPv6 ? 16 : 0);
    if (n == 0 || ip.size() < n)
        return a;
    std::memcpy(a.bytes_.data(), ip.data(), n);
    a.type_ = type;
    a.port_ = port;
    return a;
}

Address Address::fromSockaddr(const ::sockaddr_storage &ss) noexcept
{
    Address a;
    if (ss.ss_family == AF_INET)
    {
        const auto *in = reinterpret_cast<const ::sockaddr_in *>(&ss);
        std::memcpy(a.bytes_.data(), &in->sin_addr, 4);
        a.port_ = ntohs(in->sin_port);
        a.type_ = AddressType::IPv4;
    }
    else if (ss.ss_family == AF_INET6)
    {
        const auto *in6 = reinterpret_cast<const ::sockaddr_in6 *>(&ss);
        std::memcpy(a.bytes_.data(), &in6->sin6_addr, 16);
        a.port_ = ntohs(in6->sin6_port);
        a.type_ = AddressType::IPv6;
    }
    return a;
}

::socklen_t Address::toSockaddr(::sockaddr_storage &out) const noexcept
{
    std::memset(&out, 0, sizeof(out));
    if (type_ == AddressType::IPv4)
    {
        auto *in = reinterpret_cast<::sockaddr_in *>(&out);
        in->sin_family = AF_INET;
        in->sin_port = htons(port_);
        std::memcpy(&in->sin_addr, bytes_.data(), 4);
        return sizeof(::sockaddr_in);
    }
    if (type_ == AddressType::IPv6)
    {
        auto *in6 = reinterpret_cast<::sockaddr_in6 *>(&out);
        in6->sin6_family = AF_INET6;
        in6->sin6_port = htons(port_);
        std::memcpy(&in6->sin6_addr, bytes_.data(), 16);
        return sizeof(::sockaddr_in6);
    }
    return 0;
}

std::string Address::toString() const
{
    char buf[INET6_ADDRSTRLEN] = {};
    if (type_ == AddressType::IPv4)
    {
        ::inet_ntop(AF_INET, bytes_.data(), buf, sizeof(buf));
        return std::format("{}:{}", buf, port_);
    }
    if (type_ == AddressType::IPv6)
    {
        ::inet_ntop(AF_INET6, bytes_.data(), buf, sizeof(buf));
        return std::format("[{}]:{}", buf, port_);
    }
    return "NONE";
}

} // namespace pulsenet::net
