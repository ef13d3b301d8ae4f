#include <pulsenet/net/Address.hpp>

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

#include <netinet/in.h>

using pulsenet::net::Address;
using pulsenet::net::AddressType;

static bool test_parse_forms()
{
    const Address v4("127.0.0.1:40001");
    assert(v4.isValid());
    assert(v4.type() == AddressType::IPv4);
    assert(v4.port() == 40001);
    assert(v4.toString() == "127.0.0.1:40001");

    const Address v4NoPort("10.0.0.2");
    assert(v4NoPort.isValid() && v4NoPort.port() == 0);

    const Address v6("[::1]:40001");
    assert(v6.isValid());
    assert(v6.type() == AddressType::IPv6);
    assert(v6.port() == 40001);
    assert(v6.toString() == "[::1]:40001");

    const Address v6Bare("::1");
    assert(v6Bare.isValid() && v6Bare.type() == AddressType::IPv6 && v6Bare.port() == 0);

    const Address split("0.0.0.0", 5000);
    assert(split.isValid() && split.port() == 5000);

    return true;
}

static bool test_invalid_inputs()
{
    const char *bad[] = {"",          "localhost:40001", "127.0.0.1:",  "127.0.0.1:70000",
                         "[::1",      "[::1]40001",      "1.2.3.4:abc", "300.1.1.1"};
    for (const char *text : bad)
    {
        const Address a(text);
        if (a.isValid())
        {
            std::cerr << "[invalid] accepted '" << text << "'\n";
            return false;
        }
        if (a.toString() != "NONE")
        {
            std::cerr << "[invalid] toString for '" << text << "' = " << a.toString() << "\n";
            return false;
        }
    }
    return true;
}

static bool test_equality()
{
    assert(Address("127.0.0.1:1") == Address("127.0.0.1", 1));
    assert(!(Address("127.0.0.1:1") == Address("127.0.0.1:2")));
    assert(!(Address("127.0.0.1:1") == Address("127.0.0.2:1")));
    assert(!(Address("[::1]:1") == Address("127.0.0.1:1")));
    assert(Address() == Address());
    return true;
}

static bool test_sockaddr_round_trip()
{
    const Address original("[fe80::1]:1234");
    ::sockaddr_storage ss{};
    const ::socklen_t len = original.toSockaddr(ss);
    assert(len == sizeof(::sockaddr_in6));
    assert(ss.ss_family == AF_INET6);
    assert(Address::fromSockaddr(ss) == original);

    ::sockaddr_storage none{};
    assert(Address().toSockaddr(none) == 0);
    none.ss_family = AF_UNIX;
    assert(!Address::fromSockaddr(none).isValid());
    return true;
}

static bool test_from_bytes()
{
    const std::uint8_t ip[4] = {192, 168, 0, 7};
    const Address a = Address::fromBytes(AddressType::IPv4, ip, 99);
    assert(a == Address("192.168.0.7:99"));

    // IPv6 인데 4 bytes 만 주면 invalid
    assert(!Address::fromBytes(AddressType::IPv6, ip, 99).isValid());
    assert(!Address::fromBytes(AddressType::None, ip, 99).isValid());
    return true;
}

int main()
{
    bool ok = true;
    ok = ok && test_parse_forms();
    ok = ok && test_invalid_inputs();
    ok = ok && test_equality();
    ok = ok && test_sockaddr_round_trip();
    ok = ok && test_from_bytes();

    if (!ok)
    {
        std::cerr << "Address tests FAILED\n";
        return 1;
    }

    std::cout << "Address tests PASSED\n";
    return 0;
}
