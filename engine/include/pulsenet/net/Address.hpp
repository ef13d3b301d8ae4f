#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <sys/socket.h> // sockaddr_storage, socklen_t

namespace pulsenet::net
{

enum class AddressType : std::uint8_t
{
    None = 0,
    IPv4 = 1,
    IPv6 = 2
};

/// IPv4/IPv6 리터럴 + 포트.
///
/// - "127.0.0.1", "127.0.0.1:40001", "::1", "[::1]:40001" 형식만 받습니다. DNS 조회 없음.
/// - 파싱 실패는 예외가 아니라 isValid()==false 로 표현됩니다. 호출자가 확인해야 합니다.
class Address
{
  public:
    Address() noexcept = default;
    explicit Address(std::string_view text);
    Address(std::string_view host, std::uint16_t port);

    /// 와이어에서 읽은 원시 바이트로 생성. IPv4 는 4 bytes, IPv6 는 16 bytes 필요.
    static Address fromBytes(AddressType type, std::span<const std::uint8_t> ip,
                             std::uint16_t port) noexcept;

    /// sockaddr_in / sockaddr_in6 에서 생성. 그 외 family 면 invalid.
    static Address fromSockaddr(const ::sockaddr_storage &ss) noexcept;

    [[nodiscard]] bool isValid() const noexcept { return type_ != AddressType::None; }
    [[nodiscard]] AddressType type() const noexcept { return type_; }

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
    void setPort(std::uint16_t port) noexcept { port_ = port; }

    /// IPv4 는 앞 4 bytes, IPv6 는 16 bytes 사용
    [[nodiscard]] const std::array<std::uint8_t, 16> &bytes() const noexcept { return bytes_; }

    /// "a.b.c.d:port" / "[v6]:port". invalid 면 "NONE".
    [[nodiscard]] std::string toString() const;

    /// 소켓 API 용 변환. invalid 면 0 반환.
    ::socklen_t toSockaddr(::sockaddr_storage &out) const noexcept;

    friend bool operator==(const Address &a, const Address &b) noexcept
    {
        if (a.type_ != b.type_ || a.port_ != b.port_)
            return false;
        const std::size_t n = a.type_ == AddressType::IPv4 ? 4 : 16;
        for (std::size_t i = 0; i < n; ++i)
        {
            if (a.bytes_[i] != b.bytes_[i])
                return false;
        }
        return true;
    }

  private:
    bool parseHost(std::string_view host) noexcept;

    AddressType type_{AddressType::None};
    std::array<std::uint8_t, 16> bytes_{};
    std::uint16_t port_{0};
};

} // namespace pulsenet::net
