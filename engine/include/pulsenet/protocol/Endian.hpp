#pragma once

#include <cstdint>

namespace pulsenet::protocol
{
// 와이어 정수는 전부 big-endian
inline void storeU16Be(std::uint16_t v, std::uint8_t out[2]) noexcept
{
    out[0] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
    out[1] = static_cast<std::uint8_t>(v & 0xFF);
}

inline void storeU32Be(std::uint32_t v, std::uint8_t out[4]) noexcept
{
    for (int i = 0; i < 4; ++i)
    {
        out[i] = static_cast<std::uint8_t>((v >> (24 - 8 * i)) & 0xFF);
    }
}

inline void storeU64Be(std::uint64_t v, std::uint8_t out[8]) noexcept
{
    for (int i = 0; i < 8; ++i)
    {
        out[i] = static_cast<std::uint8_t>((v >> (56 - 8 * i)) & 0xFF);
    }
}

inline std::uint16_t loadU16Be(const std::uint8_t *p) noexcept
{
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(p[0]) << 8) |
                                      static_cast<std::uint16_t>(p[1]));
}

inline std::uint32_t loadU32Be(const std::uint8_t *p) noexcept
{
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

inline std::uint64_t loadU64Be(const std::uint8_t *p) noexcept
{
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
    {
        v = (v << 8) | static_cast<std::uint64_t>(p[i]);
    }
    return v;
}
} // namespace pulsenet::protocol
