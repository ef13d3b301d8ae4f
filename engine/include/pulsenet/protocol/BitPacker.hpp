#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace pulsenet::protocol
{

/// MSB-first 비트 스트림 writer.
///
/// - 용량(비트)을 넘는 쓰기는 실패(false)하고 overflowed() 가 올라간다. 이후 쓰기는 모두 실패.
/// - bits 는 [1, 32].
class BitWriter
{
  public:
    explicit BitWriter(std::size_t capacityBits) : capacityBits_(capacityBits)
    {
        buf_.reserve((capacityBits + 7) / 8);
    }

    bool writeBits(std::uint32_t value, int bits)
    {
        if (overflow_ || bits < 1 || bits > 32 ||
            bitsWritten_ + static_cast<std::size_t>(bits) > capacityBits_)
        {
            overflow_ = true;
            return false;
        }

        for (int i = bits - 1; i >= 0; --i)
        {
            const std::size_t byteIndex = bitsWritten_ / 8;
            if (byteIndex == buf_.size())
                buf_.push_back(0);
            if ((value >> i) & 1u)
                buf_[byteIndex] |= static_cast<std::uint8_t>(0x80u >> (bitsWritten_ % 8));
            ++bitsWritten_;
        }
        return true;
    }

    bool writeBool(bool v) { return writeBits(v ? 1u : 0u, 1); }

    /// 다른 writer 의 내용을 비트 단위 그대로 이어 붙인다.
    bool append(const BitWriter &other)
    {
        std::size_t left = other.bitsWritten_;
        std::size_t pos = 0;
        while (left > 0)
        {
            const int n = left >= 8 ? 8 : static_cast<int>(left);
            const std::uint8_t byte = other.buf_[pos / 8];
            if (!writeBits(static_cast<std::uint32_t>(byte >> (8 - n)), n))
                return false;
            pos += static_cast<std::size_t>(n);
            left -= static_cast<std::size_t>(n);
        }
        return true;
    }

    [[nodiscard]] std::size_t bitsWritten() const noexcept { return bitsWritten_; }
    [[nodiscard]] std::size_t bytesWritten() const noexcept { return (bitsWritten_ + 7) / 8; }
    [[nodiscard]] std::size_t bitsAvailable() const noexcept
    {
        return capacityBits_ - bitsWritten_;
    }
    [[nodiscard]] bool overflowed() const noexcept { return overflow_; }

    /// 마지막 바이트의 남는 비트는 0
    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return buf_; }

  private:
    std::vector<std::uint8_t> buf_;
    std::size_t capacityBits_;
    std::size_t bitsWritten_{0};
    bool overflow_{false};
};

/// MSB-first 비트 스트림 reader.
///
/// - [beginBit, endBit) 범위만 읽는다. 범위를 넘는 읽기는 실패(false).
/// - slice(n) 은 다음 n 비트만 볼 수 있는 하위 reader 를 만들고, 자신은 n 비트 전진한다.
class BitReader
{
  public:
    BitReader() noexcept : pos_(0), end_(0) {}

    explicit BitReader(std::span<const std::uint8_t> data) noexcept
        : data_(data), pos_(0), end_(data.size() * 8)
    {
    }

    BitReader(std::span<const std::uint8_t> data, std::size_t numBits) noexcept
        : data_(data), pos_(0), end_(numBits <= data.size() * 8 ? numBits : data.size() * 8)
    {
    }

    bool readBits(std::uint32_t &out, int bits) noexcept
    {
        if (bits < 1 || bits > 32 || static_cast<std::size_t>(bits) > bitsRemaining())
            return false;

        std::uint32_t v = 0;
        for (int i = 0; i < bits; ++i)
        {
            const std::uint8_t byte = data_[pos_ / 8];
            const std::uint32_t bit = (byte >> (7 - (pos_ % 8))) & 1u;
            v = (v << 1) | bit;
            ++pos_;
        }
        out = v;
        return true;
    }

    bool readBool(bool &out) noexcept
    {
        std::uint32_t v = 0;
        if (!readBits(v, 1))
            return false;
        out = (v != 0);
        return true;
    }

    bool slice(std::size_t numBits, BitReader &out) noexcept
    {
        if (numBits > bitsRemaining())
            return false;
        out = BitReader(data_, pos_, pos_ + numBits);
        pos_ += numBits;
        return true;
    }

    [[nodiscard]] std::size_t bitsRead() const noexcept { return pos_ - begin_; }
    [[nodiscard]] std::size_t bitsRemaining() const noexcept { return end_ - pos_; }
    [[nodiscard]] bool atEnd() const noexcept { return pos_ == end_; }

  private:
    BitReader(std::span<const std::uint8_t> data, std::size_t begin, std::size_t end) noexcept
        : data_(data), begin_(begin), pos_(begin), end_(end)
    {
    }

    std::span<const std::uint8_t> data_;
    std::size_t begin_{0};
    std::size_t pos_;
    std::size_t end_;
};

} // namespace pulsenet::protocol
