#pragma once

#include <pulsenet/protocol/Endian.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

namespace pulsenet::protocol
{

/// 바이트 단위 필드 인코더/디코더 (패킷 헤더, connect token, 매처 프레임)
///
/// - 모든 정수 필드는 big-endian.
/// - struct 통째 memcpy 금지. 필드 단위로 명시적으로 write/read 한다.
/// - 인스턴스 자체는 thread-safe 가 아니다(일반 값 객체).
class ByteWriter
{
  public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t reserveBytes) { buf_.reserve(reserveBytes); }

    void clear() noexcept { buf_.clear(); }
    [[nodiscard]] std::size_t size() const noexcept { return buf_.size(); }
    [[nodiscard]] const std::vector<std::uint8_t> &buffer() const noexcept { return buf_; }
    [[nodiscard]] std::vector<std::uint8_t> release() noexcept { return std::move(buf_); }

    void writeU8(std::uint8_t v) { buf_.push_back(v); }

    void writeU16Be(std::uint16_t v)
    {
        std::uint8_t tmp[2];
        storeU16Be(v, tmp);
        buf_.insert(buf_.end(), tmp, tmp + 2);
    }

    void writeU32Be(std::uint32_t v)
    {
        std::uint8_t tmp[4];
        storeU32Be(v, tmp);
        buf_.insert(buf_.end(), tmp, tmp + 4);
    }

    void writeU64Be(std::uint64_t v)
    {
        std::uint8_t tmp[8];
        storeU64Be(v, tmp);
        buf_.insert(buf_.end(), tmp, tmp + 8);
    }

    void writeBytes(std::span<const std::uint8_t> bytes)
    {
        buf_.insert(buf_.end(), bytes.begin(), bytes.end());
    }

    /// 현재 크기가 size 가 될 때까지 0 으로 채운다.
    void padTo(std::size_t size)
    {
        if (buf_.size() < size)
        {
            buf_.resize(size, 0);
        }
    }

  private:
    std::vector<std::uint8_t> buf_;
};

class ByteReader
{
  public:
    explicit ByteReader(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] std::size_t offset() const noexcept { return off_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - off_; }
    [[nodiscard]] bool atEnd() const noexcept { return off_ == data_.size(); }

    bool readU8(std::uint8_t &out) noexcept
    {
        if (!ensure(1))
            return false;
        out = data_[off_];
        off_ += 1;
        return true;
    }

    bool readU16Be(std::uint16_t &out) noexcept
    {
        if (!ensure(2))
            return false;
        out = loadU16Be(data_.data() + off_);
        off_ += 2;
        return true;
    }

    bool readU32Be(std::uint32_t &out) noexcept
    {
        if (!ensure(4))
            return false;
        out = loadU32Be(data_.data() + off_);
        off_ += 4;
        return true;
    }

    bool readU64Be(std::uint64_t &out) noexcept
    {
        if (!ensure(8))
            return false;
        out = loadU64Be(data_.data() + off_);
        off_ += 8;
        return true;
    }

    bool readBytes(std::span<std::uint8_t> out) noexcept
    {
        if (!ensure(out.size()))
            return false;
        if (!out.empty())
            std::memcpy(out.data(), data_.data() + off_, out.size());
        off_ += out.size();
        return true;
    }

    /// 복사 없이 view 로 읽는다(원본 버퍼 수명은 호출자가 관리).
    bool readView(std::size_t len, std::span<const std::uint8_t> &out) noexcept
    {
        if (!ensure(len))
            return false;
        out = data_.subspan(off_, len);
        off_ += len;
        return true;
    }

    bool skip(std::size_t len) noexcept
    {
        if (!ensure(len))
            return false;
        off_ += len;
        return true;
    }

  private:
    [[nodiscard]] bool ensure(std::size_t n) const noexcept { return n <= data_.size() - off_; }

    std::span<const std::uint8_t> data_{};
    std::size_t off_{0};
};

} // namespace pulsenet::protocol
