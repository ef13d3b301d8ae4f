#pragma once

#include <pulsenet/core/GlobalConfig.hpp>
#include <pulsenet/util/NonCopyable.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace pulsenet
{

/// 프로세스 전역 라이브러리 수명 컨텍스트.
///
/// - 생성: 로깅 설정 반영 + OpenSSL 초기화. 실패 시 예외.
/// - 어떤 세션 객체보다 먼저 만들고, 마지막 세션이 사라진 뒤 파괴합니다.
/// - 동시에 두 개가 살아 있으면 std::logic_error.
/// - 파괴 시 전역 로거를 flush + 종료합니다.
class Runtime : private util::NonCopyable
{
  public:
    explicit Runtime(const core::LogSettings &logSettings = {});
    ~Runtime();

    Runtime(Runtime &&) = delete;
    Runtime &operator=(Runtime &&) = delete;

    /// 이 객체가 현재 프로세스의 활성 Runtime 인지
    [[nodiscard]] bool isInitialized() const noexcept;

    /// 세션 생성자 등이 호출. 활성 Runtime 이 아니면 std::logic_error.
    void requireInitialized(const char *who) const;

    /// CSPRNG (OpenSSL RAND_bytes). 실패 시 std::runtime_error.
    void randomBytes(std::span<std::uint8_t> out) const;
    [[nodiscard]] std::uint64_t randomU64() const;

    /// connect token 타임스탬프용 unix seconds
    [[nodiscard]] std::uint64_t unixTimeSeconds() const noexcept;
};

} // namespace pulsenet
