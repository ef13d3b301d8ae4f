#pragma once

namespace pulsenet::util {

/// 복사와 대입을 금지하기 위한 베이스 클래스입니다.
///
/// - 세션/소켓/런타임처럼 "하나의 소유자"만 있어야 하는 타입이 상속합니다.
/// - 이동(move)은 기본 허용이며, 필요하면 파생 클래스에서 삭제합니다.
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &) = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&) = default;
    NonCopyable &operator=(NonCopyable &&) = default;
};

} // namespace pulsenet::util
