#pragma once

#include <pulsenet/util/NonCopyable.hpp>

#include <atomic>

namespace pulsenet::core
{

/// 드라이버 루프의 종료 요청 플래그.
///
/// - 드라이버가 소유하고, 루프 컨텍스트에는 참조로 넘깁니다.
/// - 쓰기: SignalHandler(신호 컨텍스트) 또는 다른 스레드. 읽기: 루프 매 iteration 시작.
/// - lock-free atomic 이어야 signal handler 안에서 건드릴 수 있다.
class QuitFlag : private pulsenet::util::NonCopyable
{
  public:
    QuitFlag() = default;

    QuitFlag(QuitFlag &&) = delete;
    QuitFlag &operator=(QuitFlag &&) = delete;

    void request() noexcept { requested_.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool requested() const noexcept
    {
        return requested_.load(std::memory_order_relaxed);
    }
    void reset() noexcept { requested_.store(false, std::memory_order_relaxed); }

  private:
    static_assert(std::atomic<bool>::is_always_lock_free);
    std::atomic<bool> requested_{false};
};

} // namespace pulsenet::core
