#pragma once

#include <pulsenet/core/QuitFlag.hpp>
#include <pulsenet/util/NonCopyable.hpp>

#include <array>
#include <string_view>

#include <signal.h> // sigaction, SIGINT, SIGTERM

namespace pulsenet::core
{

/// SIGINT/SIGTERM 을 받으면 바인딩된 QuitFlag 를 올립니다.
///
/// - 설치 실패 시 std::system_error를 던집니다.
/// - 프로세스 전역 상태이므로 동시에 하나만 살아 있어야 합니다. (두 번째는 std::logic_error)
/// - 소멸 시 원래 핸들러로 복구합니다.
class SignalHandler : private pulsenet::util::NonCopyable
{
  public:
    explicit SignalHandler(QuitFlag &flag);
    ~SignalHandler() noexcept;

    SignalHandler(SignalHandler &&) = delete;
    SignalHandler &operator=(SignalHandler &&) = delete;

    /// 마지막으로 관측된 신호 번호 (없으면 0)
    [[nodiscard]] static int lastSignal() noexcept;

    [[nodiscard]] static std::string_view signalName(int signo) noexcept;

  private:
    static void handleSignal(int signo) noexcept;

    static constexpr std::array<int, 2> kSignals = {SIGINT, SIGTERM};

    std::array<struct sigaction, kSignals.size()> oldActions_{};
    bool installed_{false};

    void installOrThrow();
    void uninstall() noexcept;
};

} // namespace pulsenet::core
