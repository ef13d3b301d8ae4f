#pragma once

#include <pulsenet/util/NonCopyable.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace pulsenet::core
{

enum class LogLevel : int
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

namespace detail
{
// 전역 로거의 최소 레벨 사본. 세션 루프에서 format 전에 걸러낸다.
std::atomic<int> &fastMinLevel();
} // namespace detail

inline bool fastEnabled(LogLevel level) noexcept
{
    return static_cast<int>(level) >= detail::fastMinLevel().load(std::memory_order_relaxed);
}

class ILogger : private pulsenet::util::NonCopyable
{
  public:
    virtual ~ILogger() = default;

    [[nodiscard]] virtual LogLevel minLevel() const noexcept { return LogLevel::Trace; }
    virtual void shutdown() noexcept {}

    // "comp | evt | key=value..." 형태의 payload 만 받는다. prefix 는 구현체가 붙인다.
    virtual void log(LogLevel level, std::string_view message) = 0;
};

/// 비동기 writer 스레드 1개를 가진 기본 로거.
///
/// - sink 스트림의 수명을 같이 소유한다. (clog 처럼 소유하지 않을 스트림은 no-op deleter)
/// - 대기열이 maxPending 을 넘으면 새 로그를 버리고 개수만 센다. 고정 timestep 루프가
///   로그 I/O 때문에 멈추지 않게 한다. 버린 개수는 다음 flush 때 한 줄로 남긴다.
class Logger final : public ILogger
{
  public:
    static constexpr std::size_t kDefaultMaxPending = 64 * 1024;

    explicit Logger(std::shared_ptr<std::ostream> sink, LogLevel minLevel = LogLevel::Info,
                    std::size_t maxPending = kDefaultMaxPending);
    ~Logger() override;

    void log(LogLevel level, std::string_view message) override;

    [[nodiscard]] LogLevel minLevel() const noexcept override;

    /// 지금까지 대기열 초과로 버린 로그 수
    [[nodiscard]] std::uint64_t droppedCount() const noexcept;

    // writer 스레드 조인 + 잔여 로그 flush. 여러 번 불러도 된다.
    void shutdown() noexcept override;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// std::clog 로 쓰는 기본 로거. Runtime 전에도 로그가 유실되지 않게 한다.
[[nodiscard]] std::shared_ptr<Logger> makeConsoleLogger(LogLevel minLevel = LogLevel::Info);

ILogger &getLogger();
void setLogger(std::shared_ptr<ILogger> logger) noexcept;
void shutdownLogger() noexcept;

// =============================================================================
// Structured Logging Frontend
//   "HH:MM:SS.uuuuuu | main tid=123 | INFO  | Client | Connected | index=0 max=64"
// =============================================================================
namespace slog
{
inline std::string build(std::string_view comp, std::string_view evt, std::string_view details)
{
    if (details.empty())
        return std::format("{} | {}", comp, evt);
    return std::format("{} | {} | {}", comp, evt, details);
}

inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt)
{
    if (!fastEnabled(lvl))
        return;
    getLogger().log(lvl, build(comp, evt, {}));
}

template <typename... Args>
inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt,
                 std::format_string<Args...> fmt, Args &&...args)
{
    if (!fastEnabled(lvl))
        return;
    getLogger().log(lvl, build(comp, evt, std::format(fmt, std::forward<Args>(args)...)));
}
} // namespace slog

#define PULSENET_SLOG(lvl, comp, evt, ...)                                                         \
    ::pulsenet::core::slog::emit(::pulsenet::core::LogLevel::lvl, (comp),                          \
                                 (evt)__VA_OPT__(, ) __VA_ARGS__)

#define SLOG_TRACE(comp, evt, ...) PULSENET_SLOG(Trace, comp, evt __VA_OPT__(, ) __VA_ARGS__)
#define SLOG_DEBUG(comp, evt, ...) PULSENET_SLOG(Debug, comp, evt __VA_OPT__(, ) __VA_ARGS__)
#define SLOG_INFO(comp, evt, ...) PULSENET_SLOG(Info, comp, evt __VA_OPT__(, ) __VA_ARGS__)
#define SLOG_WARN(comp, evt, ...) PULSENET_SLOG(Warn, comp, evt __VA_OPT__(, ) __VA_ARGS__)
#define SLOG_ERROR(comp, evt, ...) PULSENET_SLOG(Error, comp, evt __VA_OPT__(, ) __VA_ARGS__)
#define SLOG_FATAL(comp, evt, ...) PULSENET_SLOG(Fatal, comp, evt __VA_OPT__(, ) __VA_ARGS__)

} // namespace pulsenet::core
