#include <pulsenet/core/Logger.hpp>

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include <sys/syscall.h> // SYS_gettid
#include <unistd.h>      // isatty, syscall

namespace pulsenet::core
{

namespace detail
{
std::atomic<int> &fastMinLevel()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}
} // namespace detail

namespace
{
long currentTid() noexcept
{
    thread_local long tid = static_cast<long>(::syscall(SYS_gettid));
    return tid;
}

// writer 스레드만 "log", 나머지는 "main"
thread_local const char *t_threadTag = "main";

const char *levelColor(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "\x1b[90m";
    case LogLevel::Debug:
        return "\x1b[36m";
    case LogLevel::Info:
        return "\x1b[32m";
    case LogLevel::Warn:
        return "\x1b[33m";
    case LogLevel::Error:
    case LogLevel::Fatal:
        return "\x1b[31m";
    }
    return "";
}

const char *logLevelName(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    }
    return "INFO";
}

struct LogRecord
{
    LogLevel level{};
    std::chrono::system_clock::time_point timestamp;
    const char *threadTag{""};
    long threadId{0};
    std::string message;
};
} // namespace

class Logger::Impl
{
  public:
    Impl(std::shared_ptr<std::ostream> sink, LogLevel minLevel, std::size_t maxPending)
        : sink_(std::move(sink)), maxPending_(maxPending), minLevel_(minLevel)
    {
        // 터미널로 가는 표준 스트림일 때만 색을 입힌다.
        const std::ostream *os = sink_.get();
        if (os == &std::clog || os == &std::cerr)
            useColor_ = ::isatty(STDERR_FILENO) != 0;
        else if (os == &std::cout)
            useColor_ = ::isatty(STDOUT_FILENO) != 0;

        writer_ = std::thread([this]() {
            t_threadTag = "log";
            drainLoop();
        });
    }

    ~Impl() { shutdown(); }

    void shutdown() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
                return;
            stopping_ = true;
        }
        cv_.notify_all();
        if (writer_.joinable())
            writer_.join();
    }

    void push(LogLevel level, std::string_view message)
    {
        if (level < minLevel_)
            return;

        LogRecord rec{level, std::chrono::system_clock::now(), t_threadTag, currentTid(),
                      std::string(message)};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
                return;
            if (pending_.size() >= maxPending_)
            {
                ++droppedSinceFlush_;
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            pending_.push_back(std::move(rec));
        }
        cv_.notify_one();
    }

    LogLevel minLevel() const noexcept { return minLevel_; }
    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

  private:
    void drainLoop()
    {
        std::vector<LogRecord> batch;
        while (true)
        {
            std::uint64_t droppedNow = 0;
            bool last = false;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });
                batch.swap(pending_);
                droppedNow = std::exchange(droppedSinceFlush_, 0);
                last = stopping_;
            }

            for (const auto &rec : batch)
                write(rec);
            if (droppedNow != 0)
            {
                write(LogRecord{LogLevel::Warn, std::chrono::system_clock::now(), "log",
                                currentTid(),
                                std::format("Logger | Dropped | count={}", droppedNow)});
            }
            batch.clear();
            sink_->flush();

            if (last)
                return;
        }
    }

    void write(const LogRecord &rec)
    {
        using namespace std::chrono;

        const auto t = system_clock::to_time_t(rec.timestamp);
        std::tm tm{};
        ::localtime_r(&t, &tm);
        const auto us = duration_cast<microseconds>(rec.timestamp.time_since_epoch()) % seconds(1);

        const char *on = useColor_ ? levelColor(rec.level) : "";
        const char *off = useColor_ ? "\x1b[0m" : "";

        *sink_ << std::format("{:02d}:{:02d}:{:02d}.{:06d} | {} tid={} | {}{:<5}{} | {}\n",
                              tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(us.count()),
                              rec.threadTag, rec.threadId, on, logLevelName(rec.level), off,
                              rec.message);
    }

    std::shared_ptr<std::ostream> sink_;
    const std::size_t maxPending_;
    const LogLevel minLevel_;
    bool useColor_{false};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<LogRecord> pending_;
    std::uint64_t droppedSinceFlush_{0};
    bool stopping_{false};

    std::atomic<std::uint64_t> dropped_{0};
    std::thread writer_;
};

Logger::Logger(std::shared_ptr<std::ostream> sink, LogLevel minLevel, std::size_t maxPending)
    : impl_(std::make_unique<Impl>(std::move(sink), minLevel, maxPending))
{
}

Logger::~Logger() = default;

void Logger::log(LogLevel level, std::string_view message)
{
    impl_->push(level, message);
}

LogLevel Logger::minLevel() const noexcept
{
    return impl_->minLevel();
}

std::uint64_t Logger::droppedCount() const noexcept
{
    return impl_->dropped();
}

void Logger::shutdown() noexcept
{
    impl_->shutdown();
}

std::shared_ptr<Logger> makeConsoleLogger(LogLevel minLevel)
{
    std::shared_ptr<std::ostream> clog(&std::clog, [](std::ostream *) {});
    return std::make_shared<Logger>(std::move(clog), minLevel);
}

// ===== Global Instance =====

namespace
{
std::shared_ptr<ILogger> &globalLogger()
{
    static std::shared_ptr<ILogger> logger = makeConsoleLogger();
    return logger;
}
} // namespace

ILogger &getLogger()
{
    auto &instance = globalLogger();
    if (!instance)
        instance = makeConsoleLogger(static_cast<LogLevel>(detail::fastMinLevel().load()));
    return *instance;
}

void setLogger(std::shared_ptr<ILogger> logger) noexcept
{
    const LogLevel level = logger ? logger->minLevel() : LogLevel::Info;
    detail::fastMinLevel().store(static_cast<int>(level), std::memory_order_relaxed);

    auto old = std::exchange(globalLogger(), std::move(logger));
    if (old)
        old->shutdown();
}

void shutdownLogger() noexcept
{
    auto &instance = globalLogger();
    if (!instance)
        return;
    instance->shutdown();
    instance.reset();
}

} // namespace pulsenet::core
