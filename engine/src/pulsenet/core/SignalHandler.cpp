#include <pulsenet/core/SignalHandler.hpp>

#include <atomic>
#include <csignal>
#include <stdexcept>
#include <system_error>

#include <errno.h>

namespace pulsenet::core
{

namespace
{
// 핸들러가 접근하는 전역은 lock-free atomic 뿐이다.
std::atomic<QuitFlag *> g_flag{nullptr};
volatile std::sig_atomic_t g_lastSignal = 0;

static_assert(std::atomic<QuitFlag *>::is_always_lock_free);
} // namespace

SignalHandler::SignalHandler(QuitFlag &flag)
{
    QuitFlag *expected = nullptr;
    if (!g_flag.compare_exchange_strong(expected, &flag))
    {
        throw std::logic_error("SignalHandler: another instance is already installed");
    }

    try
    {
        installOrThrow();
    }
    catch (...)
    {
        g_flag.store(nullptr);
        throw;
    }
}

SignalHandler::~SignalHandler() noexcept
{
    uninstall();
    g_flag.store(nullptr);
}

void SignalHandler::installOrThrow()
{
    // SA_RESTART 없음: 루프의 sleep/recv 가 EINTR 로 깨어나 플래그를 바로 본다.
    struct sigaction sa{};
    sa.sa_handler = &SignalHandler::handleSignal;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    for (std::size_t i = 0; i < kSignals.size(); ++i)
    {
        if (::sigaction(kSignals[i], &sa, &oldActions_[i]) != 0)
        {
            const int err = errno;
            for (std::size_t j = 0; j < i; ++j)
            {
                (void)::sigaction(kSignals[j], &oldActions_[j], nullptr);
            }
            throw std::system_error(err, std::generic_category(),
                                    "SignalHandler: sigaction failed");
        }
    }

    installed_ = true;
}

void SignalHandler::uninstall() noexcept
{
    if (!installed_)
    {
        return;
    }

    for (std::size_t i = 0; i < kSignals.size(); ++i)
    {
        (void)::sigaction(kSignals[i], &oldActions_[i], nullptr);
    }
    installed_ = false;
}

void SignalHandler::handleSignal(int signo) noexcept
{
    // 절대 금지: 로그, malloc/new, mutex, format, iostream
    g_lastSignal = signo;
    if (QuitFlag *flag = g_flag.load())
    {
        flag->request();
    }
}

int SignalHandler::lastSignal() noexcept
{
    return static_cast<int>(g_lastSignal);
}

std::string_view SignalHandler::signalName(int signo) noexcept
{
    switch (signo)
    {
    case SIGINT:
        return "SIGINT";
    case SIGTERM:
        return "SIGTERM";
    default:
        return "UNKNOWN";
    }
}

} // namespace pulsenet::core
