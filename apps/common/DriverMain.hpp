#pragma once

#include <pulsenet/Runtime.hpp>
#include <pulsenet/core/ConfigLoader.hpp>
#include <pulsenet/core/Logger.hpp>
#include <pulsenet/core/QuitFlag.hpp>
#include <pulsenet/core/SignalHandler.hpp>
#include <pulsenet/runtime/Drivers.hpp>

#include <exception>
#include <span>
#include <string>
#include <vector>

namespace pulsenet::apps
{

/// argv[1..] 을 위치 인자로. 드라이버에는 플래그가 없다.
inline std::vector<std::string> positionalArgs(int argc, char **argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);
    return args;
}

/// 설정 로드 -> Runtime -> 신호 핸들러 -> body. 예외는 FATAL 로그 후 1.
template <typename Body> int driverMain(const char *name, int argc, char **argv, Body &&body)
{
    try
    {
        const auto cfg = core::ConfigLoader::load();
        const auto args = positionalArgs(argc, argv);

        Runtime rt(cfg.log);
        core::QuitFlag quit;
        core::SignalHandler signals(quit);

        SLOG_INFO("App", "Start", "name={} args={}", name, args.size());

        const int rc =
            body(runtime::DriverEnv{rt, cfg, quit}, std::span<const std::string>(args));

        if (const int signo = core::SignalHandler::lastSignal(); signo != 0)
        {
            SLOG_INFO("App", "Interrupted", "signal={}", core::SignalHandler::signalName(signo));
        }
        SLOG_INFO("App", "Exit", "name={} rc={}", name, rc);
        return rc;
    }
    catch (const std::exception &e)
    {
        SLOG_FATAL("App", "Fatal", "name={} err={}", name, e.what());
        core::shutdownLogger();
        return 1;
    }
}

} // namespace pulsenet::apps
