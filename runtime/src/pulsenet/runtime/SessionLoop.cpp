#include <pulsenet/runtime/SessionLoop.hpp>

#include <pulsenet/core/Logger.hpp>

#include <chrono>
#include <thread>

namespace pulsenet::runtime
{

namespace
{
void idleOnce(const LoopContext &ctx)
{
    if (ctx.idle)
        ctx.idle(ctx.deltaTime);
    else
        sleepSeconds(ctx.deltaTime);
}

bool iterationLimitReached(const LoopContext &ctx, std::uint64_t iterations) noexcept
{
    return ctx.maxIterations != 0 && iterations >= ctx.maxIterations;
}

LoopResult finish(LoopExit exit, double time, std::uint64_t iterations, const char *who)
{
    SLOG_INFO("SessionLoop", "Exit", "loop={} reason={} time={:.2f} iterations={}", who,
              loopExitName(exit), time, iterations);
    return LoopResult{exit, time, iterations};
}
} // namespace

const char *loopExitName(LoopExit exit) noexcept
{
    switch (exit)
    {
    case LoopExit::QuitRequested:
        return "QuitRequested";
    case LoopExit::Disconnected:
        return "Disconnected";
    case LoopExit::ConnectionFailed:
        return "ConnectionFailed";
    case LoopExit::ServerStopped:
        return "ServerStopped";
    case LoopExit::IterationLimit:
        return "IterationLimit";
    }
    return "Unknown";
}

void sleepSeconds(double seconds)
{
    if (seconds <= 0.0)
        return;
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

LoopResult runClientLoop(session::IClientSession &client, const LoopContext &ctx, double time)
{
    std::uint64_t iterations = 0;
    while (!ctx.quit.requested())
    {
        if (iterationLimitReached(ctx, iterations))
            return finish(LoopExit::IterationLimit, time, iterations, "client");
        ++iterations;

        client.sendPackets();
        client.receivePackets();

        if (client.isDisconnected())
        {
            return finish(client.connectionFailed() ? LoopExit::ConnectionFailed
                                                    : LoopExit::Disconnected,
                          time, iterations, "client");
        }

        time += ctx.deltaTime;
        client.advanceTime(time);

        if (client.connectionFailed())
            return finish(LoopExit::ConnectionFailed, time, iterations, "client");

        idleOnce(ctx);
    }
    return finish(LoopExit::QuitRequested, time, iterations, "client");
}

LoopResult runServerLoop(session::Server &server, const LoopContext &ctx, double time)
{
    std::uint64_t iterations = 0;
    while (!ctx.quit.requested())
    {
        if (iterationLimitReached(ctx, iterations))
            return finish(LoopExit::IterationLimit, time, iterations, "server");
        ++iterations;

        server.sendPackets();
        server.receivePackets();

        time += ctx.deltaTime;
        server.advanceTime(time);

        if (!server.isRunning())
            return finish(LoopExit::ServerStopped, time, iterations, "server");

        idleOnce(ctx);
    }
    return finish(LoopExit::QuitRequested, time, iterations, "server");
}

LoopResult runPairLoop(session::Server &server, session::IClientSession &client,
                       const LoopContext &ctx, double time)
{
    std::uint64_t iterations = 0;
    while (!ctx.quit.requested())
    {
        if (iterationLimitReached(ctx, iterations))
            return finish(LoopExit::IterationLimit, time, iterations, "pair");
        ++iterations;

        server.sendPackets();
        client.sendPackets();

        server.receivePackets();
        client.receivePackets();

        time += ctx.deltaTime;
        client.advanceTime(time);

        if (client.isDisconnected())
        {
            return finish(client.connectionFailed() ? LoopExit::ConnectionFailed
                                                    : LoopExit::Disconnected,
                          time, iterations, "pair");
        }

        time += ctx.deltaTime;
        server.advanceTime(time);

        idleOnce(ctx);
    }
    return finish(LoopExit::QuitRequested, time, iterations, "pair");
}

} // namespace pulsenet::runtime
