#pragma once

#include <pulsenet/core/QuitFlag.hpp>
#include <pulsenet/session/ISession.hpp>
#include <pulsenet/session/Server.hpp>

#include <cstdint>
#include <functional>

namespace pulsenet::runtime
{

/// 고정 timestep 루프 컨텍스트. quit 은 매 iteration 시작에서 확인한다.
struct LoopContext
{
    const core::QuitFlag &quit;
    double deltaTime;
    /// iteration 사이 대기. 비어 있으면 deltaTime 만큼 sleep.
    std::function<void(double)> idle{};
    /// 0 이면 무제한
    std::uint64_t maxIterations{0};
};

enum class LoopExit : std::uint8_t
{
    QuitRequested,
    Disconnected,
    ConnectionFailed,
    ServerStopped,
    IterationLimit,
};

[[nodiscard]] const char *loopExitName(LoopExit exit) noexcept;

struct LoopResult
{
    LoopExit exit{LoopExit::QuitRequested};
    double time{0.0};
    std::uint64_t iterations{0};
};

/// send -> receive -> (끊김 확인) -> advanceTime -> (실패 확인) -> idle
LoopResult runClientLoop(session::IClientSession &client, const LoopContext &ctx, double time);

/// send -> receive -> advanceTime -> idle. 서버는 quit 으로만 끝난다.
LoopResult runServerLoop(session::Server &server, const LoopContext &ctx, double time);

/// 한 스레드의 서버+클라이언트.
///   server send, client send, server receive, client receive,
///   client advanceTime, (끊김 확인), server advanceTime, idle
LoopResult runPairLoop(session::Server &server, session::IClientSession &client,
                       const LoopContext &ctx, double time);

/// 기본 idle: dt 초 sleep
void sleepSeconds(double seconds);

} // namespace pulsenet::runtime
