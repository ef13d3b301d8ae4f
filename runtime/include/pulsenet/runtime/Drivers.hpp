#pragma once

#include <pulsenet/Runtime.hpp>
#include <pulsenet/core/GlobalConfig.hpp>
#include <pulsenet/core/QuitFlag.hpp>
#include <pulsenet/net/Address.hpp>
#include <pulsenet/runtime/Matcher.hpp>
#include <pulsenet/session/ISession.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace pulsenet::runtime
{

/// 드라이버 공통 입력. 모두 main 이 소유한다.
struct DriverEnv
{
    const Runtime &runtime;
    const core::GlobalConfig &config;
    const core::QuitFlag &quit;
};

/// args[position] 이 유효한 주소면 그것을, 아니면 fallback. port 0 은 기본 서버 포트로 바꾼다.
[[nodiscard]] net::Address serverAddressOverride(std::span<const std::string> args,
                                                 std::size_t position,
                                                 const net::Address &fallback);

/// 설정의 서버 주소 (server.address:server.port)
[[nodiscard]] net::Address configuredServerAddress(const core::GlobalConfig &config);

/// 클라이언트 bind 주소 (client.bind_address:client.port)
[[nodiscard]] net::Address clientBindAddress(const core::GlobalConfig &config);

/// 세션마다 새로 뽑는 64-bit client id
[[nodiscard]] std::uint64_t generateClientId(const Runtime &runtime);

// ----- 드라이버. 반환값은 프로세스 종료 코드 -----

int runInsecureClient(const DriverEnv &env, std::span<const std::string> args);

/// 매치 실패면 connectSecure 를 부르지 않고 1.
/// - 주소 override 는 두 번째 인자에서 읽고 경고만 남긴다 (토큰의 서버 목록이 우선).
int runSecureClient(const DriverEnv &env, IMatcher &matcher, session::IClientSession &client,
                    std::span<const std::string> args);

int runServer(const DriverEnv &env);
int runSecureServer(const DriverEnv &env);
int runClientServer(const DriverEnv &env, std::span<const std::string> args);
int runLoopback(const DriverEnv &env, std::span<const std::string> args);

struct SoakOptions
{
    /// 0 이면 quit 까지
    std::uint64_t maxIterations{0};
};

/// 양방향 메시지 교환 + 내용 검증. 검증 실패나 연결 실패면 1.
int runSoak(const DriverEnv &env, const SoakOptions &options);

int runMatcher(const DriverEnv &env);

} // namespace pulsenet::runtime
