#pragma once

#include <pulsenet/SessionConfig.hpp>
#include <pulsenet/core/Defaults.hpp>
#include <pulsenet/core/Logger.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace pulsenet::core
{

// [log]
struct LogSettings
{
    LogLevel level{LogLevel::Info};

    /// 비어 있으면 std::clog 로 출력합니다.
    std::string filePath{};
};

// [server] 게임 서버 + 매치 서비스가 토큰을 발급할 때 쓰는 서버 측 설정
struct ServerSettings
{
    std::string address{"127.0.0.1"};
    std::uint16_t port{defaults::kServerPort};
    int maxClients{defaults::kMaxClients};

    /// connect token 봉인 키 (AES-256, 32 bytes). TOML에는 hex 문자열로 적는다.
    std::array<std::uint8_t, 32> privateKey{defaults::kSecurePrivateKey};
};

// [client]
struct ClientSettings
{
    std::string bindAddress{"0.0.0.0"};
    /// 0 이면 커널이 고른다
    std::uint16_t port{0};
};

// [matcher]
struct MatcherSettings
{
    std::string host{"127.0.0.1"};
    std::uint16_t port{defaults::kMatcherPort};
    int timeoutMs{defaults::kMatcherTimeoutMs};
    bool retryOnce{true};
    int tokenExpirySeconds{defaults::kConnectTokenExpirySeconds};
};

// [driver] 고정 timestep 루프 파라미터
struct DriverSettings
{
    double startTime{defaults::kStartTime};
    double deltaTime{defaults::kDeltaTime};

    /// insecure client 전용 timestep
    double clientDeltaTime{defaults::kClientDeltaTime};
};

// 전체 통합 설정
struct GlobalConfig
{
    LogSettings log{};
    SessionConfig session{};
    ServerSettings server{};
    ClientSettings client{};
    MatcherSettings matcher{};
    DriverSettings driver{};
};

} // namespace pulsenet::core
