#pragma once

#include <pulsenet/core/GlobalConfig.hpp>

#include <string>
#include <string_view>

namespace pulsenet::core
{

/// 설정 파일 경로를 지정하는 환경 변수. 드라이버 CLI 에는 플래그가 없다.
inline constexpr const char *kConfigEnvVar = "PULSENET_CONFIG";

class ConfigLoader
{
  public:
    // 드라이버는 이 한 줄만 호출한다. 환경 변수가 없으면 기본값.
    static GlobalConfig load();

    // 파일이 없거나 TOML 문법 오류면 std::runtime_error, 값 범위 오류면 std::invalid_argument
    static GlobalConfig loadFile(const std::string &path);

    static GlobalConfig parse(std::string_view tomlText);
};

} // namespace pulsenet::core
