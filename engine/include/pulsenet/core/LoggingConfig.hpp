#pragma once

#include <pulsenet/core/GlobalConfig.hpp>

namespace pulsenet::core
{

/// LogSettings의 level/filePath를 프로세스 전역 Logger에 반영합니다.
/// - 파일을 열 수 없으면 std::runtime_error.
void applyLoggingConfig(const LogSettings &settings);

} // namespace pulsenet::core
