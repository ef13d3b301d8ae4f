#include <pulsenet/core/LoggingConfig.hpp>
#include <pulsenet/core/Logger.hpp>

#include <fstream>
#include <memory>
#include <stdexcept>

namespace pulsenet::core
{

void applyLoggingConfig(const LogSettings &settings)
{
    if (settings.filePath.empty())
    {
        setLogger(makeConsoleLogger(settings.level));
        return;
    }

    // 여러 실행이 같은 파일에 이어 쓴다.
    auto file = std::make_shared<std::ofstream>(settings.filePath, std::ios::app);
    if (!file->is_open())
    {
        throw std::runtime_error("LoggingConfig: failed to open log file: " + settings.filePath);
    }
    setLogger(std::make_shared<Logger>(std::move(file), settings.level));
}

} // namespace pulsenet::core
