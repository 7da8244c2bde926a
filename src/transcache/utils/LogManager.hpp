#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <cstddef>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace transcache::utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string filepath = "logs/transcache.log";
        bool append = true;
        std::optional<plog::Severity> level_override;
        std::size_t max_file_size = 10 * 1024 * 1024;
        std::size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Sets defaults for every logger registered afterwards.
    static bool Initialize(plog::Severity default_level = plog::info, bool append_logs = true);

    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsInitialized();
    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();

    // Maps a 0..6 integer onto plog's severities, clamping out-of-range values.
    static plog::Severity SeverityFromInt(long long level);

private:
    LogManager() = default;

    static bool PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static bool s_append_logs;
    static bool s_logger_registered;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace transcache::utils
