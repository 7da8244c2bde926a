#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace transcache::utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
bool LogManager::s_logger_registered = false;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(plog::Severity default_level, bool append_logs)
{
    if (s_initialized)
        return true;

    s_default_level = default_level;
    s_append_logs = append_logs;
    s_initialized = true;
    return true;
}

bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.filepath);
        return false;
    }

    plog::Severity level = config.level_override.value_or(s_default_level);

    if (s_logger_registered)
    {
        // plog keeps one static logger per instance; further appenders would log twice
        plog::get()->setMaxSeverity(level);
        return true;
    }

    if (!PrepareLogDirectory(config.filepath))
        return false;

    try
    {
        if (!(config.append && s_append_logs))
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        auto& logger = plog::init(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_appenders.push_back(std::move(file_appender));
        s_logger_registered = true;
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.filepath,
                                   ex.what());
        return false;
    }
}

// Appenders stay alive: the plog logger still points at them.
void LogManager::Shutdown()
{
    if (auto logger = plog::get())
    {
        logger->setMaxSeverity(plog::none);
    }
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

plog::Severity LogManager::SeverityFromInt(long long level)
{
    if (level < static_cast<long long>(plog::none))
        return plog::none;
    if (level > static_cast<long long>(plog::verbose))
        return plog::verbose;
    return static_cast<plog::Severity>(level);
}

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const std::filesystem::path dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     dir.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace transcache::utils
