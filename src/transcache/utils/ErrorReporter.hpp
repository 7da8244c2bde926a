#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <cstddef>

namespace transcache::utils
{

enum class ErrorCategory
{
    Initialization, // logging, worker startup
    Configuration,  // TOML parsing, invalid values
    Cache,          // persistent store I/O
    Translation,    // backend failures, fallbacks to source text
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed, but the caller can continue
    Fatal    // Critical error, the host should stop
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message
    std::string technical_details; // Details for logs and bug reports
    std::string timestamp;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter
 *
 * Collects degradations from the cache and translation layers, logs them
 * through plog and keeps a bounded queue the host application can poll.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Translation,
 *                                "Translation failed, showing source text",
 *                                ex.what());
 *
 *   if (ErrorReporter::HasPendingErrors()) {
 *       auto errors = ErrorReporter::GetPendingErrors();
 *   }
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
};

} // namespace transcache::utils
