#pragma once

#include <cstddef>
#include <ios>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, translator backend setup
    Configuration,  // TOML parsing, out-of-range settings
    Translation,    // terminal translation failures
    Validation,     // rejected input
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // setting adjusted or feature degraded, run continues
    Error,   // one task or operation failed
    Fatal    // the run cannot continue
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // shown on the console
    std::string technical_details; // log only
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Process-wide sink for user-facing errors
 *
 * Any thread may report. Every report is logged through plog and queued;
 * the main loop drains the queue with GetPendingErrors() and prints it.
 * Drained reports are mirrored into the file set by InitializeLogFile().
 *
 *   ErrorReporter::ReportError(ErrorCategory::Translation,
 *                              "Translation failed",
 *                              "connection refused");
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                              const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Take all queued reports, oldest first, and mirror them to the error log
     */
    static std::vector<ErrorReport> GetPendingErrors();

    // Most recent queued report, or a default report when the queue is empty.
    static ErrorReport GetLastError();

    static void ClearErrors();

    // Reports pushed out of the full queue since the last ClearErrors().
    static std::size_t DroppedCount();

    static void InitializeLogFile(const std::string& path, std::ios::openmode mode = std::ios::app);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static void WriteToLogFileLocked(const std::vector<ErrorReport>& reports);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static std::string s_log_path;
    static std::size_t s_dropped;
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
