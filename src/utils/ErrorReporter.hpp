#pragma once

#include <chrono>
#include <deque>
#include <ios>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, signal setup, server bind
    Configuration,  // TOML parsing, invalid config values
    Validation,     // rejected uploads
    Storage,        // temp file create/write/delete
    Extraction,     // extraction worker failures
    Anonymization,  // anonymization worker failures and fallbacks
    Server,         // HTTP transport errors
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed, but service can continue
    Fatal    // Critical error, service should exit
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short operator-facing summary
    std::string technical_details; // Worker stderr, errno text, exception message
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe incident reporter
 *
 * Every report is logged through plog and kept in a bounded history so
 * operators can spot systemic failures (e.g. every anonymization falling
 * back) even though individual requests succeed. When a log file is
 * configured each report is also appended there.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Anonymization,
 *                                "Anonymization failed, returning raw text",
 *                                "exit code 1: model not found");
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

    /// Copy of the most recent reports, oldest first
    static std::vector<ErrorReport> GetHistorySnapshot();

    /// Number of reports recorded for a category since start (or last ClearHistory)
    static std::size_t CountFor(ErrorCategory category);

    static void ClearHistory();

    /// Append every subsequent report to the given file; an empty path turns the file off
    static void InitializeLogFile(const std::string& path, std::ios::openmode mode = std::ios::app);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static void AppendToHistoryLocked(ErrorReport report);
    static void WriteToLogFileLocked(const ErrorReport& report);

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_error_history;
    static std::vector<std::size_t> s_category_counts;
    static std::string s_log_path;
    static constexpr std::size_t MAX_HISTORY_SIZE = 200;
};

} // namespace utils
