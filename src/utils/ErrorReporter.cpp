#include "ErrorReporter.hpp"
#include <plog/Log.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace utils
{

namespace
{

constexpr std::size_t kCategoryCount = static_cast<std::size_t>(ErrorCategory::Unknown) + 1;

plog::Severity ToPlogSeverity(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return plog::info;
    case ErrorSeverity::Warning:
        return plog::warning;
    case ErrorSeverity::Error:
        return plog::error;
    case ErrorSeverity::Fatal:
        return plog::fatal;
    }
    return plog::error;
}

} // namespace

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_error_history;
std::vector<std::size_t> ErrorReporter::s_category_counts(kCategoryCount, 0);
std::string ErrorReporter::s_log_path;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
    , is_fatal(sev == ErrorSeverity::Fatal)
{
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    ErrorReport report(category, severity, user_message, technical_details);

    PLOG(ToPlogSeverity(severity)) << "[" << CategoryToString(category) << "] " << user_message
                                   << (technical_details.empty() ? "" : " | Details: ") << technical_details;

    std::lock_guard<std::mutex> lock(s_mutex);
    ++s_category_counts[static_cast<std::size_t>(category)];
    AppendToHistoryLocked(std::move(report));
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Fatal, user_message, technical_details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

std::vector<ErrorReport> ErrorReporter::GetHistorySnapshot()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return { s_error_history.begin(), s_error_history.end() };
}

std::size_t ErrorReporter::CountFor(ErrorCategory category)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_category_counts[static_cast<std::size_t>(category)];
}

void ErrorReporter::ClearHistory()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_history.clear();
    std::fill(s_category_counts.begin(), s_category_counts.end(), 0);
}

void ErrorReporter::InitializeLogFile(const std::string& path, std::ios::openmode mode)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    if (path.empty())
    {
        s_log_path.clear();
        return;
    }
    std::ofstream ofs(path, mode);
    if (ofs)
    {
        ofs << "\n=== Run started " << GetTimestamp() << " ===\n";
        s_log_path = path;
    }
    else
    {
        PLOG_WARNING << "Unable to open error log file: " << path;
    }
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Validation:
        return "Validation";
    case ErrorCategory::Storage:
        return "Storage";
    case ErrorCategory::Extraction:
        return "Extraction";
    case ErrorCategory::Anonymization:
        return "Anonymization";
    case ErrorCategory::Server:
        return "Server";
    case ErrorCategory::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

std::string ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::GetTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void ErrorReporter::AppendToHistoryLocked(ErrorReport report)
{
    WriteToLogFileLocked(report);
    s_error_history.push_back(std::move(report));
    while (s_error_history.size() > MAX_HISTORY_SIZE)
        s_error_history.pop_front();
}

void ErrorReporter::WriteToLogFileLocked(const ErrorReport& report)
{
    if (s_log_path.empty())
        return;

    std::ofstream ofs(s_log_path, std::ios::app);
    if (!ofs)
        return;

    ofs << "[" << report.timestamp << "]"
        << " [" << CategoryToString(report.category) << "]"
        << " [" << SeverityToString(report.severity) << "] " << report.user_message;
    if (!report.technical_details.empty())
    {
        ofs << " | " << report.technical_details;
    }
    ofs << '\n';
}

} // namespace utils
