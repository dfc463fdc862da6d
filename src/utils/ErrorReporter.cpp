#include "ErrorReporter.hpp"
#include "../processing/PreprocessorErrors.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <utility>

#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_error_queue;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
    , is_fatal(sev == ErrorSeverity::Fatal)
{
}

void ErrorReporter::Log(const ErrorReport& report)
{
    const std::string line = Format(report);
    switch (report.severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << line;
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << line;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << line;
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << line;
        break;
    }
}

void ErrorReporter::Report(ErrorReport report)
{
    Log(report);

    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.push_back(std::move(report));
    while (s_error_queue.size() > MAX_QUEUE_SIZE)
        s_error_queue.pop_front();
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    Report(ErrorReport(category, severity, user_message, technical_details));
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

void ErrorReporter::ReportException(ErrorCategory category, const std::string& user_message, const std::exception& ex)
{
    ErrorReport report(category, ErrorSeverity::Error, user_message, ex.what());
    if (const auto* stage_error = dynamic_cast<const docstruct::PreprocessorError*>(&ex))
        report.stage = stage_error->stage();
    Report(std::move(report));
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_error_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> reports(std::make_move_iterator(s_error_queue.begin()),
                                     std::make_move_iterator(s_error_queue.end()));
    s_error_queue.clear();
    return reports;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_error_queue.empty() ? ErrorReport() : s_error_queue.back();
}

std::size_t ErrorReporter::CountAtLeast(ErrorSeverity severity)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return static_cast<std::size_t>(std::count_if(s_error_queue.begin(), s_error_queue.end(),
                                                  [severity](const ErrorReport& r) { return r.severity >= severity; }));
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Input:
        return "Input";
    case ErrorCategory::Processing:
        return "Processing";
    case ErrorCategory::Output:
        return "Output";
    case ErrorCategory::Unknown:
    default:
        return "Unknown";
    }
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
    default:
        return "Unknown";
    }
}

std::string ErrorReporter::Format(const ErrorReport& report)
{
    std::string line = "[" + CategoryToString(report.category) + "] [" + SeverityToString(report.severity) + "] ";
    if (!report.stage.empty())
        line += "(" + report.stage + ") ";
    line += report.user_message;
    if (!report.technical_details.empty())
        line += " | " + report.technical_details;
    return line;
}

std::string ErrorReporter::GetTimestamp()
{
    const std::time_t now = std::time(nullptr);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace utils
