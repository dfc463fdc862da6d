#pragma once

#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, startup
    Configuration,  // TOML parsing, invalid options
    Input,          // span document missing or malformed
    Processing,     // a preprocessing stage failed
    Output,         // writing the result
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // run continues, result may be degraded
    Error,   // run failed
    Fatal    // unexpected failure
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short message for the command line
    std::string technical_details; // Exception text, paths, offending values
    std::string stage;             // Pipeline stage that failed, empty when not stage related
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe collector for problems met during a run
 *
 * Every report is logged through plog and kept in a bounded queue so the
 * command line front end can print a summary on stderr before it exits.
 *
 * Usage:
 *   try { engine.process(pages); }
 *   catch (const docstruct::PreprocessorError& ex) {
 *       ErrorReporter::ReportException(ErrorCategory::Processing, "Preprocessing failed", ex);
 *   }
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       std::cerr << ErrorReporter::Format(report) << '\n';
 */
class ErrorReporter
{
public:
    static void Report(ErrorReport report);

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

    /**
     * @brief Report a caught exception as an Error
     *
     * The exception text becomes the technical details; a preprocessing error
     * also records the stage that raised it.
     */
    static void ReportException(ErrorCategory category, const std::string& user_message, const std::exception& ex);

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    // Number of queued reports at or above the given severity
    static std::size_t CountAtLeast(ErrorSeverity severity);

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    // One line: "[Category] [Severity] (stage) message | details"
    static std::string Format(const ErrorReport& report);

    static std::string GetTimestamp();

private:
    static void Log(const ErrorReport& report);

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
