#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Logger, CLI startup
    Configuration,  // TOML parsing, invalid config
    Resources,      // Lexicon files (corrections, gendered nouns, stopwords)
    Annotation,     // Annotator missing or contract violations
    Processing,     // Pipeline stage failures
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed, but app can continue
    Fatal    // Critical error, app should exit
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message for users
    std::string technical_details; // Technical details for logs/bug reports
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter
 *
 * Collects degradations and failures from the processing subsystems and queues
 * them for the front end. Every report is also written to plog.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Annotation,
 *                                "Annotator unavailable, using heuristic fallback");
 *
 *   if (ErrorReporter::HasPendingErrors()) {
 *       auto errors = ErrorReporter::GetPendingErrors();
 *       // Print to stderr...
 *   }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report an error to the system
     * @param category Error category
     * @param severity Error severity
     * @param user_message User-friendly message
     * @param technical_details Technical details for debugging
     */
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /**
     * @brief Report a fatal error
     */
    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /**
     * @brief Report a regular error
     */
    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /**
     * @brief Report a warning
     */
    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    /**
     * @brief Get current timestamp as a formatted string
     */
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
