#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils
{

enum class ErrorCategory
{
    Initialization, // logging, CLI arguments
    Configuration,  // TOML parsing, invalid thresholds
    Input,          // unreadable or malformed listing files, report destination
    DataQuality,    // defaulted listing fields
    Matching,       // candidate generation, match decisions
    Enrichment,     // value score, city aggregates
};

enum class ErrorSeverity
{
    Warning, // Degraded result, the run continues
    Error,   // A stage failed, the report carries partial results
    Fatal,   // No report is produced
};

const char* to_string(ErrorCategory category);
const char* to_string(ErrorSeverity severity);

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Initialization;
    ErrorSeverity severity = ErrorSeverity::Warning;
    std::string summary; // One line, shown on stderr
    std::string details; // File names, offending values, exception text
    std::string timestamp;

    // "[Warning] Input: 3 malformed lines skipped (a.jsonl)"
    [[nodiscard]] std::string format() const;
};

/**
 * @brief Collects the problems of one staymatch run for the end-of-run stderr summary.
 *
 * Every report is written to the run log immediately. The queue keeps the newest kMaxQueued reports;
 * the tally counts all of them.
 *
 * @code
 * ErrorReporter::ReportWarning(ErrorCategory::Input, "3 malformed lines skipped", "a.jsonl");
 * for (const auto& report : ErrorReporter::TakeReports())
 *     std::cerr << report.format() << "\n";
 * @endcode
 */
class ErrorReporter
{
public:
    struct Tally
    {
        std::size_t warnings = 0;
        std::size_t errors = 0;
        std::size_t fatals = 0;
    };

    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& summary,
                       const std::string& details = "");

    static void ReportFatal(ErrorCategory category, const std::string& summary, const std::string& details = "");
    static void ReportError(ErrorCategory category, const std::string& summary, const std::string& details = "");
    static void ReportWarning(ErrorCategory category, const std::string& summary, const std::string& details = "");

    // Drains the queue; the tally is kept until Clear()
    static std::vector<ErrorReport> TakeReports();
    static Tally Counts();
    static void Clear();

private:
    static constexpr std::size_t kMaxQueued = 100;

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_queue;
    static Tally s_tally;
};

} // namespace utils
