#include "ErrorReporter.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_queue;
ErrorReporter::Tally ErrorReporter::s_tally;

namespace
{

std::string localTimestamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace

const char* to_string(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Input:
        return "Input";
    case ErrorCategory::DataQuality:
        return "Data Quality";
    case ErrorCategory::Matching:
        return "Matching";
    case ErrorCategory::Enrichment:
        return "Enrichment";
    }
    return "Unknown";
}

const char* to_string(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReport::format() const
{
    std::string line = std::string("[") + to_string(severity) + "] " + to_string(category) + ": " + summary;
    if (!details.empty())
        line += " (" + details + ")";
    return line;
}

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& summary,
                           const std::string& details)
{
    ErrorReport report{ category, severity, summary, details, localTimestamp() };

    switch (severity)
    {
    case ErrorSeverity::Warning:
        PLOG_WARNING << report.format();
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << report.format();
        break;
    case ErrorSeverity::Fatal:
        PLOG_FATAL << report.format();
        break;
    }

    std::lock_guard<std::mutex> lock(s_mutex);
    switch (severity)
    {
    case ErrorSeverity::Warning:
        ++s_tally.warnings;
        break;
    case ErrorSeverity::Error:
        ++s_tally.errors;
        break;
    case ErrorSeverity::Fatal:
        ++s_tally.fatals;
        break;
    }

    s_queue.push_back(std::move(report));
    if (s_queue.size() > kMaxQueued)
        s_queue.erase(s_queue.begin());
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& summary, const std::string& details)
{
    Report(category, ErrorSeverity::Fatal, summary, details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& summary, const std::string& details)
{
    Report(category, ErrorSeverity::Error, summary, details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& summary, const std::string& details)
{
    Report(category, ErrorSeverity::Warning, summary, details);
}

std::vector<ErrorReport> ErrorReporter::TakeReports()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> reports;
    reports.swap(s_queue);
    return reports;
}

ErrorReporter::Tally ErrorReporter::Counts()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_tally;
}

void ErrorReporter::Clear()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
    s_tally = Tally{};
}

} // namespace utils
