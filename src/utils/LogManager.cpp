#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../processing/Diagnostics.hpp"
#include "Profile.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/MessageOnlyFormatter.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
bool LogManager::s_verbose = false;
std::string LogManager::s_directory = "logs";
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

namespace
{

// "warning" or 3 -> plog::warning; empty for anything else
std::optional<plog::Severity> severityFrom(const toml::node& node)
{
    if (auto number = node.value<int64_t>())
    {
        if (*number >= plog::none && *number <= plog::verbose)
            return static_cast<plog::Severity>(*number);
        return std::nullopt;
    }
    if (auto name = node.value<std::string>())
    {
        const plog::Severity parsed = plog::severityFromString(name->c_str());
        if (parsed != plog::none || *name == "none")
            return parsed;
    }
    return std::nullopt;
}

void truncateLog(const std::string& filepath)
{
    std::ofstream out(filepath, std::ios::trunc);
    if (!out)
        throw std::runtime_error("cannot truncate");
}

} // namespace

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    if (!ReadConfig(config_path))
        return false;

    PrepareLogDirectory();

    s_initialized = true;
    return true;
}

std::string LogManager::LogPath(const std::string& filename)
{
    return (std::filesystem::path(s_directory) / filename).string();
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logger registered before LogManager::Initialize",
                                   config.name);
        return false;
    }

    const std::string filepath = LogPath(config.filename);
    std::vector<std::unique_ptr<plog::IAppender>> owned;
    try
    {
        if (!config.append_override.value_or(s_append_logs))
            truncateLog(filepath);
        owned.push_back(std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            filepath.c_str(), config.max_file_size, config.backup_count));
        if (config.add_console_appender)
            owned.push_back(std::make_unique<plog::ConsoleAppender<plog::MessageOnlyFormatter>>());
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Log file could not be opened for " + config.name,
                                   filepath + ": " + ex.what());
        return false;
    }

    auto& logger = plog::init<InstanceId>(config.level_override.value_or(s_default_level));
    for (auto& appender : owned)
    {
        logger.addAppender(appender.get());
        s_appenders.push_back(std::move(appender));
    }
    return true;
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(const LoggerConfig&);

#if STAYMATCH_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

bool LogManager::RegisterRunLoggers(bool verbose_trace)
{
    bool ok = RegisterLogger<0>({ .name = "run", .filename = "run.log", .add_console_appender = true });

    // Per-record normalizer traces are written at debug.
    std::optional<plog::Severity> trace_level;
    if ((verbose_trace || s_verbose) && s_default_level < plog::debug)
        trace_level = plog::debug;
    ok = RegisterLogger<processing::Diagnostics::kLogInstance>(
             { .name = "match", .filename = "match.log", .level_override = trace_level }) &&
         ok;

#if STAYMATCH_PROFILING_LEVEL >= 1
    ok = RegisterLogger<profiling::kProfilingLogInstance>(
             { .name = "profiling", .filename = "profiling.log", .level_override = plog::debug }) &&
         ok;
#endif
    return ok;
}

namespace
{

// plog keeps raw appender pointers; a silenced logger never dereferences them
template <int InstanceId>
void silence()
{
    if (auto* logger = plog::get<InstanceId>())
        logger->setMaxSeverity(plog::none);
}

} // namespace

void LogManager::Shutdown()
{
    silence<0>();
    silence<processing::Diagnostics::kLogInstance>();
#if STAYMATCH_PROFILING_LEVEL >= 1
    silence<profiling::kProfilingLogInstance>();
#endif
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsVerboseRequested() { return s_verbose; }

void LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     s_directory + ": " + ec.message());
    }
}

bool LogManager::ReadConfig(const std::string& config_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return true;

    try
    {
        auto cfg = toml::parse_file(config_path);
        const toml::table* logging = cfg["logging"].as_table();
        if (!logging)
            return true;

        if (auto append = (*logging)["append_logs"].value<bool>())
            s_append_logs = *append;
        if (auto verbose = (*logging)["verbose"].value<bool>())
            s_verbose = *verbose;
        if (auto directory = (*logging)["directory"].value<std::string>(); directory && !directory->empty())
            s_directory = *directory;

        if (const toml::node* level = logging->get("level"))
        {
            if (auto severity = severityFrom(*level))
                s_default_level = *severity;
            else
                ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown logging.level ignored",
                                             "Expected a plog severity name or 0-6\nFile: " + config_path);
        }
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        // Settings loading reports the same file in detail; logging keeps its defaults
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored",
                                     std::string(pe.description()));
        return true;
    }
}

} // namespace utils
