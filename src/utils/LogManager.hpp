#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

/**
 * @brief Owns the plog appenders of a staymatch run.
 *
 * Instances: 0 = run log (console + logs/run.log), processing::Diagnostics::kLogInstance = match trace
 * (logs/match.log), profiling::kProfilingLogInstance = scope timers when profiling is compiled in.
 *
 * [logging] keys: level ("info", "debug", ... or plog severity 0-6), append_logs, verbose, directory.
 */
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filename;                       // Relative to the log directory
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Reads [logging] from config_path and creates the log directory. A missing file keeps the defaults.
    static bool Initialize(const std::string& config_path = "config.toml");

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    // Run log, match trace and (when compiled in) the profiling log. verbose_trace (or [logging] verbose)
    // opens the match trace to debug lines.
    static bool RegisterRunLoggers(bool verbose_trace);

    static void Shutdown();

    static bool IsVerboseRequested();
    static std::string LogPath(const std::string& filename);

private:
    LogManager() = default;

    static bool ReadConfig(const std::string& config_path);
    static void PrepareLogDirectory();

    static bool s_initialized;
    static bool s_append_logs;
    static bool s_verbose;
    static std::string s_directory;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
