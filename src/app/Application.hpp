#pragma once

#include <optional>
#include <string>
#include <vector>

namespace listing
{
struct RawListing;
}

// Batch driver: logging, settings, both sources, one pipeline run, JSON report.
class Application
{
public:
    enum ExitCode : int
    {
        kSuccess = 0,
        kConfigurationError = 1,
        kInputError = 2,
        kEnrichmentFailed = 3,
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    struct Options
    {
        std::string config_path = "config.toml";
        std::string source_a_path;
        std::string source_b_path;
        std::string output_path = "report.json";
        bool verbose = false;
    };

    // Empty when the process should exit with the returned code (help, bad arguments).
    std::optional<int> parseCommandLineArgs();
    bool initializeLogging();
    bool loadSource(const std::string& path, bool is_source_a, std::vector<listing::RawListing>& out);
    void printPendingErrors();

    int argc_;
    char** argv_;
    Options options_;
};
