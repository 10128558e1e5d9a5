#include "Application.hpp"
#include "ReportWriter.hpp"
#include "../config/PipelineSettings.hpp"
#include "../ingest/ListingReader.hpp"
#include "../processing/Diagnostics.hpp"
#include "../processing/HotelPipeline.hpp"
#include "../processing/PipelineErrors.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"
#include "../utils/Profile.hpp"

#include <boost/program_options.hpp>
#include <plog/Log.h>
#include <iostream>

namespace po = boost::program_options;

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application()
{
    utils::LogManager::Shutdown();
}

std::optional<int> Application::parseCommandLineArgs()
{
    po::options_description desc("usage: staymatch --source-a <jsonl> --source-b <jsonl> [options]");
    desc.add_options()
        ("help,h", "Prints this synopsis.")
        ("config,c", po::value<std::string>(&options_.config_path)->value_name("TOML"),
         "Run configuration (default: config.toml; missing file means defaults).")
        ("source-a,a", po::value<std::string>(&options_.source_a_path)->value_name("JSONL")->required(),
         "Listings of the first source, one JSON object per line.")
        ("source-b,b", po::value<std::string>(&options_.source_b_path)->value_name("JSONL")->required(),
         "Listings of the second source, one JSON object per line.")
        ("output,o", po::value<std::string>(&options_.output_path)->value_name("JSON"),
         "Report destination (default: report.json, '-' for stdout).")
        ("verbose,v", po::bool_switch(&options_.verbose), "Per-decision traces in logs/match.log.");

    try
    {
        po::variables_map vm;
        po::store(po::parse_command_line(argc_, argv_, desc), vm);
        if (vm.count("help"))
        {
            std::cout << desc << "\n";
            return kSuccess;
        }
        po::notify(vm);
    }
    catch (const po::error& err)
    {
        std::cerr << "Error: " << err.what() << "\n" << desc << "\n";
        return kConfigurationError;
    }
    return std::nullopt;
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    if (!utils::LogManager::Initialize(options_.config_path))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    const bool verbose = options_.verbose || utils::LogManager::IsVerboseRequested();
    if (!utils::LogManager::RegisterRunLoggers(verbose))
        return false;

    processing::Diagnostics::SetVerbose(verbose);
    return true;
}

bool Application::loadSource(const std::string& path, bool is_source_a, std::vector<listing::RawListing>& out)
{
    ingest::ListingReader reader(is_source_a ? listing::Source::A : listing::Source::B);
    if (!reader.load(path))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Input, "Listing file could not be read",
                                          reader.lastError());
        return false;
    }
    if (reader.skippedLines() > 0)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Input,
                                            std::to_string(reader.skippedLines()) + " malformed lines skipped",
                                            path);
    }
    out = reader.takeListings();
    return true;
}

void Application::printPendingErrors()
{
    for (const auto& report : utils::ErrorReporter::TakeReports())
        std::cerr << report.format() << "\n";
}

int Application::run()
{
    PROFILE_THREAD_NAME("staymatch-main");

    if (auto exit_code = parseCommandLineArgs())
        return *exit_code;

    if (!initializeLogging())
    {
        printPendingErrors();
        return kConfigurationError;
    }

    processing::PipelineConfig settings;
    try
    {
        settings = config::loadPipelineSettings(options_.config_path);
    }
    catch (const processing::ConfigurationError& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Invalid configuration", ex.what());
        printPendingErrors();
        return kConfigurationError;
    }

    std::vector<listing::RawListing> source_a;
    std::vector<listing::RawListing> source_b;
    if (!loadSource(options_.source_a_path, true, source_a) || !loadSource(options_.source_b_path, false, source_b))
    {
        printPendingErrors();
        return kInputError;
    }

    int exit_code = kSuccess;
    try
    {
        processing::HotelPipeline pipeline(settings);
        auto result = pipeline.run(source_a, source_b);

        std::string error;
        if (!ReportWriter::Write(options_.output_path, ReportWriter::BuildReport(result, settings), error))
        {
            utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Input, "Report could not be written", error);
            exit_code = kInputError;
        }
        else if (!result.enrichmentSucceeded())
        {
            exit_code = kEnrichmentFailed;
        }
    }
    catch (const processing::ConfigurationError& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Invalid configuration", ex.what());
        exit_code = kConfigurationError;
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Matching, "Pipeline run aborted", ex.what());
        exit_code = kInputError;
    }

    printPendingErrors();
    const auto tally = utils::ErrorReporter::Counts();
    PLOG_INFO << "staymatch finished with exit code " << exit_code << " (" << tally.warnings << " warnings, "
              << tally.errors << " errors, " << tally.fatals << " fatal)";
    return exit_code;
}
