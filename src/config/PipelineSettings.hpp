#pragma once

#include "../processing/PipelineConfig.hpp"

#include <string>

namespace config
{

// Reads [pipeline] [sources] [normalizer] [matching] [enrichment] [filter] from a TOML file and
// returns a validated configuration. A missing file yields the defaults.
// Throws processing::ConfigurationError on syntax errors, ill-typed values or invalid thresholds.
processing::PipelineConfig loadPipelineSettings(const std::string& path);

} // namespace config
