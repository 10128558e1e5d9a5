#pragma once

#include "../processing/HotelPipeline.hpp"

#include <nlohmann/json.hpp>
#include <string>

// Serializes a pipeline run for external exporters: summary, full view, ranked view, audit trail, warnings.
class ReportWriter
{
public:
    static nlohmann::json BuildReport(const processing::PipelineResult& result,
                                      const processing::PipelineConfig& config);

    static nlohmann::json HotelToJson(const listing::ConsolidatedHotel& hotel);
    static nlohmann::json EnrichedToJson(const listing::EnrichedHotel& enriched);
    static nlohmann::json DecisionToJson(const listing::MatchDecision& decision,
                                         const processing::PipelineResult& result);

    // "-" writes to stdout. Returns false and fills error when the file cannot be written.
    static bool Write(const std::string& path, const nlohmann::json& report, std::string& error);
};
