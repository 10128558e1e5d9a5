#include "ReportWriter.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <plog/Log.h>

using json = nlohmann::json;

namespace
{

template<typename T>
json optionalToJson(const std::optional<T>& value)
{
    return value ? json(*value) : json(nullptr);
}

json sourceToJson(const std::optional<listing::Source>& source)
{
    return source ? json(std::string(listing::to_string(*source))) : json(nullptr);
}

json finiteOrNull(double value)
{
    return std::isfinite(value) ? json(value) : json(nullptr);
}

} // namespace

json ReportWriter::HotelToJson(const listing::ConsolidatedHotel& hotel)
{
    json sources = json::array();
    for (auto s : hotel.sources)
        sources.push_back(std::string(listing::to_string(s)));

    json urls = json::array();
    for (const auto& u : hotel.urls)
        urls.push_back({ { "source", std::string(listing::to_string(u.source)) }, { "url", u.url } });

    json out = {
        { "name", hotel.name },
        { "price", hotel.price_valid ? json(hotel.price) : json(nullptr) },
        { "price_source", sourceToJson(hotel.price_source) },
        { "rating", hotel.rated ? json(hotel.rating) : json(nullptr) },
        { "rating_source", sourceToJson(hotel.rating_source) },
        { "review_count", hotel.review_count },
        { "latitude", hotel.has_coordinates ? json(hotel.latitude) : json(nullptr) },
        { "longitude", hotel.has_coordinates ? json(hotel.longitude) : json(nullptr) },
        { "coordinate_source", sourceToJson(hotel.coordinate_source) },
        { "distance_to_center_km", optionalToJson(hotel.distance_to_center_km) },
        { "sources", sources },
        { "urls", urls },
        { "a_index", optionalToJson(hotel.a_index) },
        { "b_index", optionalToJson(hotel.b_index) },
    };
    if (hotel.isMatched())
    {
        out["match_similarity"] = optionalToJson(hotel.match_similarity);
        out["match_distance_m"] = optionalToJson(hotel.match_distance_m);
    }
    return out;
}

json ReportWriter::EnrichedToJson(const listing::EnrichedHotel& enriched)
{
    json out = HotelToJson(enriched.hotel);
    out["value_score"] = optionalToJson(enriched.value_score);
    out["popularity"] = std::string(listing::to_string(enriched.popularity));
    out["location"] = std::string(listing::to_string(enriched.location));
    return out;
}

json ReportWriter::DecisionToJson(const listing::MatchDecision& decision, const processing::PipelineResult& result)
{
    const auto& pair = decision.pair;
    json out = {
        { "a_index", pair.a_index },
        { "b_index", pair.b_index },
        { "similarity", pair.similarity },
        { "distance_m", finiteOrNull(pair.distance_m) },
        { "accepted", decision.accepted },
        { "reason", decision.accepted ? json(nullptr) : json(std::string(listing::to_string(decision.reason))) },
    };
    if (pair.a_index < result.normalized_a.size())
        out["a_name"] = result.normalized_a[pair.a_index].raw_name;
    if (pair.b_index < result.normalized_b.size())
        out["b_name"] = result.normalized_b[pair.b_index].raw_name;
    return out;
}

json ReportWriter::BuildReport(const processing::PipelineResult& result, const processing::PipelineConfig& config)
{
    json timings = json::array();
    for (const auto& t : result.timings)
        timings.push_back({ { "stage", t.stage }, { "duration_us", t.duration.count() }, { "succeeded", t.succeeded } });

    json summary = {
        { "source_a", { { "name", config.source_a_name }, { "listings", result.normalized_a.size() } } },
        { "source_b", { { "name", config.source_b_name }, { "listings", result.normalized_b.size() } } },
        { "candidate_pairs", result.decisions.size() },
        { "accepted_matches", result.acceptedMatches() },
        { "hotels", result.consolidated.size() },
        { "enriched", result.enrichmentSucceeded() },
        { "enrichment_error", optionalToJson(result.enrichment_error) },
        { "filtered", result.filtered.size() },
        { "ranked", result.ranked.size() },
        { "warnings", result.warnings.size() },
        { "timings", timings },
    };

    json hotels = json::array();
    if (result.enrichmentSucceeded())
    {
        for (const auto& e : result.enriched)
            hotels.push_back(EnrichedToJson(e));
    }
    else
    {
        for (const auto& h : result.consolidated)
            hotels.push_back(HotelToJson(h));
    }

    json ranked = json::array();
    for (const auto& e : result.ranked)
        ranked.push_back(EnrichedToJson(e));

    json audit = json::array();
    for (const auto& d : result.decisions)
        audit.push_back(DecisionToJson(d, result));

    json warnings = json::array();
    for (const auto& w : result.warnings)
    {
        warnings.push_back({ { "source", std::string(listing::to_string(w.source)) },
                             { "record_index", w.record_index },
                             { "field", w.field },
                             { "message", w.message } });
    }

    return json{
        { "summary", summary }, { "hotels", hotels }, { "ranked", ranked }, { "audit", audit }, { "warnings", warnings },
    };
}

bool ReportWriter::Write(const std::string& path, const json& report, std::string& error)
{
    if (path == "-")
    {
        std::cout << report.dump(2) << std::endl;
        return true;
    }

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        error = "Could not open report file for writing: " + path;
        return false;
    }
    ofs << report.dump(2) << "\n";
    ofs.flush();
    if (!ofs)
    {
        error = "Failed while writing report file: " + path;
        return false;
    }
    PLOG_INFO << "Report written to " << path;
    return true;
}
