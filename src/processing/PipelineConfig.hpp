#pragma once

#include "IFuzzyMatcher.hpp"
#include "ListingTypes.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace processing
{

struct NormalizerConfig
{
    std::vector<std::string> noise_tokens = {
        "hotel", "resort", "spa", "suites", "apartments", "inn", "boutique", "luxury", "grand", "the"
    };
    double grid_cell_deg = 0.05;        // ~5.5 km of latitude per cell
    std::size_t name_prefix_length = 1; // 0 disables name-prefix bucketing
    double rating_scale_a = 10.0;       // Native maximum rating of each source
    double rating_scale_b = 10.0;

    [[nodiscard]] double ratingScaleFor(listing::Source source) const noexcept
    {
        return source == listing::Source::A ? rating_scale_a : rating_scale_b;
    }
};

struct MatchConfig
{
    double name_threshold = 0.85;       // Minimum similarity in [0, 1]
    double distance_threshold_km = 0.5;
    MatchAlgorithm algorithm = MatchAlgorithm::TokenSortRatio;
};

struct EnrichmentConfig
{
    // Reviews: [0, b0) niche, [b0, b1) known, [b1, b2) popular, [b2, inf) landmark
    std::array<std::int64_t, 3> popularity_breakpoints = { 100, 500, 2000 };
    // Km to centre: [0, b0] central, (b0, b1] near, (b1, b2] outer, beyond remote
    std::array<double, 3> location_breakpoints_km = { 1.0, 3.0, 8.0 };
    std::optional<listing::GeoPoint> city_center;
};

/// User business thresholds. Absent fields do not constrain.
struct FilterCriteria
{
    std::optional<double> max_price;
    std::optional<double> max_distance_km;
    std::optional<double> min_rating;           // 0-10 scale
    std::optional<std::int64_t> min_reviews;
};

struct PipelineConfig
{
    NormalizerConfig normalizer;
    MatchConfig matching;
    EnrichmentConfig enrichment;
    FilterCriteria filter;
    std::size_t top_n = 10;             // 0 keeps every ranked hotel
    std::size_t worker_threads = 0;     // 0 = hardware concurrency
    std::string source_a_name = "A";
    std::string source_b_name = "B";

    // Throws ConfigurationError listing every invalid value.
    void validate() const;
};

// Problems with the given values; empty when valid. Shared by validate() and FilterEngine.
[[nodiscard]] std::vector<std::string> validate_filter_criteria(const FilterCriteria& criteria);
[[nodiscard]] std::vector<std::string> validate_match_thresholds(double name_threshold, double distance_threshold_km);

} // namespace processing
