#include "PipelineConfig.hpp"
#include "PipelineErrors.hpp"

#include <cmath>
#include <sstream>

namespace processing
{

namespace
{

bool is_non_negative(double v) { return std::isfinite(v) && v >= 0.0; }

template <typename T, std::size_t N>
bool strictly_increasing(const std::array<T, N>& values)
{
    for (std::size_t i = 1; i < N; ++i)
    {
        if (!(values[i - 1] < values[i]))
            return false;
    }
    return true;
}

} // namespace

std::vector<std::string> validate_match_thresholds(double name_threshold, double distance_threshold_km)
{
    std::vector<std::string> problems;
    if (!std::isfinite(name_threshold) || name_threshold < 0.0 || name_threshold > 1.0)
        problems.push_back("matching.name_threshold must be within [0, 1]");
    if (!is_non_negative(distance_threshold_km))
        problems.push_back("matching.distance_threshold_km must be a non-negative number");
    return problems;
}

std::vector<std::string> validate_filter_criteria(const FilterCriteria& criteria)
{
    std::vector<std::string> problems;
    if (criteria.max_price && !is_non_negative(*criteria.max_price))
        problems.push_back("filter.max_price must be non-negative");
    if (criteria.max_distance_km && !is_non_negative(*criteria.max_distance_km))
        problems.push_back("filter.max_distance_km must be non-negative");
    if (criteria.min_rating && (!is_non_negative(*criteria.min_rating) || *criteria.min_rating > 10.0))
        problems.push_back("filter.min_rating must be within [0, 10]");
    if (criteria.min_reviews && *criteria.min_reviews < 0)
        problems.push_back("filter.min_reviews must be non-negative");
    return problems;
}

void PipelineConfig::validate() const
{
    std::vector<std::string> problems = validate_match_thresholds(matching.name_threshold,
                                                                  matching.distance_threshold_km);

    if (!std::isfinite(normalizer.grid_cell_deg) || normalizer.grid_cell_deg <= 0.0)
        problems.push_back("normalizer.grid_cell_deg must be positive");
    if (!std::isfinite(normalizer.rating_scale_a) || normalizer.rating_scale_a <= 0.0)
        problems.push_back("sources.a_rating_scale must be positive");
    if (!std::isfinite(normalizer.rating_scale_b) || normalizer.rating_scale_b <= 0.0)
        problems.push_back("sources.b_rating_scale must be positive");
    for (const auto& token : normalizer.noise_tokens)
    {
        if (token.empty())
        {
            problems.push_back("normalizer.noise_tokens must not contain empty strings");
            break;
        }
    }

    if (enrichment.popularity_breakpoints[0] < 0 || !strictly_increasing(enrichment.popularity_breakpoints))
        problems.push_back("enrichment.popularity_breakpoints must be non-negative and strictly increasing");
    bool finite_km = true;
    for (double km : enrichment.location_breakpoints_km)
        finite_km = finite_km && is_non_negative(km);
    if (!finite_km || !strictly_increasing(enrichment.location_breakpoints_km))
        problems.push_back("enrichment.location_breakpoints_km must be non-negative and strictly increasing");
    if (enrichment.city_center)
    {
        const auto& c = *enrichment.city_center;
        if (!std::isfinite(c.latitude) || !std::isfinite(c.longitude) || std::abs(c.latitude) > 90.0 ||
            std::abs(c.longitude) > 180.0)
            problems.push_back("enrichment.city_center must be a valid [lat, lon] pair");
    }

    auto filter_problems = validate_filter_criteria(filter);
    problems.insert(problems.end(), filter_problems.begin(), filter_problems.end());

    if (problems.empty())
        return;

    std::ostringstream oss;
    for (std::size_t i = 0; i < problems.size(); ++i)
    {
        if (i)
            oss << "; ";
        oss << problems[i];
    }
    throw ConfigurationError(oss.str());
}

} // namespace processing
