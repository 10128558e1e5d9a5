#include "FilterEngine.hpp"
#include "Diagnostics.hpp"
#include "PipelineErrors.hpp"

#include <algorithm>
#include <iterator>
#include <plog/Log.h>

namespace processing
{

bool FilterEngine::accepts(const listing::EnrichedHotel& enriched, const FilterCriteria& criteria) noexcept
{
    const auto& hotel = enriched.hotel;

    if (criteria.max_price && (!hotel.price_valid || hotel.price > *criteria.max_price))
        return false;
    if (criteria.max_distance_km &&
        (!hotel.distance_to_center_km || *hotel.distance_to_center_km > *criteria.max_distance_km))
        return false;
    if (criteria.min_rating && (!hotel.rated || hotel.rating < *criteria.min_rating))
        return false;
    if (criteria.min_reviews && hotel.review_count < *criteria.min_reviews)
        return false;
    return true;
}

std::vector<listing::EnrichedHotel> FilterEngine::filter(const std::vector<listing::EnrichedHotel>& hotels,
                                                         const FilterCriteria& criteria)
{
    auto problems = validate_filter_criteria(criteria);
    if (!problems.empty())
        throw ConfigurationError(problems.front());

    std::vector<listing::EnrichedHotel> kept;
    std::copy_if(hotels.begin(), hotels.end(), std::back_inserter(kept),
                 [&criteria](const listing::EnrichedHotel& h) { return accepts(h, criteria); });

    PLOG_INFO_(Diagnostics::kLogInstance) << "[FilterEngine] kept " << kept.size() << "/" << hotels.size();
    return kept;
}

std::vector<listing::EnrichedHotel> FilterEngine::rank(const std::vector<listing::EnrichedHotel>& hotels,
                                                       std::size_t top_n)
{
    std::vector<listing::EnrichedHotel> ranked;
    std::copy_if(hotels.begin(), hotels.end(), std::back_inserter(ranked),
                 [](const listing::EnrichedHotel& h) { return h.value_score.has_value(); });

    std::stable_sort(ranked.begin(), ranked.end(), [](const listing::EnrichedHotel& x, const listing::EnrichedHotel& y) {
        return *x.value_score > *y.value_score;
    });

    if (top_n > 0 && ranked.size() > top_n)
        ranked.resize(top_n);
    return ranked;
}

} // namespace processing
