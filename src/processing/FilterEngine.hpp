#pragma once

#include "ListingTypes.hpp"
#include "PipelineConfig.hpp"

#include <cstddef>
#include <vector>

namespace processing
{

/// Applies business thresholds to the enriched view and ranks the survivors by value.
class FilterEngine
{
public:
    // Conjunction of the present criteria; input order is preserved and an empty result is not an error.
    // A criterion on a dimension rejects hotels lacking that dimension.
    // Throws ConfigurationError for negative or out-of-range criteria.
    [[nodiscard]] static std::vector<listing::EnrichedHotel> filter(const std::vector<listing::EnrichedHotel>& hotels,
                                                                    const FilterCriteria& criteria);

    [[nodiscard]] static bool accepts(const listing::EnrichedHotel& hotel, const FilterCriteria& criteria) noexcept;

    // Stable sort by value score descending, hotels without a score dropped, truncated to top_n (0 = all).
    [[nodiscard]] static std::vector<listing::EnrichedHotel> rank(const std::vector<listing::EnrichedHotel>& hotels,
                                                                  std::size_t top_n);
};

} // namespace processing
