#pragma once

#include "ListingTypes.hpp"

#include <optional>
#include <vector>

namespace processing
{

// Merges accepted matches and passes unmatched listings through, one ConsolidatedHotel per physical hotel.
// Output: A listings in index order (merged or single-source), then unmatched B listings in index order.
class Consolidator
{
public:
    // With a city centre, distance to centre is recomputed from the chosen coordinates.
    explicit Consolidator(std::optional<listing::GeoPoint> city_center = std::nullopt);

    // Throws std::invalid_argument when an accepted decision references an unknown listing or reuses one.
    [[nodiscard]] std::vector<listing::ConsolidatedHotel> consolidate(
        const std::vector<listing::NormalizedListing>& a, const std::vector<listing::NormalizedListing>& b,
        const std::vector<listing::MatchDecision>& decisions) const;

    // Field precedence: rating and price from the higher review count (ties to A), coordinates from the
    // more precise source (ties to A).
    [[nodiscard]] listing::ConsolidatedHotel merge(const listing::NormalizedListing& a,
                                                   const listing::NormalizedListing& b,
                                                   const listing::CandidatePair& pair) const;

    [[nodiscard]] listing::ConsolidatedHotel passThrough(const listing::NormalizedListing& single) const;

private:
    void resolveDistance(listing::ConsolidatedHotel& hotel, const listing::NormalizedListing* preferred,
                         const listing::NormalizedListing* other) const;

    std::optional<listing::GeoPoint> city_center_;
};

} // namespace processing
