#include "Enricher.hpp"
#include "Diagnostics.hpp"
#include "PartitionRunner.hpp"
#include "PipelineErrors.hpp"
#include "../utils/Profile.hpp"

#include <string>
#include <plog/Log.h>

namespace processing
{

Enricher::Enricher(EnrichmentConfig config, std::size_t worker_threads)
    : config_(config)
    , worker_threads_(worker_threads)
{
}

std::optional<double> Enricher::averagePrice(const std::vector<listing::ConsolidatedHotel>& hotels) const
{
    auto partials = run_partitioned<PriceAccumulator>(
        hotels.size(), worker_threads_, [&hotels](std::size_t begin, std::size_t end) {
            PriceAccumulator local;
            for (std::size_t i = begin; i < end; ++i)
            {
                if (hotels[i].price_valid && hotels[i].price > 0.0)
                    local.add(hotels[i].price);
            }
            return std::vector<PriceAccumulator>{ local };
        });

    PriceAccumulator total;
    for (const auto& part : partials)
        total.combine(part);
    return total.mean();
}

std::optional<double> Enricher::valueScore(const listing::ConsolidatedHotel& hotel, double average_price)
{
    if (!hotel.price_valid || hotel.price <= 0.0 || average_price <= 0.0)
        return std::nullopt;
    return hotel.rating / (hotel.price / average_price);
}

listing::PopularityTier Enricher::classifyPopularity(std::int64_t review_count) const noexcept
{
    const auto& bp = config_.popularity_breakpoints;
    if (review_count < bp[0])
        return listing::PopularityTier::Niche;
    if (review_count < bp[1])
        return listing::PopularityTier::Known;
    if (review_count < bp[2])
        return listing::PopularityTier::Popular;
    return listing::PopularityTier::Landmark;
}

listing::LocationCategory Enricher::classifyLocation(std::optional<double> distance_km) const noexcept
{
    if (!distance_km)
        return listing::LocationCategory::Unknown;
    const auto& bp = config_.location_breakpoints_km;
    if (*distance_km <= bp[0])
        return listing::LocationCategory::Central;
    if (*distance_km <= bp[1])
        return listing::LocationCategory::Near;
    if (*distance_km <= bp[2])
        return listing::LocationCategory::Outer;
    return listing::LocationCategory::Remote;
}

std::vector<listing::EnrichedHotel> Enricher::enrich(const std::vector<listing::ConsolidatedHotel>& hotels) const
{
    PROFILE_SCOPE_FUNCTION();

    const auto average = averagePrice(hotels);
    if (!average)
    {
        throw InsufficientDataError("none of the " + std::to_string(hotels.size()) +
                                    " consolidated hotels has a valid price");
    }

    std::vector<listing::EnrichedHotel> enriched;
    enriched.reserve(hotels.size());
    std::size_t without_value = 0;
    for (const auto& hotel : hotels)
    {
        listing::EnrichedHotel item;
        item.hotel = hotel;
        item.value_score = valueScore(hotel, *average);
        item.popularity = classifyPopularity(hotel.review_count);
        item.location = classifyLocation(hotel.distance_to_center_km);
        if (!item.value_score)
            ++without_value;
        enriched.push_back(std::move(item));
    }

    PLOG_INFO_(Diagnostics::kLogInstance) << "[Enricher] hotels=" << hotels.size() << " average_price=" << *average
                                          << " without_value_score=" << without_value;
    return enriched;
}

} // namespace processing
