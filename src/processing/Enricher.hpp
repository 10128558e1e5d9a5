#pragma once

#include "ListingTypes.hpp"
#include "PipelineConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace processing
{

// Partial price aggregate computed by one partition; partials are combined once, sequentially.
struct PriceAccumulator
{
    double sum = 0.0;
    std::size_t count = 0;

    void add(double price) noexcept
    {
        sum += price;
        ++count;
    }

    void combine(const PriceAccumulator& other) noexcept
    {
        sum += other.sum;
        count += other.count;
    }

    [[nodiscard]] std::optional<double> mean() const noexcept
    {
        if (count == 0)
            return std::nullopt;
        return sum / static_cast<double>(count);
    }
};

/// Derives value score, popularity tier and location category over the whole consolidated set.
class Enricher
{
public:
    explicit Enricher(EnrichmentConfig config, std::size_t worker_threads = 0);

    // Throws InsufficientDataError when no hotel has a valid price.
    [[nodiscard]] std::vector<listing::EnrichedHotel> enrich(const std::vector<listing::ConsolidatedHotel>& hotels) const;

    // Mean over hotels with a valid price; empty when there are none.
    [[nodiscard]] std::optional<double> averagePrice(const std::vector<listing::ConsolidatedHotel>& hotels) const;

    // rating / (price / average_price); empty without a valid price.
    [[nodiscard]] static std::optional<double> valueScore(const listing::ConsolidatedHotel& hotel,
                                                          double average_price);

    [[nodiscard]] listing::PopularityTier classifyPopularity(std::int64_t review_count) const noexcept;
    [[nodiscard]] listing::LocationCategory classifyLocation(std::optional<double> distance_km) const noexcept;

private:
    EnrichmentConfig config_;
    std::size_t worker_threads_ = 0;
};

} // namespace processing
