#pragma once

#include "ListingTypes.hpp"
#include "PipelineConfig.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace processing
{

struct StageTiming
{
    std::string stage;
    std::chrono::microseconds duration{};
    bool succeeded = true;
};

// Everything one run produced. Pre-enrichment artefacts are always populated when run() returns;
// enriched/filtered/ranked stay empty when enrichment failed.
struct PipelineResult
{
    std::vector<listing::NormalizedListing> normalized_a;
    std::vector<listing::NormalizedListing> normalized_b;
    std::vector<listing::MatchDecision> decisions;          // Audit trail, one per candidate pair
    std::vector<listing::ConsolidatedHotel> consolidated;
    std::vector<listing::EnrichedHotel> enriched;           // Full view
    std::vector<listing::EnrichedHotel> filtered;           // Criteria applied, input order
    std::vector<listing::EnrichedHotel> ranked;             // Filtered view, top-N by value score
    std::vector<listing::DataQualityWarning> warnings;
    std::vector<StageTiming> timings;
    std::optional<std::string> enrichment_error;
    std::exception_ptr enrichment_failure;

    [[nodiscard]] bool enrichmentSucceeded() const noexcept { return !enrichment_failure; }
    [[nodiscard]] std::size_t acceptedMatches() const noexcept;

    // Rethrows the original enrichment exception (InsufficientDataError); no-op after a successful run.
    void rethrowEnrichmentFailure() const;
};

/**
 * @brief Normalizer -> Candidate Generator -> Matcher -> Consolidator -> Enricher -> Filter Engine.
 *
 * The configuration is validated on construction (ConfigurationError) so a bad threshold aborts
 * before any record is processed. Failures of normalization, matching or consolidation propagate
 * to the caller; an enrichment failure is recorded in the result next to the consolidated data.
 */
class HotelPipeline
{
public:
    explicit HotelPipeline(PipelineConfig config);
    ~HotelPipeline();

    HotelPipeline(const HotelPipeline&) = delete;
    HotelPipeline& operator=(const HotelPipeline&) = delete;

    // Uses the configured filter criteria.
    [[nodiscard]] PipelineResult run(const std::vector<listing::RawListing>& source_a,
                                     const std::vector<listing::RawListing>& source_b) const;

    [[nodiscard]] PipelineResult run(const std::vector<listing::RawListing>& source_a,
                                     const std::vector<listing::RawListing>& source_b,
                                     const FilterCriteria& criteria) const;

    [[nodiscard]] const PipelineConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace processing
