#pragma once

#include "CandidateGenerator.hpp"
#include "IFuzzyMatcher.hpp"
#include "ListingTypes.hpp"
#include "PipelineConfig.hpp"

#include <memory>
#include <vector>

namespace processing
{

/**
 * @brief Scores candidate pairs and resolves them into a one-to-one matching.
 *
 * A pair is eligible when similarity >= name_threshold and distance <= distance_threshold_km.
 * decide() produces exactly one MatchDecision per input pair, in input order:
 * - Each A listing first takes its preferred eligible B (highest similarity, then smaller distance,
 *   then lower B index) unless that B is already claimed; A listings are visited in index order.
 * - Claims are then re-routed along augmenting paths so that the matching has maximum cardinality,
 *   which keeps the accepted count monotonic in both thresholds.
 * - Rejected pairs carry the threshold that failed, or Superseded / Claimed for eligible pairs that lost.
 */
class HotelMatcher
{
public:
    explicit HotelMatcher(MatchConfig config);
    HotelMatcher(MatchConfig config, std::unique_ptr<IFuzzyMatcher> fuzzy);
    ~HotelMatcher();

    HotelMatcher(const HotelMatcher&) = delete;
    HotelMatcher& operator=(const HotelMatcher&) = delete;

    // Similarity of the cleaned names and great-circle distance in meters. Distance is +inf when
    // either listing lacks coordinates.
    [[nodiscard]] listing::CandidatePair score(const listing::NormalizedListing& a,
                                               const listing::NormalizedListing& b) const;

    // Scores every candidate pair, partitioned by A range over worker threads. Order follows the sequence.
    [[nodiscard]] std::vector<listing::CandidatePair> scorePairs(const std::vector<listing::NormalizedListing>& a,
                                                                 const std::vector<listing::NormalizedListing>& b,
                                                                 const CandidateSequence& candidates,
                                                                 std::size_t worker_threads = 0) const;

    // Throws ConfigurationError for thresholds outside their domain.
    [[nodiscard]] static std::vector<listing::MatchDecision> decide(const std::vector<listing::CandidatePair>& pairs,
                                                                    double name_threshold,
                                                                    double distance_threshold_km);

    // generate_candidates + scorePairs + decide with the configured thresholds.
    [[nodiscard]] std::vector<listing::MatchDecision> match(const std::vector<listing::NormalizedListing>& a,
                                                            const std::vector<listing::NormalizedListing>& b,
                                                            std::size_t worker_threads = 0) const;

    [[nodiscard]] const MatchConfig& config() const noexcept { return config_; }

private:
    MatchConfig config_;
    std::unique_ptr<IFuzzyMatcher> fuzzy_;
};

} // namespace processing
