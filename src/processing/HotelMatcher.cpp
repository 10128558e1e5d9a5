#include "HotelMatcher.hpp"
#include "Diagnostics.hpp"
#include "GeoUtils.hpp"
#include "PartitionRunner.hpp"
#include "PipelineErrors.hpp"
#include "RapidfuzzMatcher.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <optional>
#include <plog/Log.h>

namespace processing
{

namespace
{

// True when pair x is preferred over pair y for the same A listing.
bool preferred(const listing::CandidatePair& x, const listing::CandidatePair& y)
{
    if (x.similarity != y.similarity)
        return x.similarity > y.similarity;
    if (x.distance_m != y.distance_m)
        return x.distance_m < y.distance_m;
    return x.b_index < y.b_index;
}

// Claimed-set state threaded through the matching reduction. Indices refer to the pairs vector.
class ClaimState
{
public:
    explicit ClaimState(const std::vector<listing::CandidatePair>& pairs)
        : pairs_(pairs)
    {
    }

    void addEligible(std::size_t pair_idx) { eligible_by_a_[pairs_[pair_idx].a_index].push_back(pair_idx); }

    void rankPreferences()
    {
        for (auto& entry : eligible_by_a_)
        {
            auto& options = entry.second;
            std::stable_sort(options.begin(), options.end(),
                             [this](std::size_t x, std::size_t y) { return preferred(pairs_[x], pairs_[y]); });
        }
    }

    // Each A in index order takes its best unclaimed B.
    void greedyPass()
    {
        for (const auto& [a, options] : eligible_by_a_)
        {
            for (std::size_t pair_idx : options)
            {
                const std::size_t b = pairs_[pair_idx].b_index;
                if (owner_of_b_.count(b))
                    continue;
                assign(a, pair_idx);
                break;
            }
        }
    }

    // Kuhn augmentation from every A left without a partner.
    std::size_t augmentPass()
    {
        std::size_t gained = 0;
        for (const auto& entry : eligible_by_a_)
        {
            const std::size_t a = entry.first;
            if (match_of_a_.count(a))
                continue;
            ++stamp_;
            if (augment(a))
                ++gained;
        }
        return gained;
    }

    [[nodiscard]] std::optional<std::size_t> matchOfA(std::size_t a) const
    {
        auto it = match_of_a_.find(a);
        if (it == match_of_a_.end())
            return std::nullopt;
        return it->second;
    }

private:
    void assign(std::size_t a, std::size_t pair_idx)
    {
        match_of_a_[a] = pair_idx;
        owner_of_b_[pairs_[pair_idx].b_index] = a;
    }

    bool augment(std::size_t a)
    {
        for (std::size_t pair_idx : eligible_by_a_.at(a))
        {
            const std::size_t b = pairs_[pair_idx].b_index;
            auto& seen = visited_[b];
            if (seen == stamp_)
                continue;
            seen = stamp_;

            auto owner = owner_of_b_.find(b);
            if (owner == owner_of_b_.end() || augment(owner->second))
            {
                assign(a, pair_idx);
                return true;
            }
        }
        return false;
    }

    const std::vector<listing::CandidatePair>& pairs_;
    std::map<std::size_t, std::vector<std::size_t>> eligible_by_a_; // ordered: A visited by index
    std::map<std::size_t, std::size_t> match_of_a_;                 // A index -> pair index
    std::map<std::size_t, std::size_t> owner_of_b_;                 // B index -> A index
    std::map<std::size_t, std::size_t> visited_;                    // B index -> stamp
    std::size_t stamp_ = 0;
};

listing::RejectReason thresholdReason(bool similarity_ok, bool distance_ok)
{
    if (!similarity_ok && !distance_ok)
        return listing::RejectReason::SimilarityAndDistance;
    if (!similarity_ok)
        return listing::RejectReason::Similarity;
    return listing::RejectReason::Distance;
}

} // namespace

HotelMatcher::HotelMatcher(MatchConfig config)
    : HotelMatcher(config, std::make_unique<RapidfuzzMatcher>())
{
}

HotelMatcher::HotelMatcher(MatchConfig config, std::unique_ptr<IFuzzyMatcher> fuzzy)
    : config_(config)
    , fuzzy_(std::move(fuzzy))
{
    if (!fuzzy_)
        fuzzy_ = std::make_unique<RapidfuzzMatcher>();
}

HotelMatcher::~HotelMatcher() = default;

listing::CandidatePair HotelMatcher::score(const listing::NormalizedListing& a,
                                           const listing::NormalizedListing& b) const
{
    listing::CandidatePair pair;
    pair.a_index = a.index;
    pair.b_index = b.index;
    pair.similarity = std::clamp(fuzzy_->similarity(a.clean_name, b.clean_name, config_.algorithm), 0.0, 1.0);
    if (a.has_coordinates && b.has_coordinates)
    {
        pair.distance_m = haversineMeters(listing::GeoPoint{ a.latitude, a.longitude },
                                          listing::GeoPoint{ b.latitude, b.longitude });
    }
    else
    {
        pair.distance_m = std::numeric_limits<double>::infinity();
    }
    return pair;
}

std::vector<listing::CandidatePair> HotelMatcher::scorePairs(const std::vector<listing::NormalizedListing>& a,
                                                             const std::vector<listing::NormalizedListing>& b,
                                                             const CandidateSequence& candidates,
                                                             std::size_t worker_threads) const
{
    PROFILE_SCOPE_FUNCTION();

    return run_partitioned<listing::CandidatePair>(
        a.size(), worker_threads, [&](std::size_t begin, std::size_t end) {
            std::vector<listing::CandidatePair> scored;
            for (const auto& idx : candidates.collectRange(begin, end))
                scored.push_back(score(a[idx.a_index], b[idx.b_index]));
            return scored;
        });
}

std::vector<listing::MatchDecision> HotelMatcher::decide(const std::vector<listing::CandidatePair>& pairs,
                                                         double name_threshold, double distance_threshold_km)
{
    PROFILE_SCOPE_FUNCTION();

    auto problems = validate_match_thresholds(name_threshold, distance_threshold_km);
    if (!problems.empty())
        throw ConfigurationError(problems.front());

    const double max_distance_m = distance_threshold_km * 1000.0;

    ClaimState state(pairs);
    std::vector<bool> similarity_ok(pairs.size());
    std::vector<bool> distance_ok(pairs.size());
    for (std::size_t i = 0; i < pairs.size(); ++i)
    {
        similarity_ok[i] = pairs[i].similarity >= name_threshold;
        distance_ok[i] = pairs[i].distance_m <= max_distance_m;
        if (similarity_ok[i] && distance_ok[i])
            state.addEligible(i);
    }

    state.rankPreferences();
    state.greedyPass();
    const std::size_t rerouted = state.augmentPass();

    std::vector<listing::MatchDecision> decisions;
    decisions.reserve(pairs.size());
    std::size_t accepted = 0;
    for (std::size_t i = 0; i < pairs.size(); ++i)
    {
        listing::MatchDecision decision{ .pair = pairs[i] };
        if (!similarity_ok[i] || !distance_ok[i])
        {
            decision.reason = thresholdReason(similarity_ok[i], distance_ok[i]);
        }
        else
        {
            auto match = state.matchOfA(pairs[i].a_index);
            if (match && *match == i)
            {
                decision.accepted = true;
                ++accepted;
            }
            else
            {
                decision.reason = match ? listing::RejectReason::Superseded : listing::RejectReason::Claimed;
            }
        }

        if (decision.accepted && Diagnostics::IsVerbose())
        {
            PLOG_INFO_(Diagnostics::kLogInstance) << "[Matcher] accept " << Diagnostics::Describe(decision.pair);
        }
        decisions.push_back(decision);
    }

    PLOG_INFO_(Diagnostics::kLogInstance) << "[Matcher] pairs=" << pairs.size() << " accepted=" << accepted
                                          << " augmented=" << rerouted;
    return decisions;
}

std::vector<listing::MatchDecision> HotelMatcher::match(const std::vector<listing::NormalizedListing>& a,
                                                        const std::vector<listing::NormalizedListing>& b,
                                                        std::size_t worker_threads) const
{
    auto candidates = generate_candidates(a, b);
    auto scored = scorePairs(a, b, candidates, worker_threads);
    return decide(scored, config_.name_threshold, config_.distance_threshold_km);
}

} // namespace processing
