#include "HotelPipeline.hpp"
#include "Consolidator.hpp"
#include "Diagnostics.hpp"
#include "Enricher.hpp"
#include "FilterEngine.hpp"
#include "HotelMatcher.hpp"
#include "ListingNormalizer.hpp"
#include "PipelineErrors.hpp"
#include "StageRunner.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <utility>
#include <plog/Log.h>

namespace processing
{

namespace
{

using NormalizedPair = std::pair<std::vector<listing::NormalizedListing>, std::vector<listing::NormalizedListing>>;

struct RankedViews
{
    std::vector<listing::EnrichedHotel> filtered;
    std::vector<listing::EnrichedHotel> ranked;
};

template<typename T>
void recordStage(PipelineResult& result, const listing::StageResult<T>& stage)
{
    result.timings.push_back(StageTiming{
        .stage = stage.stage_name,
        .duration = stage.duration,
        .succeeded = stage.succeeded,
    });
}

template<typename T>
void rethrowIfFailed(const listing::StageResult<T>& stage)
{
    if (!stage.succeeded && stage.cause)
        std::rethrow_exception(stage.cause);
}

void collectWarnings(PipelineResult& result)
{
    for (const auto* side : { &result.normalized_a, &result.normalized_b })
    {
        for (const auto& item : *side)
            result.warnings.insert(result.warnings.end(), item.warnings.begin(), item.warnings.end());
    }
}

void reportDataQuality(const PipelineResult& result)
{
    if (result.warnings.empty())
        return;

    std::map<std::string, std::size_t> by_field;
    for (const auto& warning : result.warnings)
        ++by_field[warning.field];

    std::ostringstream details;
    bool first = true;
    for (const auto& [field, count] : by_field)
    {
        details << (first ? "" : " ") << field << "=" << count;
        first = false;
    }

    std::ostringstream message;
    message << result.warnings.size() << " listing fields were defaulted during normalization";
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::DataQuality, message.str(), details.str());
}

} // namespace

std::size_t PipelineResult::acceptedMatches() const noexcept
{
    return static_cast<std::size_t>(std::count_if(decisions.begin(), decisions.end(),
                                                  [](const listing::MatchDecision& d) { return d.accepted; }));
}

void PipelineResult::rethrowEnrichmentFailure() const
{
    if (enrichment_failure)
        std::rethrow_exception(enrichment_failure);
}

struct HotelPipeline::Impl
{
    explicit Impl(PipelineConfig cfg)
        : config(std::move(cfg))
        , normalizer(config.normalizer)
        , matcher(config.matching)
        , consolidator(config.enrichment.city_center)
        , enricher(config.enrichment, config.worker_threads)
    {
    }

    PipelineConfig config;
    ListingNormalizer normalizer;
    HotelMatcher matcher;
    Consolidator consolidator;
    Enricher enricher;
};

HotelPipeline::HotelPipeline(PipelineConfig config)
{
    config.validate();
    impl_ = std::make_unique<Impl>(std::move(config));
    PLOG_INFO << "HotelPipeline ready (algorithm=" << std::string(to_string(impl_->config.matching.algorithm))
              << ", name_threshold=" << impl_->config.matching.name_threshold
              << ", distance_threshold_km=" << impl_->config.matching.distance_threshold_km
              << ", grid_cell_deg=" << impl_->config.normalizer.grid_cell_deg << ")";
}

HotelPipeline::~HotelPipeline() = default;

const PipelineConfig& HotelPipeline::config() const noexcept
{
    return impl_->config;
}

PipelineResult HotelPipeline::run(const std::vector<listing::RawListing>& source_a,
                                  const std::vector<listing::RawListing>& source_b) const
{
    return run(source_a, source_b, impl_->config.filter);
}

PipelineResult HotelPipeline::run(const std::vector<listing::RawListing>& source_a,
                                  const std::vector<listing::RawListing>& source_b,
                                  const FilterCriteria& criteria) const
{
    PROFILE_SCOPE_CUSTOM("HotelPipeline::run");

    // Criteria are configuration too: reject them before touching any record.
    if (auto problems = validate_filter_criteria(criteria); !problems.empty())
        throw ConfigurationError(problems.front());

    const auto& cfg = impl_->config;
    PipelineResult result;

    PLOG_INFO << "Pipeline run: " << cfg.source_a_name << "=" << source_a.size() << " listings, "
              << cfg.source_b_name << "=" << source_b.size() << " listings";

    auto normalized = run_stage<NormalizedPair>("normalize", [&]() {
        return NormalizedPair{ impl_->normalizer.normalizeAll(source_a, listing::Source::A, cfg.worker_threads),
                               impl_->normalizer.normalizeAll(source_b, listing::Source::B, cfg.worker_threads) };
    });
    recordStage(result, normalized);
    rethrowIfFailed(normalized);
    result.normalized_a = std::move(normalized.result.first);
    result.normalized_b = std::move(normalized.result.second);
    collectWarnings(result);
    reportDataQuality(result);

    auto matched = run_stage<std::vector<listing::MatchDecision>>("match", [&]() {
        return impl_->matcher.match(result.normalized_a, result.normalized_b, cfg.worker_threads);
    });
    recordStage(result, matched);
    rethrowIfFailed(matched);
    result.decisions = std::move(matched.result);

    auto consolidated = run_stage<std::vector<listing::ConsolidatedHotel>>("consolidate", [&]() {
        return impl_->consolidator.consolidate(result.normalized_a, result.normalized_b, result.decisions);
    });
    recordStage(result, consolidated);
    rethrowIfFailed(consolidated);
    result.consolidated = std::move(consolidated.result);

    auto enriched = run_stage<std::vector<listing::EnrichedHotel>>(
        "enrich", [&]() { return impl_->enricher.enrich(result.consolidated); });
    recordStage(result, enriched);
    if (!enriched.succeeded)
    {
        result.enrichment_error = enriched.error;
        result.enrichment_failure = enriched.cause;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Enrichment, "Value scores could not be computed",
                                          enriched.error.value_or("unknown"));
        return result;
    }
    result.enriched = std::move(enriched.result);

    auto views = run_stage<RankedViews>("filter", [&]() {
        RankedViews out;
        out.filtered = FilterEngine::filter(result.enriched, criteria);
        out.ranked = FilterEngine::rank(out.filtered, cfg.top_n);
        return out;
    });
    recordStage(result, views);
    rethrowIfFailed(views);
    result.filtered = std::move(views.result.filtered);
    result.ranked = std::move(views.result.ranked);

    PLOG_INFO << "Pipeline done: hotels=" << result.consolidated.size() << " matched=" << result.acceptedMatches()
              << " filtered=" << result.filtered.size() << " ranked=" << result.ranked.size()
              << " warnings=" << result.warnings.size();
    return result;
}

} // namespace processing
