#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "processing/HotelPipeline.hpp"
#include "processing/PipelineErrors.hpp"
#include "utils/ErrorReporter.hpp"
#include "ListingFixtures.hpp"

#include <algorithm>
#include <set>
#include <vector>

using namespace processing;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace
{

PipelineConfig lisbonConfig()
{
    PipelineConfig config;
    config.normalizer.rating_scale_a = 5.0;
    config.normalizer.rating_scale_b = 10.0;
    config.matching.name_threshold = 0.8;
    config.matching.distance_threshold_km = 0.2;
    config.worker_threads = 2;
    return config;
}

listing::RawListing plazaA()
{
    return makeRaw(listing::Source::A, "Grand Plaza Hotel & Spa", 120.0, 4.2, 900, 38.7169, -9.1399);
}

listing::RawListing plazaB()
{
    return makeRaw(listing::Source::B, "grand plaza hotel", 115.0, 8.4, 1500, 38.7170, -9.1400);
}

} // namespace

TEST_CASE("HotelPipeline - same hotel on both platforms", "[pipeline]")
{
    utils::ErrorReporter::Clear();
    HotelPipeline pipeline(lisbonConfig());

    auto result = pipeline.run({ plazaA() }, { plazaB() });

    REQUIRE(result.decisions.size() == 1);
    REQUIRE(result.acceptedMatches() == 1);
    REQUIRE(result.consolidated.size() == 1);

    const auto& hotel = result.consolidated.front();
    REQUIRE(hotel.name == "Grand Plaza Hotel & Spa");
    REQUIRE(hotel.isMatched());
    REQUIRE_THAT(hotel.price, WithinAbs(115.0, 1e-9));
    REQUIRE(hotel.price_source == listing::Source::B);
    REQUIRE_THAT(hotel.rating, WithinAbs(8.4, 1e-9));
    REQUIRE(hotel.review_count == 1500);

    REQUIRE(result.enrichmentSucceeded());
    REQUIRE(result.enriched.size() == 1);
    REQUIRE_THAT(*result.enriched.front().value_score, WithinAbs(8.4, 1e-9));
    REQUIRE(result.ranked.size() == 1);
    REQUIRE(result.warnings.empty());
}

TEST_CASE("HotelPipeline - single-source hotel is kept", "[pipeline]")
{
    HotelPipeline pipeline(lisbonConfig());

    auto solo = makeRaw(listing::Source::A, "Solo Inn", 85.0, 3.5, 40, 38.80, -9.00);
    auto result = pipeline.run({ plazaA(), solo }, { plazaB() });

    REQUIRE(result.consolidated.size() == 2);
    REQUIRE(result.consolidated[1].name == "Solo Inn");
    REQUIRE(result.consolidated[1].sources == std::vector<listing::Source>{ listing::Source::A });

    REQUIRE(result.enriched.size() == 2);
    // Average price over both hotels is 100
    REQUIRE_THAT(*result.enriched[0].value_score, WithinAbs(8.4 / 1.15, 1e-9));
    REQUIRE_THAT(*result.enriched[1].value_score, WithinAbs(7.0 / 0.85, 1e-9));

    REQUIRE(result.ranked.size() == 2);
    REQUIRE(result.ranked[0].hotel.name == "Solo Inn");
}

TEST_CASE("HotelPipeline - every listing ends up in exactly one hotel", "[pipeline]")
{
    HotelPipeline pipeline(lisbonConfig());

    std::vector<listing::RawListing> a;
    std::vector<listing::RawListing> b;
    for (int i = 0; i < 12; ++i)
    {
        const double lat = 38.70 + 0.003 * i;
        a.push_back(makeRaw(listing::Source::A, "Residencial " + std::to_string(i), 60.0 + i, 4.0, 100 + i, lat, -9.14));
        if (i % 3 != 0)
            b.push_back(makeRaw(listing::Source::B, "Residencial " + std::to_string(i), 62.0 + i, 8.1, 90 + i, lat + 0.0001, -9.14));
    }
    b.push_back(makeRaw(listing::Source::B, "Unmatched Only B", 70.0, 7.0, 10, std::nullopt, std::nullopt));

    auto result = pipeline.run(a, b);

    REQUIRE(result.consolidated.size() == a.size() + b.size() - result.acceptedMatches());

    std::set<std::size_t> seen_a;
    std::set<std::size_t> seen_b;
    for (const auto& hotel : result.consolidated)
    {
        if (hotel.a_index)
            REQUIRE(seen_a.insert(*hotel.a_index).second);
        if (hotel.b_index)
            REQUIRE(seen_b.insert(*hotel.b_index).second);
    }
    REQUIRE(seen_a.size() == a.size());
    REQUIRE(seen_b.size() == b.size());

    // The listing without coordinates is reported and never matched
    REQUIRE(std::any_of(result.warnings.begin(), result.warnings.end(), [](const listing::DataQualityWarning& w) {
        return w.source == listing::Source::B && w.field == "coordinates";
    }));
    REQUIRE_FALSE(result.consolidated.back().isMatched());
}

TEST_CASE("HotelPipeline - enrichment failure keeps consolidated data", "[pipeline]")
{
    utils::ErrorReporter::Clear();
    HotelPipeline pipeline(lisbonConfig());

    auto a = plazaA();
    a.price.reset();
    auto b = plazaB();
    b.price = -1.0;

    auto result = pipeline.run({ a }, { b });

    REQUIRE_FALSE(result.enrichmentSucceeded());
    REQUIRE(result.enrichment_error.has_value());
    REQUIRE_THAT(*result.enrichment_error, ContainsSubstring("insufficient data"));
    REQUIRE(result.consolidated.size() == 1);
    REQUIRE(result.enriched.empty());
    REQUIRE(result.ranked.empty());
    REQUIRE_THROWS_AS(result.rethrowEnrichmentFailure(), InsufficientDataError);

    auto reports = utils::ErrorReporter::TakeReports();
    REQUIRE(std::any_of(reports.begin(), reports.end(), [](const utils::ErrorReport& r) {
        return r.category == utils::ErrorCategory::Enrichment;
    }));
}

TEST_CASE("HotelPipeline - filter criteria", "[pipeline]")
{
    HotelPipeline pipeline(lisbonConfig());
    auto solo = makeRaw(listing::Source::A, "Solo Inn", 85.0, 3.5, 40, 38.80, -9.00);

    SECTION("Nothing under the price ceiling")
    {
        FilterCriteria criteria;
        criteria.max_price = 50.0;
        auto result = pipeline.run({ plazaA(), solo }, { plazaB() }, criteria);
        REQUIRE(result.enrichmentSucceeded());
        REQUIRE(result.enriched.size() == 2);
        REQUIRE(result.filtered.empty());
        REQUIRE(result.ranked.empty());
    }

    SECTION("Review floor")
    {
        FilterCriteria criteria;
        criteria.min_reviews = 1000;
        auto result = pipeline.run({ plazaA(), solo }, { plazaB() }, criteria);
        REQUIRE(result.filtered.size() == 1);
        REQUIRE(result.filtered.front().hotel.name == "Grand Plaza Hotel & Spa");
    }

    SECTION("Invalid criteria abort the run")
    {
        FilterCriteria criteria;
        criteria.max_price = -10.0;
        REQUIRE_THROWS_AS(pipeline.run({ plazaA() }, { plazaB() }, criteria), ConfigurationError);
    }
}

TEST_CASE("HotelPipeline - invalid configuration", "[pipeline]")
{
    auto config = lisbonConfig();

    SECTION("Name threshold above one")
    {
        config.matching.name_threshold = 1.2;
        REQUIRE_THROWS_AS(HotelPipeline(config), ConfigurationError);
    }

    SECTION("Negative distance threshold")
    {
        config.matching.distance_threshold_km = -0.5;
        REQUIRE_THROWS_AS(HotelPipeline(config), ConfigurationError);
    }
}

TEST_CASE("HotelPipeline - stage timings and empty inputs", "[pipeline]")
{
    HotelPipeline pipeline(lisbonConfig());

    SECTION("Successful run records every stage")
    {
        auto result = pipeline.run({ plazaA() }, { plazaB() });
        std::vector<std::string> stages;
        for (const auto& timing : result.timings)
        {
            stages.push_back(timing.stage);
            REQUIRE(timing.succeeded);
        }
        REQUIRE(stages == std::vector<std::string>{ "normalize", "match", "consolidate", "enrich", "filter" });
    }

    SECTION("Empty sources fail enrichment only")
    {
        auto result = pipeline.run({}, {});
        REQUIRE(result.consolidated.empty());
        REQUIRE(result.decisions.empty());
        REQUIRE_FALSE(result.enrichmentSucceeded());
        REQUIRE_FALSE(result.timings.back().succeeded);
        REQUIRE(result.timings.back().stage == "enrich");
    }
}
