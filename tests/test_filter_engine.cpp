#include <catch2/catch_test_macros.hpp>
#include "processing/FilterEngine.hpp"
#include "processing/PipelineErrors.hpp"
#include "ListingFixtures.hpp"

#include <string>
#include <vector>

using namespace processing;

namespace
{

listing::EnrichedHotel enriched(const std::string& name, std::optional<double> price, std::optional<double> rating,
                                std::int64_t reviews, std::optional<double> distance_km,
                                std::optional<double> value)
{
    listing::EnrichedHotel e;
    e.hotel = makeHotel(name, price, rating, reviews, distance_km);
    e.value_score = value;
    return e;
}

std::vector<std::string> names(const std::vector<listing::EnrichedHotel>& hotels)
{
    std::vector<std::string> out;
    for (const auto& h : hotels)
        out.push_back(h.hotel.name);
    return out;
}

} // namespace

TEST_CASE("FilterEngine - filter", "[filter]")
{
    std::vector<listing::EnrichedHotel> hotels = {
        enriched("Plaza", 115.0, 8.4, 1500, 0.4, 8.0),
        enriched("Solo Inn", 85.0, 7.0, 50, 5.0, 9.0),
        enriched("Marina", 140.0, 9.1, 300, std::nullopt, 7.0),
        enriched("Hostel", 30.0, std::nullopt, 5, 1.2, 0.0),
        enriched("No Price", std::nullopt, 9.0, 700, 0.2, std::nullopt),
    };

    SECTION("No criteria keeps everything in order")
    {
        REQUIRE(names(FilterEngine::filter(hotels, FilterCriteria{})) == names(hotels));
    }

    SECTION("Price ceiling")
    {
        FilterCriteria criteria;
        criteria.max_price = 115.0;
        REQUIRE(names(FilterEngine::filter(hotels, criteria)) ==
                std::vector<std::string>{ "Plaza", "Solo Inn", "Hostel" });
    }

    SECTION("Conjunction of criteria")
    {
        FilterCriteria criteria;
        criteria.max_price = 150.0;
        criteria.min_rating = 7.5;
        criteria.min_reviews = 100;
        REQUIRE(names(FilterEngine::filter(hotels, criteria)) == std::vector<std::string>{ "Plaza", "Marina" });
    }

    SECTION("Distance criterion drops hotels without a distance")
    {
        FilterCriteria criteria;
        criteria.max_distance_km = 10.0;
        REQUIRE(names(FilterEngine::filter(hotels, criteria)) ==
                std::vector<std::string>{ "Plaza", "Solo Inn", "Hostel", "No Price" });
    }

    SECTION("Rating criterion drops unrated hotels")
    {
        FilterCriteria criteria;
        criteria.min_rating = 0.0;
        REQUIRE(names(FilterEngine::filter(hotels, criteria)) ==
                std::vector<std::string>{ "Plaza", "Solo Inn", "Marina", "No Price" });
    }

    SECTION("Nothing qualifies")
    {
        std::vector<listing::EnrichedHotel> pricey = {
            enriched("A", 150.0, 8.0, 10, 1.0, 5.0),
            enriched("B", 220.0, 9.0, 10, 1.0, 4.0),
        };
        FilterCriteria criteria;
        criteria.max_price = 100.0;
        REQUIRE(FilterEngine::filter(pricey, criteria).empty());
    }
}

TEST_CASE("FilterEngine - invalid criteria", "[filter]")
{
    std::vector<listing::EnrichedHotel> hotels = { enriched("Plaza", 115.0, 8.4, 1500, 0.4, 8.0) };

    FilterCriteria negative_price;
    negative_price.max_price = -1.0;
    REQUIRE_THROWS_AS(FilterEngine::filter(hotels, negative_price), ConfigurationError);

    FilterCriteria rating_too_high;
    rating_too_high.min_rating = 11.0;
    REQUIRE_THROWS_AS(FilterEngine::filter(hotels, rating_too_high), ConfigurationError);

    FilterCriteria negative_reviews;
    negative_reviews.min_reviews = -5;
    REQUIRE_THROWS_AS(FilterEngine::filter(hotels, negative_reviews), ConfigurationError);
}

TEST_CASE("FilterEngine - rank", "[filter]")
{
    std::vector<listing::EnrichedHotel> hotels = {
        enriched("Mid", 100.0, 8.0, 10, 1.0, 8.0),
        enriched("Top", 80.0, 9.0, 10, 1.0, 11.0),
        enriched("Unpriced", std::nullopt, 9.5, 10, 1.0, std::nullopt),
        enriched("Mid Twin", 100.0, 8.0, 10, 1.0, 8.0),
        enriched("Low", 200.0, 7.0, 10, 1.0, 3.5),
    };

    SECTION("Descending value, ties keep input order")
    {
        REQUIRE(names(FilterEngine::rank(hotels, 0)) ==
                std::vector<std::string>{ "Top", "Mid", "Mid Twin", "Low" });
    }

    SECTION("Truncated to top N")
    {
        REQUIRE(names(FilterEngine::rank(hotels, 2)) == std::vector<std::string>{ "Top", "Mid" });
    }

    SECTION("N larger than the input")
    {
        REQUIRE(FilterEngine::rank(hotels, 50).size() == 4);
    }

    SECTION("Empty input")
    {
        REQUIRE(FilterEngine::rank({}, 10).empty());
    }
}
