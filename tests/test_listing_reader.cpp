#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "ingest/FieldParsers.hpp"
#include "ingest/ListingReader.hpp"
#include "ListingFixtures.hpp"

#include <sstream>

using namespace ingest;
using Catch::Matchers::WithinAbs;

TEST_CASE("FieldParsers - parseLooseNumber", "[ingest]")
{
    REQUIRE_THAT(*parseLooseNumber("\xE2\x82\xAA 1,234"), WithinAbs(1234.0, 1e-9));
    REQUIRE_THAT(*parseLooseNumber("8.4"), WithinAbs(8.4, 1e-9));
    REQUIRE_THAT(*parseLooseNumber("1,500 reviews"), WithinAbs(1500.0, 1e-9));
    REQUIRE_THAT(*parseLooseNumber("Rating 9.1/10"), WithinAbs(9.1, 1e-9));
    REQUIRE_THAT(*parseLooseNumber("-3"), WithinAbs(-3.0, 1e-9));
    REQUIRE_FALSE(parseLooseNumber("no price").has_value());
    REQUIRE_FALSE(parseLooseNumber("").has_value());
}

TEST_CASE("FieldParsers - parseDistanceKm", "[ingest]")
{
    REQUIRE_FALSE(parseDistanceKm("N/A").has_value());
    REQUIRE_FALSE(parseDistanceKm("   ").has_value());
    REQUIRE_THAT(*parseDistanceKm("350 m"), WithinAbs(0.35, 1e-9));
    REQUIRE_THAT(*parseDistanceKm("800"), WithinAbs(0.8, 1e-9));
    REQUIRE_THAT(*parseDistanceKm("1.2 km from centre"), WithinAbs(1.2, 1e-9));
    REQUIRE_THAT(*parseDistanceKm("1.2 KM"), WithinAbs(1.2, 1e-9));
    REQUIRE_THAT(*parseDistanceKm("2.5 \xD7\xA7\"\xD7\x9E"), WithinAbs(2.5, 1e-9));
    REQUIRE_THAT(*parseDistanceKm("700 \xD7\x9E\xD7\x98\xD7\xA8"), WithinAbs(0.7, 1e-9));
}

TEST_CASE("FieldParsers - countDecimals", "[ingest]")
{
    REQUIRE(countDecimals("38.716900") == 6);
    REQUIRE(countDecimals("-9.14") == 2);
    REQUIRE(countDecimals("12") == 0);
    REQUIRE_FALSE(countDecimals("abc").has_value());
    REQUIRE_FALSE(countDecimals("38.7N").has_value());
}

TEST_CASE("ListingReader - parseLine", "[ingest]")
{
    ListingReader reader(listing::Source::B);

    SECTION("Numeric fields and coordinate pair")
    {
        auto raw = reader.parseLine(
            R"({"name": "Grand Plaza", "price": 115, "rating": 8.4, "reviews": 1500, "coordinates": [38.717, -9.14], "distance_km": 0.8, "url": "https://b.example/1"})");
        REQUIRE(raw.has_value());
        REQUIRE(raw->source == listing::Source::B);
        REQUIRE(raw->name == "Grand Plaza");
        REQUIRE_THAT(*raw->price, WithinAbs(115.0, 1e-9));
        REQUIRE_THAT(*raw->rating, WithinAbs(8.4, 1e-9));
        REQUIRE(*raw->review_count == 1500);
        REQUIRE_THAT(*raw->latitude, WithinAbs(38.717, 1e-9));
        REQUIRE_THAT(*raw->longitude, WithinAbs(-9.14, 1e-9));
        REQUIRE_FALSE(raw->coordinate_decimals.has_value());
        REQUIRE_THAT(*raw->distance_to_center_km, WithinAbs(0.8, 1e-9));
        REQUIRE(raw->url == "https://b.example/1");
    }

    SECTION("Scraped strings and key aliases")
    {
        auto raw = reader.parseLine(
            R"({"hotel_name": "Casa Azul", "price": "€ 1,050", "rating": "9.1", "review_amount": "230 reviews", "lat": "38.716900", "lng": "-9.1399", "distance": "350 m"})");
        REQUIRE(raw.has_value());
        REQUIRE(raw->name == "Casa Azul");
        REQUIRE_THAT(*raw->price, WithinAbs(1050.0, 1e-9));
        REQUIRE_THAT(*raw->rating, WithinAbs(9.1, 1e-9));
        REQUIRE(*raw->review_count == 230);
        REQUIRE(raw->coordinate_decimals == 6);
        REQUIRE_THAT(*raw->distance_to_center_km, WithinAbs(0.35, 1e-9));
    }

    SECTION("Missing values stay empty")
    {
        auto raw = reader.parseLine(R"({"name": "Bare", "price": null, "distance": "N/A"})");
        REQUIRE(raw.has_value());
        REQUIRE_FALSE(raw->price.has_value());
        REQUIRE_FALSE(raw->latitude.has_value());
        REQUIRE_FALSE(raw->distance_to_center_km.has_value());
    }

    SECTION("Rejected lines")
    {
        REQUIRE_FALSE(reader.parseLine("{not json").has_value());
        REQUIRE_FALSE(reader.parseLine(R"(["array"])").has_value());
        REQUIRE_FALSE(reader.parseLine(R"({"price": 100})").has_value());
        REQUIRE_FALSE(reader.parseLine(R"({"name": 42})").has_value());
    }
}

TEST_CASE("ListingReader - load", "[ingest]")
{
    SECTION("Stream with blank and malformed lines")
    {
        std::istringstream input(
            "{\"name\": \"One\", \"price\": 100}\n"
            "\n"
            "{\"name\": \"Two\", \"price\": 120}\n"
            "garbage\n"
            "   \n"
            "{\"price\": 90}\n"
            "{\"name\": \"Three\"}\n");

        ListingReader reader(listing::Source::A);
        REQUIRE(reader.load(input, "memory"));
        REQUIRE(reader.listings().size() == 3);
        REQUIRE(reader.skippedLines() == 2);
        REQUIRE(reader.listings()[2].name == "Three");

        auto taken = reader.takeListings();
        REQUIRE(taken.size() == 3);
    }

    SECTION("File on disk")
    {
        TempFile file("source_a.jsonl", "{\"name\": \"One\", \"price\": 100}\n{\"name\": \"Two\"}\n");
        ListingReader reader(listing::Source::A);
        REQUIRE(reader.load(file.path()));
        REQUIRE(reader.listings().size() == 2);
        REQUIRE(reader.lastError().empty());
    }

    SECTION("Missing file")
    {
        ListingReader reader(listing::Source::A);
        REQUIRE_FALSE(reader.load(std::string("no_such_listings.jsonl")));
        REQUIRE_FALSE(reader.lastError().empty());
    }
}
