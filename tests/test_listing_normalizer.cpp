#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "processing/ListingNormalizer.hpp"
#include "ListingFixtures.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace processing;
using Catch::Matchers::WithinAbs;

namespace
{

bool hasWarning(const listing::NormalizedListing& n, const std::string& field)
{
    return std::any_of(n.warnings.begin(), n.warnings.end(),
                       [&](const listing::DataQualityWarning& w) { return w.field == field; });
}

} // namespace

TEST_CASE("ListingNormalizer - cleanName removes noise tokens", "[normalizer]")
{
    ListingNormalizer normalizer(NormalizerConfig{});

    REQUIRE(normalizer.cleanName("Grand Plaza Hotel & Spa") == "plaza");
    REQUIRE(normalizer.cleanName("grand plaza hotel") == "plaza");
    REQUIRE(normalizer.cleanName("Hôtel Le Marais") == "le marais");
    REQUIRE(normalizer.cleanName("  Pousada   São João ") == "pousada sao joao");
}

TEST_CASE("ListingNormalizer - cleanName keeps all-noise names", "[normalizer]")
{
    ListingNormalizer normalizer(NormalizerConfig{});

    REQUIRE(normalizer.cleanName("The Grand Hotel") == "the grand hotel");
    REQUIRE(normalizer.cleanName("").empty());
}

TEST_CASE("ListingNormalizer - cleanName is idempotent", "[normalizer]")
{
    ListingNormalizer normalizer(NormalizerConfig{});
    const std::vector<std::string> names = {
        "Grand Plaza Hotel & Spa", "The Grand Hotel", "Hôtel d'Angleterre", "Suites & Apartments 21",
        "Casa---Azul (Boutique)",  "",
    };

    for (const auto& name : names)
    {
        const std::string once = normalizer.cleanName(name);
        REQUIRE(normalizer.cleanName(once) == once);
    }
}

TEST_CASE("ListingNormalizer - rescaleRating", "[normalizer]")
{
    REQUIRE_THAT(*ListingNormalizer::rescaleRating(4.2, 5.0), WithinAbs(8.4, 1e-9));
    REQUIRE_THAT(*ListingNormalizer::rescaleRating(10.0, 10.0), WithinAbs(10.0, 1e-9));
    REQUIRE_FALSE(ListingNormalizer::rescaleRating(std::nullopt, 10.0));
    REQUIRE_FALSE(ListingNormalizer::rescaleRating(0.0, 10.0));
    REQUIRE_FALSE(ListingNormalizer::rescaleRating(6.0, 5.0));
    REQUIRE_FALSE(ListingNormalizer::rescaleRating(-1.0, 10.0));
}

TEST_CASE("ListingNormalizer - well-formed record", "[normalizer]")
{
    NormalizerConfig config;
    config.rating_scale_a = 5.0;
    ListingNormalizer normalizer(config);

    auto raw = makeRaw(listing::Source::A, "Grand Plaza Hotel & Spa", 120.0, 4.2, 900, 38.7169, -9.1399);
    raw.distance_to_center_km = 0.8;
    auto n = normalizer.normalize(raw, 7);

    REQUIRE(n.source == listing::Source::A);
    REQUIRE(n.index == 7);
    REQUIRE(n.raw_name == "Grand Plaza Hotel & Spa");
    REQUIRE(n.clean_name == "plaza");
    REQUIRE(n.price_valid);
    REQUIRE_THAT(n.price, WithinAbs(120.0, 1e-9));
    REQUIRE(n.rated);
    REQUIRE_THAT(n.rating, WithinAbs(8.4, 1e-9));
    REQUIRE(n.review_count == 900);
    REQUIRE(n.has_coordinates);
    REQUIRE(n.coordinate_decimals == 4);
    REQUIRE(n.distance_to_center_km.has_value());
    REQUIRE(n.warnings.empty());
}

TEST_CASE("ListingNormalizer - malformed fields are defaulted with warnings", "[normalizer]")
{
    ListingNormalizer normalizer(NormalizerConfig{});

    SECTION("Missing price")
    {
        auto n = normalizer.normalize(makeRaw(listing::Source::B, "Casa Azul", std::nullopt, 8.0, 10, 38.7, -9.1), 0);
        REQUIRE_FALSE(n.price_valid);
        REQUIRE(n.price == 0.0);
        REQUIRE(hasWarning(n, "price"));
    }

    SECTION("Non-positive price")
    {
        auto n = normalizer.normalize(makeRaw(listing::Source::B, "Casa Azul", 0.0, 8.0, 10, 38.7, -9.1), 0);
        REQUIRE_FALSE(n.price_valid);
        REQUIRE(hasWarning(n, "price"));
    }

    SECTION("Rating above the scale")
    {
        auto n = normalizer.normalize(makeRaw(listing::Source::A, "Casa Azul", 90.0, 11.0, 10, 38.7, -9.1), 0);
        REQUIRE_FALSE(n.rated);
        REQUIRE(n.rating == 0.0);
        REQUIRE(hasWarning(n, "rating"));
    }

    SECTION("Negative review count")
    {
        auto n = normalizer.normalize(makeRaw(listing::Source::A, "Casa Azul", 90.0, 8.0, -3, 38.7, -9.1), 0);
        REQUIRE(n.review_count == 0);
        REQUIRE(hasWarning(n, "review_count"));
    }

    SECTION("Null island coordinates")
    {
        auto n = normalizer.normalize(makeRaw(listing::Source::A, "Casa Azul", 90.0, 8.0, 10, 0.0, 0.0), 0);
        REQUIRE_FALSE(n.has_coordinates);
        REQUIRE_FALSE(n.bucket.cell.has_value());
        REQUIRE(hasWarning(n, "coordinates"));
    }

    SECTION("Out of range coordinates")
    {
        auto n = normalizer.normalize(makeRaw(listing::Source::A, "Casa Azul", 90.0, 8.0, 10, 95.0, 10.0), 0);
        REQUIRE_FALSE(n.has_coordinates);
        REQUIRE(hasWarning(n, "coordinates"));
    }

    SECTION("Warnings carry the record position")
    {
        auto n = normalizer.normalize(makeRaw(listing::Source::B, "Casa Azul", std::nullopt, 8.0, 10, 38.7, -9.1), 4);
        REQUIRE(n.warnings.front().source == listing::Source::B);
        REQUIRE(n.warnings.front().record_index == 4);
    }
}

TEST_CASE("ListingNormalizer - coordinate precision", "[normalizer]")
{
    ListingNormalizer normalizer(NormalizerConfig{});

    SECTION("Inferred from the values")
    {
        auto n = normalizer.normalize(makeRaw(listing::Source::A, "Casa", 90.0, 8.0, 10, 38.71, -9.13995), 0);
        REQUIRE(n.coordinate_decimals == 5);
    }

    SECTION("Declared precision wins")
    {
        auto raw = makeRaw(listing::Source::A, "Casa", 90.0, 8.0, 10, 38.7169, -9.1399);
        raw.coordinate_decimals = 6;
        REQUIRE(normalizer.normalize(raw, 0).coordinate_decimals == 6);
    }
}

TEST_CASE("ListingNormalizer - bucket key", "[normalizer]")
{
    SECTION("Grid cell and name prefix")
    {
        ListingNormalizer normalizer(NormalizerConfig{});
        auto n = normalizer.normalize(makeRaw(listing::Source::A, "Grand Plaza Hotel", 90.0, 8.0, 10, 38.7169, -9.1399), 0);

        REQUIRE(n.bucket.cell.has_value());
        REQUIRE(n.bucket.cell->lat_index == 774);
        REQUIRE(n.bucket.cell->lon_index == -183);
        REQUIRE(n.bucket.name_prefix == "p");
    }

    SECTION("Prefix bucketing disabled")
    {
        NormalizerConfig config;
        config.name_prefix_length = 0;
        ListingNormalizer normalizer(config);
        auto n = normalizer.normalize(makeRaw(listing::Source::A, "Grand Plaza Hotel", 90.0, 8.0, 10, 38.7169, -9.1399), 0);
        REQUIRE(n.bucket.name_prefix.empty());
    }
}

TEST_CASE("ListingNormalizer - normalizeAll preserves order and source", "[normalizer]")
{
    ListingNormalizer normalizer(NormalizerConfig{});

    std::vector<listing::RawListing> raws;
    for (int i = 0; i < 25; ++i)
        raws.push_back(makeRaw(listing::Source::A, "Hotel " + std::to_string(i), 50.0 + i, 7.0, i, 38.7, -9.1));

    auto normalized = normalizer.normalizeAll(raws, listing::Source::B, 4);

    REQUIRE(normalized.size() == raws.size());
    for (std::size_t i = 0; i < normalized.size(); ++i)
    {
        REQUIRE(normalized[i].index == i);
        REQUIRE(normalized[i].source == listing::Source::B);
        REQUIRE(normalized[i].clean_name == std::to_string(i));
    }

    auto sequential = normalizer.normalizeAll(raws, listing::Source::B, 1);
    for (std::size_t i = 0; i < sequential.size(); ++i)
        REQUIRE(sequential[i].clean_name == normalized[i].clean_name);
}
