#pragma once

#include "processing/ListingTypes.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

// Builders shared by the pipeline stage tests.

inline listing::RawListing makeRaw(listing::Source source, const std::string& name, std::optional<double> price,
                                   std::optional<double> rating, std::optional<std::int64_t> reviews,
                                   std::optional<double> lat, std::optional<double> lon)
{
    listing::RawListing raw;
    raw.source = source;
    raw.name = name;
    raw.price = price;
    raw.rating = rating;
    raw.review_count = reviews;
    raw.latitude = lat;
    raw.longitude = lon;
    raw.url = "https://example.test/" + std::string(listing::to_string(source)) + "/" + name;
    return raw;
}

inline listing::NormalizedListing makeNormalized(listing::Source source, std::size_t index, const std::string& name,
                                                 std::optional<double> price, std::optional<double> rating,
                                                 std::int64_t reviews, double lat, double lon, int decimals = 4)
{
    listing::NormalizedListing n;
    n.source = source;
    n.index = index;
    n.raw_name = name;
    n.clean_name = name;
    n.price = price.value_or(0.0);
    n.price_valid = price.has_value();
    n.rating = rating.value_or(0.0);
    n.rated = rating.has_value();
    n.review_count = reviews;
    n.latitude = lat;
    n.longitude = lon;
    n.has_coordinates = true;
    n.coordinate_decimals = decimals;
    n.url = "https://example.test/" + std::string(listing::to_string(source)) + "/" + std::to_string(index);
    return n;
}

inline listing::ConsolidatedHotel makeHotel(const std::string& name, std::optional<double> price,
                                            std::optional<double> rating, std::int64_t reviews,
                                            std::optional<double> distance_km = std::nullopt)
{
    listing::ConsolidatedHotel h;
    h.name = name;
    h.price = price.value_or(0.0);
    h.price_valid = price.has_value();
    if (price)
        h.price_source = listing::Source::A;
    h.rating = rating.value_or(0.0);
    h.rated = rating.has_value();
    if (rating)
        h.rating_source = listing::Source::A;
    h.review_count = reviews;
    h.distance_to_center_km = distance_km;
    h.sources = { listing::Source::A };
    h.a_index = 0;
    return h;
}

// Temporary file removed on scope exit
class TempFile
{
public:
    TempFile(const std::string& name, const std::string& content)
    {
        dir_ = std::filesystem::temp_directory_path() / "staymatch_tests";
        std::filesystem::create_directories(dir_);
        path_ = dir_ / name;
        std::ofstream file(path_, std::ios::binary);
        file << content;
    }

    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (std::filesystem::exists(dir_, ec) && std::filesystem::is_empty(dir_, ec))
            std::filesystem::remove(dir_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path dir_;
    std::filesystem::path path_;
};
