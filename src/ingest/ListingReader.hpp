#pragma once

#include "../processing/ListingTypes.hpp"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ingest
{

// Loads one source's scraped listings from JSON Lines, one object per line.
//
// Recognised keys: name | hotel_name, price, rating, reviews | review_count | review_amount,
// latitude + longitude | lat + lng/lon | coordinates [lat, lon], url, distance | distance_km.
// Values may be numbers or scraped strings; see FieldParsers.hpp. Blank lines are ignored and
// malformed lines are skipped with a warning.
class ListingReader
{
public:
    explicit ListingReader(listing::Source source);
    ~ListingReader();

    // False when the file cannot be opened.
    bool load(const std::string& path);
    bool load(std::istream& input, const std::string& origin);

    // One JSONL line to a listing; empty when the line is not a JSON object with a name.
    std::optional<listing::RawListing> parseLine(const std::string& line) const;

    const std::vector<listing::RawListing>& listings() const { return listings_; }
    std::vector<listing::RawListing> takeListings() { return std::move(listings_); }

    std::size_t skippedLines() const { return skipped_; }
    const std::string& lastError() const { return last_error_; }

private:
    listing::Source source_;
    std::vector<listing::RawListing> listings_;
    std::size_t skipped_ = 0;
    std::string last_error_;
};

} // namespace ingest
