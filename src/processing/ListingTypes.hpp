#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace listing {

// Core data contracts for the reconciliation pipeline.
// Every stage takes these types by const reference and produces new values; nothing is mutated
// after the stage that created it.

enum class Source : std::uint8_t
{
    A = 0,
    B = 1
};

[[nodiscard]] constexpr std::string_view to_string(Source s) noexcept
{
    return s == Source::A ? "A" : "B";
}

struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;
};

// Listing as captured from one platform. Numeric fields are optional because scraped rows are often
// partial; the Normalizer is the only stage that looks at these.
struct RawListing {
    Source source = Source::A;
    std::string name;
    std::optional<double> price;                      // Source currency, uniform per run
    std::optional<double> rating;                     // Source's native scale
    std::optional<std::int64_t> review_count;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<int> coordinate_decimals;           // Declared precision, when the capture knows it
    std::optional<double> distance_to_center_km;      // As advertised by the platform
    std::string url;
};

// Recoverable issue found while normalizing. The record is kept with the field defaulted.
struct DataQualityWarning {
    Source source = Source::A;
    std::size_t record_index = 0;
    std::string field;                                // "price", "rating", "review_count", ...
    std::string message;
};

struct GridCell {
    std::int64_t lat_index = 0;
    std::int64_t lon_index = 0;

    friend bool operator==(const GridCell&, const GridCell&) = default;
};

// Coarse pre-filter key. Only bounds the candidate search; never a match criterion by itself.
struct BucketKey {
    std::optional<GridCell> cell;                     // Empty when the listing has no coordinates
    std::string name_prefix;

    friend bool operator==(const BucketKey&, const BucketKey&) = default;
};

struct NormalizedListing {
    Source source = Source::A;
    std::size_t index = 0;                            // Position in the source's raw sequence
    std::string raw_name;
    std::string clean_name;
    double price = 0.0;
    bool price_valid = false;
    double rating = 0.0;                              // 0-10 scale, 0 when unrated
    bool rated = false;
    std::int64_t review_count = 0;
    double latitude = 0.0;
    double longitude = 0.0;
    bool has_coordinates = false;
    int coordinate_decimals = 0;
    std::optional<double> distance_to_center_km;
    std::string url;
    BucketKey bucket;
    std::vector<DataQualityWarning> warnings;
};

// (A index, B index) proposed by the candidate generator.
struct IndexPair {
    std::size_t a_index = 0;
    std::size_t b_index = 0;

    friend bool operator==(const IndexPair&, const IndexPair&) = default;
};

struct CandidatePair {
    std::size_t a_index = 0;
    std::size_t b_index = 0;
    double similarity = 0.0;                          // [0, 1]
    double distance_m = 0.0;
};

enum class RejectReason : std::uint8_t
{
    None,                 // Accepted
    Similarity,           // Name similarity under threshold
    Distance,             // Too far apart
    SimilarityAndDistance,
    Superseded,           // A record matched a preferred candidate
    Claimed               // B record consumed by another A record
};

[[nodiscard]] constexpr std::string_view to_string(RejectReason r) noexcept
{
    switch (r)
    {
    case RejectReason::None:
        return "";
    case RejectReason::Similarity:
        return "similarity";
    case RejectReason::Distance:
        return "distance";
    case RejectReason::SimilarityAndDistance:
        return "similarity+distance";
    case RejectReason::Superseded:
        return "superseded";
    case RejectReason::Claimed:
        return "claimed";
    }
    return "unknown";
}

// Audit record: exactly one per evaluated candidate pair.
struct MatchDecision {
    CandidatePair pair;
    bool accepted = false;
    RejectReason reason = RejectReason::None;
};

struct SourceUrl {
    Source source = Source::A;
    std::string url;
};

struct ConsolidatedHotel {
    std::string name;
    double price = 0.0;
    bool price_valid = false;
    std::optional<Source> price_source;
    double rating = 0.0;                              // 0-10 scale
    bool rated = false;
    std::optional<Source> rating_source;
    std::int64_t review_count = 0;                    // Sample behind the chosen rating
    double latitude = 0.0;
    double longitude = 0.0;
    bool has_coordinates = false;
    std::optional<Source> coordinate_source;
    std::optional<double> distance_to_center_km;
    std::vector<Source> sources;                      // {A}, {B} or {A, B}
    std::vector<SourceUrl> urls;
    std::optional<std::size_t> a_index;               // Provenance into the normalized inputs
    std::optional<std::size_t> b_index;
    std::optional<double> match_similarity;
    std::optional<double> match_distance_m;

    [[nodiscard]] bool isMatched() const noexcept { return a_index.has_value() && b_index.has_value(); }
};

enum class PopularityTier : std::uint8_t
{
    Niche = 0,
    Known,
    Popular,
    Landmark
};

enum class LocationCategory : std::uint8_t
{
    Central = 0,
    Near,
    Outer,
    Remote,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(PopularityTier t) noexcept
{
    switch (t)
    {
    case PopularityTier::Niche:
        return "niche";
    case PopularityTier::Known:
        return "known";
    case PopularityTier::Popular:
        return "popular";
    case PopularityTier::Landmark:
        return "landmark";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(LocationCategory c) noexcept
{
    switch (c)
    {
    case LocationCategory::Central:
        return "central";
    case LocationCategory::Near:
        return "near";
    case LocationCategory::Outer:
        return "outer";
    case LocationCategory::Remote:
        return "remote";
    case LocationCategory::Unknown:
        return "unknown";
    }
    return "unknown";
}

struct EnrichedHotel {
    ConsolidatedHotel hotel;
    std::optional<double> value_score;                // Empty when the hotel has no valid price
    PopularityTier popularity = PopularityTier::Niche;
    LocationCategory location = LocationCategory::Unknown;
};

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result{};                                       // The actual result payload
    bool succeeded = true;
    std::optional<std::string> error;                 // Error message if stage failed
    std::exception_ptr cause;                         // Original exception if stage failed
    std::chrono::microseconds duration{};
    std::string stage_name;

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::exception_ptr ex, std::chrono::microseconds time,
                               const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.cause = std::move(ex);
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

} // namespace listing
