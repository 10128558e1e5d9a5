#pragma once

#include "ITextNormalizer.hpp"
#include "ListingTypes.hpp"
#include "PipelineConfig.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace processing
{

/**
 * @brief Converts loosely-typed RawListing records into the strict NormalizedListing shape.
 *
 * normalize() is total: malformed numeric or geographic fields are defaulted and recorded as
 * DataQualityWarning on the produced listing, never thrown. The same input always yields the
 * same output, so normalizeAll() can fan records out over worker threads.
 *
 * Example:
 * @code
 * ListingNormalizer normalizer(NormalizerConfig{});
 * normalizer.cleanName("Grand Plaza Hotel & Spa"); // "plaza"
 * @endcode
 */
class ListingNormalizer
{
public:
    explicit ListingNormalizer(NormalizerConfig config);
    ListingNormalizer(NormalizerConfig config, std::unique_ptr<ITextNormalizer> text_normalizer);
    ~ListingNormalizer();

    ListingNormalizer(const ListingNormalizer&) = delete;
    ListingNormalizer& operator=(const ListingNormalizer&) = delete;

    [[nodiscard]] listing::NormalizedListing normalize(const listing::RawListing& raw, std::size_t index = 0) const;

    // Normalizes one source's records as that source regardless of their own tag. Order-preserving;
    // partitions run on up to worker_threads threads (0 = hardware concurrency).
    [[nodiscard]] std::vector<listing::NormalizedListing> normalizeAll(const std::vector<listing::RawListing>& raws,
                                                                       listing::Source source,
                                                                       std::size_t worker_threads = 0) const;

    // Folded, separator-simplified name with noise tokens removed. Idempotent.
    [[nodiscard]] std::string cleanName(const std::string& name) const;

    [[nodiscard]] listing::BucketKey bucketKey(const listing::NormalizedListing& listing) const;

    // Linear map from [0, scale] to [0, 10]; empty for missing, non-positive or out-of-range ratings.
    [[nodiscard]] static std::optional<double> rescaleRating(std::optional<double> rating, double scale);

    [[nodiscard]] const NormalizerConfig& config() const noexcept { return config_; }

private:
    listing::NormalizedListing normalizeAs(const listing::RawListing& raw, std::size_t index,
                                           listing::Source source) const;

    NormalizerConfig config_;
    std::unordered_set<std::string> noise_;
    std::unique_ptr<ITextNormalizer> text_normalizer_;
};

} // namespace processing
