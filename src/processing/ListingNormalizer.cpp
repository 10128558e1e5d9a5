#include "ListingNormalizer.hpp"
#include "Diagnostics.hpp"
#include "FoldingTextNormalizer.hpp"
#include "GeoUtils.hpp"
#include "PartitionRunner.hpp"
#include "TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <plog/Log.h>

namespace processing
{

namespace
{

class WarningSink
{
public:
    explicit WarningSink(listing::NormalizedListing& target)
        : target_(target)
    {
    }

    void add(const char* field, const std::string& message)
    {
        target_.warnings.push_back(listing::DataQualityWarning{
            .source = target_.source,
            .record_index = target_.index,
            .field = field,
            .message = message,
        });
    }

private:
    listing::NormalizedListing& target_;
};

std::string describe(std::optional<double> value)
{
    if (!value)
        return "missing";
    std::ostringstream oss;
    oss << *value;
    return oss.str();
}

} // namespace

ListingNormalizer::ListingNormalizer(NormalizerConfig config)
    : ListingNormalizer(std::move(config), std::make_unique<FoldingTextNormalizer>())
{
}

ListingNormalizer::ListingNormalizer(NormalizerConfig config, std::unique_ptr<ITextNormalizer> text_normalizer)
    : config_(std::move(config))
    , text_normalizer_(std::move(text_normalizer))
{
    if (!text_normalizer_)
        text_normalizer_ = std::make_unique<FoldingTextNormalizer>();

    // Noise tokens go through the same folding as names so "Hôtel" in the list matches "hotel".
    for (const auto& token : config_.noise_tokens)
    {
        for (auto& word : text_normalizer_->words(token))
            noise_.insert(std::move(word));
    }
}

ListingNormalizer::~ListingNormalizer() = default;

std::string ListingNormalizer::cleanName(const std::string& name) const
{
    auto words = text_normalizer_->words(name);
    return joinWords(removeNoiseWords(words, noise_));
}

std::optional<double> ListingNormalizer::rescaleRating(std::optional<double> rating, double scale)
{
    if (!rating || !std::isfinite(*rating) || !std::isfinite(scale) || scale <= 0.0)
        return std::nullopt;
    if (*rating <= 0.0 || *rating > scale)
        return std::nullopt;
    return *rating / scale * 10.0;
}

listing::BucketKey ListingNormalizer::bucketKey(const listing::NormalizedListing& listing) const
{
    listing::BucketKey key;
    if (listing.has_coordinates)
        key.cell = gridCellFor(listing::GeoPoint{ listing.latitude, listing.longitude }, config_.grid_cell_deg);
    if (config_.name_prefix_length > 0)
        key.name_prefix = utf8Prefix(listing.clean_name, config_.name_prefix_length);
    return key;
}

listing::NormalizedListing ListingNormalizer::normalize(const listing::RawListing& raw, std::size_t index) const
{
    return normalizeAs(raw, index, raw.source);
}

listing::NormalizedListing ListingNormalizer::normalizeAs(const listing::RawListing& raw, std::size_t index,
                                                          listing::Source source) const
{
    listing::NormalizedListing out;
    out.source = source;
    out.index = index;
    out.raw_name = raw.name;
    out.url = raw.url;

    WarningSink warn(out);

    out.clean_name = cleanName(raw.name);
    if (out.clean_name.empty())
        warn.add("name", "name is empty after cleaning");

    if (raw.price && std::isfinite(*raw.price) && *raw.price > 0.0)
    {
        out.price = *raw.price;
        out.price_valid = true;
    }
    else
    {
        warn.add("price", "invalid price (" + describe(raw.price) + "), excluded from pricing");
    }

    const double scale = config_.ratingScaleFor(source);
    if (auto rescaled = rescaleRating(raw.rating, scale))
    {
        out.rating = *rescaled;
        out.rated = true;
    }
    else
    {
        std::ostringstream oss;
        oss << "rating " << describe(raw.rating) << " outside (0, " << scale << "], marked unrated";
        warn.add("rating", oss.str());
    }

    if (raw.review_count && *raw.review_count >= 0)
    {
        out.review_count = *raw.review_count;
    }
    else
    {
        warn.add("review_count",
                 raw.review_count ? "negative review count, defaulted to 0" : "missing review count, defaulted to 0");
    }

    if (raw.latitude && raw.longitude && isPlausibleCoordinate(*raw.latitude, *raw.longitude))
    {
        out.latitude = *raw.latitude;
        out.longitude = *raw.longitude;
        out.has_coordinates = true;
        if (raw.coordinate_decimals && *raw.coordinate_decimals >= 0)
            out.coordinate_decimals = std::min(*raw.coordinate_decimals, kMaxCoordinateDecimals);
        else
            out.coordinate_decimals = std::max(inferDecimals(out.latitude), inferDecimals(out.longitude));
    }
    else
    {
        warn.add("coordinates", "missing or implausible coordinates (" + describe(raw.latitude) + ", " +
                                    describe(raw.longitude) + "), listing cannot be matched");
    }

    if (raw.distance_to_center_km)
    {
        if (std::isfinite(*raw.distance_to_center_km) && *raw.distance_to_center_km >= 0.0)
            out.distance_to_center_km = raw.distance_to_center_km;
        else
            warn.add("distance_to_center_km", "invalid distance " + describe(raw.distance_to_center_km) + ", dropped");
    }

    out.bucket = bucketKey(out);

    if (Diagnostics::IsVerbose() && !out.warnings.empty())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance)
            << "[Normalizer] " << Diagnostics::Describe(out) << " raw=" << Diagnostics::Preview(raw.name)
            << " warnings=" << out.warnings.size();
    }
    return out;
}

std::vector<listing::NormalizedListing> ListingNormalizer::normalizeAll(const std::vector<listing::RawListing>& raws,
                                                                        listing::Source source,
                                                                        std::size_t worker_threads) const
{
    PROFILE_SCOPE_FUNCTION();

    return run_partitioned<listing::NormalizedListing>(
        raws.size(), worker_threads, [this, &raws, source](std::size_t begin, std::size_t end) {
            std::vector<listing::NormalizedListing> part;
            part.reserve(end - begin);
            for (std::size_t i = begin; i < end; ++i)
                part.push_back(normalizeAs(raws[i], i, source));
            return part;
        });
}

} // namespace processing
