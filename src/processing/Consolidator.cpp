#include "Consolidator.hpp"
#include "Diagnostics.hpp"
#include "GeoUtils.hpp"
#include "TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <stdexcept>
#include <string>
#include <plog/Log.h>

namespace processing
{

namespace
{

// Rating and price precedence: the larger review sample wins, ties go to A.
const listing::NormalizedListing& bySampleSize(const listing::NormalizedListing& a,
                                               const listing::NormalizedListing& b)
{
    return b.review_count > a.review_count ? b : a;
}

const listing::NormalizedListing* byPrecision(const listing::NormalizedListing& a, const listing::NormalizedListing& b)
{
    if (a.has_coordinates && b.has_coordinates)
        return b.coordinate_decimals > a.coordinate_decimals ? &b : &a;
    if (a.has_coordinates)
        return &a;
    if (b.has_coordinates)
        return &b;
    return nullptr;
}

void takeCoordinates(listing::ConsolidatedHotel& hotel, const listing::NormalizedListing& from)
{
    hotel.latitude = from.latitude;
    hotel.longitude = from.longitude;
    hotel.has_coordinates = true;
    hotel.coordinate_source = from.source;
}

void addUrl(listing::ConsolidatedHotel& hotel, const listing::NormalizedListing& from)
{
    if (!from.url.empty())
        hotel.urls.push_back(listing::SourceUrl{ from.source, from.url });
}

void requireIndex(std::size_t index, std::size_t size, const char* side)
{
    if (index >= size)
    {
        throw std::invalid_argument(std::string("accepted match references unknown ") + side + " listing " +
                                    std::to_string(index));
    }
}

} // namespace

Consolidator::Consolidator(std::optional<listing::GeoPoint> city_center)
    : city_center_(city_center)
{
}

void Consolidator::resolveDistance(listing::ConsolidatedHotel& hotel, const listing::NormalizedListing* preferred,
                                   const listing::NormalizedListing* other) const
{
    if (city_center_ && hotel.has_coordinates)
    {
        hotel.distance_to_center_km =
            haversineMeters(*city_center_, listing::GeoPoint{ hotel.latitude, hotel.longitude }) / 1000.0;
        return;
    }
    if (preferred && preferred->distance_to_center_km)
        hotel.distance_to_center_km = preferred->distance_to_center_km;
    else if (other && other->distance_to_center_km)
        hotel.distance_to_center_km = other->distance_to_center_km;
}

listing::ConsolidatedHotel Consolidator::passThrough(const listing::NormalizedListing& single) const
{
    listing::ConsolidatedHotel hotel;
    hotel.name = collapseWhitespace(single.raw_name);
    hotel.price = single.price_valid ? single.price : 0.0;
    hotel.price_valid = single.price_valid;
    if (single.price_valid)
        hotel.price_source = single.source;
    hotel.rating = single.rated ? single.rating : 0.0;
    hotel.rated = single.rated;
    if (single.rated)
        hotel.rating_source = single.source;
    hotel.review_count = single.review_count;
    if (single.has_coordinates)
        takeCoordinates(hotel, single);
    hotel.sources = { single.source };
    addUrl(hotel, single);
    if (single.source == listing::Source::A)
        hotel.a_index = single.index;
    else
        hotel.b_index = single.index;

    resolveDistance(hotel, &single, nullptr);
    return hotel;
}

listing::ConsolidatedHotel Consolidator::merge(const listing::NormalizedListing& a,
                                               const listing::NormalizedListing& b,
                                               const listing::CandidatePair& pair) const
{
    listing::ConsolidatedHotel hotel;

    const std::string a_name = collapseWhitespace(a.raw_name);
    hotel.name = a_name.empty() ? collapseWhitespace(b.raw_name) : a_name;

    const auto& primary = bySampleSize(a, b);
    const auto& secondary = (&primary == &a) ? b : a;

    // Rating: fall back to the other source only when the larger sample has no usable rating.
    const listing::NormalizedListing* rating_from = primary.rated ? &primary : (secondary.rated ? &secondary : nullptr);
    if (rating_from)
    {
        hotel.rating = rating_from->rating;
        hotel.rated = true;
        hotel.rating_source = rating_from->source;
        hotel.review_count = rating_from->review_count;
    }
    else
    {
        hotel.review_count = primary.review_count;
    }

    const listing::NormalizedListing* price_from =
        primary.price_valid ? &primary : (secondary.price_valid ? &secondary : nullptr);
    if (price_from)
    {
        hotel.price = price_from->price;
        hotel.price_valid = true;
        hotel.price_source = price_from->source;
    }

    const listing::NormalizedListing* coords_from = byPrecision(a, b);
    if (coords_from)
        takeCoordinates(hotel, *coords_from);

    hotel.sources = { listing::Source::A, listing::Source::B };
    addUrl(hotel, a);
    addUrl(hotel, b);
    hotel.a_index = a.index;
    hotel.b_index = b.index;
    hotel.match_similarity = pair.similarity;
    hotel.match_distance_m = pair.distance_m;

    const listing::NormalizedListing* distance_other = (coords_from == &b) ? &a : &b;
    resolveDistance(hotel, coords_from ? coords_from : &a, distance_other);
    return hotel;
}

std::vector<listing::ConsolidatedHotel> Consolidator::consolidate(
    const std::vector<listing::NormalizedListing>& a, const std::vector<listing::NormalizedListing>& b,
    const std::vector<listing::MatchDecision>& decisions) const
{
    PROFILE_SCOPE_FUNCTION();

    std::vector<const listing::MatchDecision*> match_of_a(a.size(), nullptr);
    std::vector<bool> b_used(b.size(), false);
    std::size_t accepted = 0;

    for (const auto& decision : decisions)
    {
        if (!decision.accepted)
            continue;
        const auto& pair = decision.pair;
        requireIndex(pair.a_index, a.size(), "A");
        requireIndex(pair.b_index, b.size(), "B");
        if (match_of_a[pair.a_index] || b_used[pair.b_index])
        {
            throw std::invalid_argument("listing matched more than once (a=" + std::to_string(pair.a_index) +
                                        ", b=" + std::to_string(pair.b_index) + ")");
        }
        match_of_a[pair.a_index] = &decision;
        b_used[pair.b_index] = true;
        ++accepted;
    }

    std::vector<listing::ConsolidatedHotel> hotels;
    hotels.reserve(a.size() + b.size() - accepted);

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (const auto* decision = match_of_a[i])
            hotels.push_back(merge(a[i], b[decision->pair.b_index], decision->pair));
        else
            hotels.push_back(passThrough(a[i]));
    }
    std::size_t unmatched_b = 0;
    for (std::size_t j = 0; j < b.size(); ++j)
    {
        if (b_used[j])
            continue;
        hotels.push_back(passThrough(b[j]));
        ++unmatched_b;
    }

    PLOG_INFO_(Diagnostics::kLogInstance) << "[Consolidator] merged=" << accepted
                                          << " only_a=" << (a.size() - accepted) << " only_b=" << unmatched_b
                                          << " total=" << hotels.size();
    return hotels;
}

} // namespace processing
