#include "GeoUtils.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace processing
{

namespace
{

double toRadians(double degrees) { return degrees * std::numbers::pi / 180.0; }

} // namespace

double haversineMeters(const listing::GeoPoint& from, const listing::GeoPoint& to)
{
    const double lat1 = toRadians(from.latitude);
    const double lat2 = toRadians(to.latitude);
    const double dlat = toRadians(to.latitude - from.latitude);
    const double dlon = toRadians(to.longitude - from.longitude);

    const double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
    const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(std::max(0.0, 1 - a)));
    return kEarthRadiusMeters * c;
}

listing::GridCell gridCellFor(const listing::GeoPoint& point, double cell_deg)
{
    return listing::GridCell{
        .lat_index = static_cast<std::int64_t>(std::floor(point.latitude / cell_deg)),
        .lon_index = static_cast<std::int64_t>(std::floor(point.longitude / cell_deg)),
    };
}

bool isPlausibleCoordinate(double latitude, double longitude)
{
    if (!std::isfinite(latitude) || !std::isfinite(longitude))
        return false;
    if (std::abs(latitude) > 90.0 || std::abs(longitude) > 180.0)
        return false;
    return !(latitude == 0.0 && longitude == 0.0);
}

int inferDecimals(double value)
{
    if (!std::isfinite(value))
        return 0;

    double scale = 1.0;
    for (int decimals = 0; decimals < kMaxCoordinateDecimals; ++decimals)
    {
        const double scaled = value * scale;
        if (std::abs(scaled - std::round(scaled)) < 1e-6)
            return decimals;
        scale *= 10.0;
    }
    return kMaxCoordinateDecimals;
}

} // namespace processing
