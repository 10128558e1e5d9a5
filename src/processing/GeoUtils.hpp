#pragma once

#include "ListingTypes.hpp"

namespace processing
{

constexpr double kEarthRadiusMeters = 6371000.0;
constexpr int kMaxCoordinateDecimals = 10;

/// Great-circle distance (haversine) in meters
double haversineMeters(const listing::GeoPoint& from, const listing::GeoPoint& to);

/// Fixed-size degree grid cell holding the point
listing::GridCell gridCellFor(const listing::GeoPoint& point, double cell_deg);

/// Latitude/longitude within range and not the (0, 0) placeholder scrapers emit
bool isPlausibleCoordinate(double latitude, double longitude);

/// Smallest number of decimals (<= kMaxCoordinateDecimals) reproducing the value
int inferDecimals(double value);

} // namespace processing
