#pragma once

#include "covmap/core/types.hpp"

namespace covmap::geo {

constexpr double kKmPerDegreeLatitude = 111.32;
constexpr double kKmPerMile = 1.60934;

// Bounding box around (lat, lon) for the given coverage radius.
//
// Equirectangular approximation: the latitude span uses a fixed
// km-per-degree constant, the longitude span is widened by 1/cos(lat).
// Not checked for |lat| near 90; callers keep lat within [-70, 70].
BoundingBox compute_bounds(double lat, double lon, double radius, UnitSystem units);

double radius_to_km(double radius, UnitSystem units);

} // namespace covmap::geo
