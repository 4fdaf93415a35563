#include "covmap/geo/bounds.hpp"

#include <cmath>

namespace covmap::geo {

double radius_to_km(double radius, UnitSystem units) {
    return units == UnitSystem::IMPERIAL ? radius * kKmPerMile : radius;
}

BoundingBox compute_bounds(double lat, double lon, double radius, UnitSystem units) {
    const double radius_km = radius_to_km(radius, units);

    const double lat_offset = radius_km / kKmPerDegreeLatitude;

    const double lat_rad = lat * M_PI / 180.0;
    const double km_per_deg_lon = kKmPerDegreeLatitude * std::cos(lat_rad);
    const double lon_offset = radius_km / km_per_deg_lon;

    BoundingBox box;
    box.north = lat + lat_offset;
    box.south = lat - lat_offset;
    box.east = lon + lon_offset;
    box.west = lon - lon_offset;
    return box;
}

} // namespace covmap::geo
