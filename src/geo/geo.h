/*
 * geo.h — Great-circle distance and cluster centroid
 */

#ifndef GEO_H
#define GEO_H

#include "location/location.h"

#include <vector>

/// Mean Earth radius used for haversine distances, in metres.
inline constexpr double kEarthRadiusM = 6371000.0;

/// Plain latitude/longitude pair in decimal degrees.
struct Coordinate {
    double latitude  = 0.0;
    double longitude = 0.0;
};

/// Great-circle distance in metres between two decimal-degree coordinates
/// (haversine, atan2 form). Symmetric; zero for identical points.
double haversine_m(double lat1, double lon1, double lat2, double lon2);

/// Arithmetic mean of latitudes and longitudes, taken independently.
/// Returns (0, 0) for an empty input.
Coordinate centroid(const std::vector<LocationFix>& fixes);

/// Round to 6 decimal places (~0.1 m), correctly rounded from the exact
/// binary value with ties to even.
double round_coord(double degrees);

#endif // GEO_H
