/*
 * geo.cpp — Great-circle distance and cluster centroid
 */

#include "geo.h"

#include <cmath>
#include <cstddef>
#include <cstdio>
#include <cstdlib>

// ─── Geodesy constants ──────────────────────────────────────────────────────

static constexpr double      kPi            = 3.14159265358979323846;
static constexpr double      kDegToRad      = kPi / 180.0;
static constexpr int         kCoordDecimals = 6;
static constexpr std::size_t kCoordBufSize  = 512;  // fits "%.6f" of DBL_MAX

double haversine_m(double lat1, double lon1, double lat2, double lon2)
{
    const double phi1  = lat1 * kDegToRad;
    const double phi2  = lat2 * kDegToRad;
    const double dphi  = (lat2 - lat1) * kDegToRad;
    const double dlamb = (lon2 - lon1) * kDegToRad;

    const double s_phi  = std::sin(dphi / 2.0);
    const double s_lamb = std::sin(dlamb / 2.0);
    double a = s_phi * s_phi +
               std::cos(phi1) * std::cos(phi2) * s_lamb * s_lamb;

    // Rounding can push `a` marginally above 1 for antipodal points.
    if (a > 1.0) a = 1.0;

    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return kEarthRadiusM * c;
}

Coordinate centroid(const std::vector<LocationFix>& fixes)
{
    if (fixes.empty()) return {};

    double sum_lat = 0.0;
    double sum_lon = 0.0;
    for (const auto& f : fixes) {
        sum_lat += f.latitude;
        sum_lon += f.longitude;
    }

    const double n = static_cast<double>(fixes.size());
    return {sum_lat / n, sum_lon / n};
}

double round_coord(double degrees)
{
    if (!std::isfinite(degrees)) return degrees;

    // 37.7749995 is stored just below the tie: 37.774999, not 37.775.
    char buf[kCoordBufSize];
    std::snprintf(buf, sizeof buf, "%.*f", kCoordDecimals, degrees);
    return std::strtod(buf, nullptr);
}
