/*
 * location.h — Location fix / stop records and UTC timestamp helpers
 */

#ifndef LOCATION_H
#define LOCATION_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

/// UTC instant at millisecond resolution.
using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::milliseconds>;

/// One raw GPS observation as handed over by the location source.
///   - latitude / longitude are decimal degrees (WGS84), +N/+E, -S/-W
///   - no range checking is done; garbage in propagates
struct LocationFix {
    Timestamp timestamp;
    double    latitude  = 0.0;
    double    longitude = 0.0;
};

/// A detected dwell episode.
struct Stop {
    Timestamp   arrival_time;
    Timestamp   departure_time;
    int         duration_minutes = 0;  // truncated, not rounded
    double      latitude         = 0.0;  // centroid, 6 decimals
    double      longitude        = 0.0;
    std::size_t point_count      = 0;
};

/// Build a Timestamp from milliseconds since the Unix epoch.
Timestamp timestamp_from_epoch_ms(std::int64_t ms);

/// Milliseconds since the Unix epoch.
std::int64_t epoch_ms(Timestamp t);

/// Elapsed time from `from` to `to` in (fractional) minutes.
double minutes_between(Timestamp from, Timestamp to);

/// Format as "YYYY-MM-DD HH:MM:SS" in UTC.
std::string format_utc(Timestamp t);

/// Format as "YYYY-MM-DD HH:MM" in UTC (map popups).
std::string format_utc_minutes(Timestamp t);

#endif // LOCATION_H
