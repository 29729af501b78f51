/*
 * output.h — Timeline CSV and interactive stop map generation
 */

#ifndef OUTPUT_H
#define OUTPUT_H

#include "location/location.h"

#include <string>
#include <vector>

/// Map centre used when there are no stops to average.
inline constexpr double kDefaultMapLat = 37.7749;
inline constexpr double kDefaultMapLon = -122.4194;

/// Stop length classes used for marker colours.
enum class DurationBand {
    kShort,   // < 30 min
    kMedium,  // 30 .. 119 min
    kLong     // >= 120 min
};

DurationBand duration_band(int duration_minutes);

/// Marker colour name for a band ("green", "orange", "red").
const char* band_color(DurationBand band);

/// CSV text: header plus one row per stop, UTC "YYYY-MM-DD HH:MM:SS".
std::string build_timeline_csv(const std::vector<Stop>& stops);

/// Standalone Leaflet page: one marker per stop plus a duration-weighted
/// heat layer.
std::string build_map_html(const std::vector<Stop>& stops);

/// Write `content` to `path`. Returns false on I/O failure.
bool write_text_file(const std::string& path, const std::string& content);

#endif // OUTPUT_H
