/*
 * output.cpp — Timeline CSV and interactive stop map generation
 */

#include "output.h"

#include <fstream>
#include <iomanip>
#include <sstream>

// ─── Output constants ──────────────────────────────────────────────────────

static constexpr int kCoordPrecision  = 6;
static constexpr int kShortMaxMinutes = 30;   // below: short
static constexpr int kLongMinMinutes  = 120;  // at or above: long
static constexpr int kMapZoom         = 12;
static constexpr int kPopupMaxWidth   = 300;
static constexpr int kMarkerRadius    = 9;
static constexpr int kHeatRadius      = 15;
static constexpr int kHeatBlur        = 10;

static constexpr const char* kCsvHeader =
    "arrival_time,departure_time,duration_minutes,latitude,longitude,point_count";

static constexpr const char* kLeafletCss =
    "https://unpkg.com/leaflet@1.9.4/dist/leaflet.css";
static constexpr const char* kLeafletJs =
    "https://unpkg.com/leaflet@1.9.4/dist/leaflet.js";
static constexpr const char* kLeafletHeatJs =
    "https://unpkg.com/leaflet.heat@0.2.0/dist/leaflet-heat.js";
static constexpr const char* kTileUrl =
    "https://{s}.tile.openstreetmap.org/{z}/{x}/{y}.png";

// ─── Public API ─────────────────────────────────────────────────────────────

DurationBand duration_band(int duration_minutes)
{
    if (duration_minutes < kShortMaxMinutes) return DurationBand::kShort;
    if (duration_minutes < kLongMinMinutes)  return DurationBand::kMedium;
    return DurationBand::kLong;
}

const char* band_color(DurationBand band)
{
    switch (band) {
        case DurationBand::kShort:  return "green";
        case DurationBand::kMedium: return "orange";
        case DurationBand::kLong:   return "red";
    }
    return "blue";
}

std::string build_timeline_csv(const std::vector<Stop>& stops)
{
    std::ostringstream csv;
    csv << std::fixed << std::setprecision(kCoordPrecision);
    csv << kCsvHeader << '\n';
    for (const auto& s : stops) {
        csv << format_utc(s.arrival_time) << ','
            << format_utc(s.departure_time) << ','
            << s.duration_minutes << ','
            << s.latitude << ','
            << s.longitude << ','
            << s.point_count << '\n';
    }
    return csv.str();
}

std::string build_map_html(const std::vector<Stop>& stops)
{
    double center_lat = kDefaultMapLat;
    double center_lon = kDefaultMapLon;
    if (!stops.empty()) {
        double sum_lat = 0.0;
        double sum_lon = 0.0;
        for (const auto& s : stops) {
            sum_lat += s.latitude;
            sum_lon += s.longitude;
        }
        center_lat = sum_lat / static_cast<double>(stops.size());
        center_lon = sum_lon / static_cast<double>(stops.size());
    }

    std::ostringstream html;
    html << std::fixed << std::setprecision(kCoordPrecision);

    html << "<!DOCTYPE html>\n"
         << "<html>\n<head>\n"
         << "<meta charset=\"utf-8\">\n"
         << "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
         << "<title>Location Timeline</title>\n"
         << "<link rel=\"stylesheet\" href=\"" << kLeafletCss << "\">\n"
         << "<script src=\"" << kLeafletJs << "\"></script>\n"
         << "<script src=\"" << kLeafletHeatJs << "\"></script>\n"
         << "<style>html, body, #map { height: 100%; margin: 0; }</style>\n"
         << "</head>\n<body>\n<div id=\"map\"></div>\n<script>\n";

    html << "var map = L.map('map').setView([" << center_lat << ", "
         << center_lon << "], " << kMapZoom << ");\n"
         << "L.tileLayer('" << kTileUrl << "', {maxZoom: 19, attribution: "
         << "'&copy; OpenStreetMap contributors'}).addTo(map);\n";

    for (std::size_t i = 0; i < stops.size(); ++i) {
        const Stop& s = stops[i];
        const char* color = band_color(duration_band(s.duration_minutes));
        const std::size_t number = i + 1;

        html << "L.circleMarker([" << s.latitude << ", " << s.longitude << "], "
             << "{radius: " << kMarkerRadius << ", color: '" << color
             << "', fillColor: '" << color << "', fillOpacity: 0.8})"
             << ".bindPopup(\"<b>Stop #" << number << "</b><br>"
             << "Arrival: " << format_utc_minutes(s.arrival_time) << "<br>"
             << "Departure: " << format_utc_minutes(s.departure_time) << "<br>"
             << "Duration: " << s.duration_minutes << " minutes<br>"
             << "Location points: " << s.point_count << "\", {maxWidth: "
             << kPopupMaxWidth << "})"
             << ".bindTooltip(\"Stop #" << number << " ("
             << s.duration_minutes << " min)\")"
             << ".addTo(map);\n";
    }

    if (!stops.empty()) {
        html << "L.heatLayer([";
        for (std::size_t i = 0; i < stops.size(); ++i) {
            if (i) html << ", ";
            html << '[' << stops[i].latitude << ", " << stops[i].longitude
                 << ", " << stops[i].duration_minutes << ']';
        }
        html << "], {radius: " << kHeatRadius << ", blur: " << kHeatBlur
             << "}).addTo(map);\n";
    }

    html << "</script>\n</body>\n</html>\n";
    return html.str();
}

bool write_text_file(const std::string& path, const std::string& content)
{
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs)
        return false;
    ofs << content;
    ofs.flush();
    return static_cast<bool>(ofs);
}
