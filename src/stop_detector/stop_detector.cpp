/*
 * stop_detector.cpp — Single-pass dwell (stop) detection over location fixes
 */

#include "stop_detector.h"

#include "geo/geo.h"

#include <algorithm>

// ─── Internal helpers ───────────────────────────────────────────────────────

/// Current cluster plus running coordinate sums for the per-fix radius test.
struct OpenCluster {
    std::vector<LocationFix> members;
    double sum_lat = 0.0;
    double sum_lon = 0.0;
};

static void cluster_add(OpenCluster& cluster, const LocationFix& f)
{
    cluster.members.push_back(f);
    cluster.sum_lat += f.latitude;
    cluster.sum_lon += f.longitude;
}

static void cluster_restart(OpenCluster& cluster, const LocationFix& f)
{
    cluster.members.clear();
    cluster.sum_lat = 0.0;
    cluster.sum_lon = 0.0;
    cluster_add(cluster, f);
}

/// Running centroid; `cluster` is never empty here.
static Coordinate cluster_center(const OpenCluster& cluster)
{
    const double n = static_cast<double>(cluster.members.size());
    return {cluster.sum_lat / n, cluster.sum_lon / n};
}

/// Close a cluster: append a Stop when it lasted long enough.
static void close_cluster(const OpenCluster& cluster,
                          const StopDetectorConfig& config,
                          std::vector<Stop>& out)
{
    if (cluster.members.empty()) return;

    const Timestamp arrival   = cluster.members.front().timestamp;
    const Timestamp departure = cluster.members.back().timestamp;
    const double duration_min = minutes_between(arrival, departure);

    if (duration_min < config.min_stop_duration_min)
        return;

    const Coordinate c = centroid(cluster.members);

    Stop stop;
    stop.arrival_time     = arrival;
    stop.departure_time   = departure;
    stop.duration_minutes = static_cast<int>(duration_min);
    stop.latitude         = round_coord(c.latitude);
    stop.longitude        = round_coord(c.longitude);
    stop.point_count      = cluster.members.size();
    out.push_back(stop);
}

// ─── Public API ─────────────────────────────────────────────────────────────

std::vector<Stop> detect_stops(std::vector<LocationFix> fixes,
                               const StopDetectorConfig& config)
{
    if (fixes.empty()) return {};

    std::stable_sort(fixes.begin(), fixes.end(),
                     [](const LocationFix& a, const LocationFix& b) {
                         return a.timestamp < b.timestamp;
                     });

    std::vector<Stop> stops;
    OpenCluster cluster;
    cluster_restart(cluster, fixes.front());

    for (std::size_t i = 1; i < fixes.size(); ++i) {
        const auto& cur = fixes[i];

        const double gap_min =
            minutes_between(cluster.members.back().timestamp, cur.timestamp);

        // Centroid as it stands before `cur` is considered.
        const Coordinate c = cluster_center(cluster);
        const double dist_m =
            haversine_m(c.latitude, c.longitude, cur.latitude, cur.longitude);

        if (dist_m <= config.stop_radius_m &&
            gap_min <= config.max_time_gap_min) {
            cluster_add(cluster, cur);
        } else {
            close_cluster(cluster, config, stops);
            cluster_restart(cluster, cur);
        }
    }

    close_cluster(cluster, config, stops);
    return stops;
}
