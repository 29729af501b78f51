/*
 * stop_detector.h — Single-pass dwell (stop) detection over location fixes
 */

#ifndef STOP_DETECTOR_H
#define STOP_DETECTOR_H

#include "location/location.h"

#include <vector>

/// Default thresholds.
inline constexpr double kDefaultStopRadiusM        = 50.0;
inline constexpr double kDefaultMinStopDurationMin = 1.0;
inline constexpr double kDefaultMaxTimeGapMin      = 30.0;

struct StopDetectorConfig {
    /// Max distance (inclusive) from the running cluster centroid for a fix
    /// to join the current cluster.
    double stop_radius_m = kDefaultStopRadiusM;

    /// Minimum departure - arrival (inclusive) for a cluster to be emitted.
    double min_stop_duration_min = kDefaultMinStopDurationMin;

    /// Max time (inclusive) since the cluster's last member for a new fix to
    /// still be contiguous.
    double max_time_gap_min = kDefaultMaxTimeGapMin;
};

/// Group fixes into stops.
///
/// Fixes are stable-sorted by timestamp, then walked once. A fix joins the
/// current cluster when it lies within `stop_radius_m` of the cluster's
/// centroid and within `max_time_gap_min` of the cluster's last member;
/// otherwise the cluster is closed and a new one starts at that fix.
/// Closed clusters shorter than `min_stop_duration_min` are dropped.
///
/// Precondition: every coordinate is finite. Pure; no I/O.
std::vector<Stop> detect_stops(std::vector<LocationFix> fixes,
                               const StopDetectorConfig& config = {});

#endif // STOP_DETECTOR_H
