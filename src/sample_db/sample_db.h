/*
 * sample_db.h — Sample Android-schema location database for offline runs
 */

#ifndef SAMPLE_DB_H
#define SAMPLE_DB_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

/// One scripted fix, relative to the local calendar day `days_ago` days
/// before generation time.
struct SampleFix {
    int         days_ago;
    int         hour;
    int         minute;
    double      latitude;
    double      longitude;
    int         accuracy;
    double      altitude;
    double      speed;
    double      bearing;
    const char* provider;
};

struct SampleDbResult {
    bool         ok = false;
    std::size_t  records = 0;
    std::int64_t min_timestamp_ms = 0;
    std::int64_t max_timestamp_ms = 0;
    std::string  error;  // empty when ok
};

/// Epoch milliseconds of `hour`:`minute` local time on the calendar day
/// `days_ago` days before `now`.
std::int64_t sample_timestamp_ms(std::chrono::system_clock::time_point now,
                                 int days_ago, int hour, int minute);

/// (Re)create `path` as a `locations` database holding a week of San
/// Francisco Bay Area fixes: home mornings, a commute, office hours with a
/// lunch walk, a weekend trip, shopping and an evening jog. Any existing
/// file at `path` is replaced; the parent directory must exist.
SampleDbResult create_sample_database(const std::string& path,
                                      std::chrono::system_clock::time_point now);

#endif // SAMPLE_DB_H
