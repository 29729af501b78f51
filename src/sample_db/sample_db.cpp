/*
 * sample_db.cpp — Sample Android-schema location database for offline runs
 */

#include "sample_db.h"

#include <sqlite3.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <limits>
#include <memory>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

// ─── Scenario ───────────────────────────────────────────────────────────────

static constexpr SampleFix kSampleFixes[] = {
    // Home (morning)
    {7,  8,  0, 37.7749, -122.4194, 10,  52.3,  0.0,   0.0, "gps"},
    {7,  8, 30, 37.7749, -122.4194, 12,  52.3,  0.0,   0.0, "network"},

    // Commute
    {7,  9,  0, 37.7751, -122.4180, 15,  48.1,  8.5,  45.0, "gps"},
    {7,  9, 15, 37.7805, -122.4121, 20,  35.2, 12.3,  65.0, "gps"},
    {7,  9, 30, 37.7858, -122.4064, 18,  28.5, 15.7,  85.0, "gps"},
    {7,  9, 45, 37.7901, -122.4012, 25,  22.1, 10.2,  90.0, "network"},

    // Office
    {7, 10,  0, 37.4220, -122.0841, 30,  15.0,  0.0,   0.0, "network"},
    {7, 12,  0, 37.4220, -122.0841, 35,  15.0,  0.0,   0.0, "network"},
    {7, 14,  0, 37.4220, -122.0841, 40,  15.0,  0.0,   0.0, "passive"},
    {7, 16,  0, 37.4220, -122.0841, 45,  15.0,  0.0,   0.0, "network"},

    // Lunch walk
    {7, 12, 30, 37.4225, -122.0835, 10,  15.5,  1.2, 120.0, "gps"},
    {7, 12, 35, 37.4230, -122.0828, 12,  16.0,  1.5, 135.0, "gps"},
    {7, 13,  0, 37.4235, -122.0820, 15,  16.5,  0.0,   0.0, "gps"},

    // Weekend trip, Golden Gate Bridge
    {5, 10,  0, 37.8199, -122.4783,  8,  75.0,  0.0,   0.0, "gps"},
    {5, 10, 30, 37.8199, -122.4783, 10,  75.0,  0.0,   0.0, "gps"},
    {5, 11,  0, 37.8199, -122.4783, 12,  75.0,  0.0,   0.0, "network"},

    // Union Square
    {4, 15,  0, 37.7879, -122.4075, 20,  45.0,  0.8, 180.0, "network"},
    {4, 15, 30, 37.7881, -122.4078, 25,  45.0,  0.5, 210.0, "network"},
    {4, 16,  0, 37.7885, -122.4082, 30,  45.0,  0.0,   0.0, "passive"},

    // Evening jog
    {3, 18,  0, 37.7694, -122.4862, 10, 120.0,  2.5, 270.0, "gps"},
    {3, 18, 15, 37.7701, -122.4905, 12, 125.0,  3.2, 285.0, "gps"},
    {3, 18, 30, 37.7712, -122.4948, 15, 130.0,  2.8, 300.0, "gps"},
    {3, 18, 45, 37.7725, -122.4990, 18, 128.0,  2.1, 315.0, "gps"},

    // Yesterday and today
    {1,  9,  0, 37.7749, -122.4194, 10,  52.3,  0.0,   0.0, "gps"},
    {1, 12, 30, 37.7735, -122.4142, 15,  38.0,  0.0,   0.0, "network"},
    {1, 18,  0, 37.7749, -122.4194, 12,  52.3,  0.0,   0.0, "gps"},
    {0,  8,  0, 37.7749, -122.4194, 10,  52.3,  0.0,   0.0, "gps"},
    {0, 10, 30, 37.7805, -122.4090, 20,  30.0,  5.5,  45.0, "gps"},
    {0, 14,  0, 37.7820, -122.4015, 25,  25.0,  0.0,   0.0, "network"},
};

static constexpr const char* kCreateTableSql =
    "CREATE TABLE IF NOT EXISTS locations ("
    "_id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "timestamp INTEGER NOT NULL, "
    "latitude REAL NOT NULL, "
    "longitude REAL NOT NULL, "
    "accuracy INTEGER, "
    "altitude REAL, "
    "speed REAL, "
    "bearing REAL, "
    "provider TEXT);";

static constexpr const char* kInsertSql =
    "INSERT INTO locations (timestamp, latitude, longitude, accuracy, "
    "altitude, speed, bearing, provider) VALUES (?, ?, ?, ?, ?, ?, ?, ?);";

static constexpr const char* kCreateIndexSql =
    "CREATE INDEX idx_timestamp ON locations (timestamp);";

// ─── RAII handles ───────────────────────────────────────────────────────────

struct SampleDbCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};

struct SampleStmtFinalizer {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

// ─── Internal helpers ───────────────────────────────────────────────────────

static bool exec_sql(sqlite3* db, const char* sql, std::string& error)
{
    char* msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &msg) == SQLITE_OK)
        return true;
    error = msg ? msg : sqlite3_errmsg(db);
    sqlite3_free(msg);
    return false;
}

static SampleDbResult failed(std::string error)
{
    SampleDbResult r;
    r.error = std::move(error);
    return r;
}

// ─── Public API ─────────────────────────────────────────────────────────────

std::int64_t sample_timestamp_ms(std::chrono::system_clock::time_point now,
                                 int days_ago, int hour, int minute)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);

    // mktime normalises the day underflow across month/year boundaries.
    local.tm_mday -= days_ago;
    local.tm_hour  = hour;
    local.tm_min   = minute;
    local.tm_sec   = 0;
    local.tm_isdst = -1;

    return static_cast<std::int64_t>(std::mktime(&local)) * 1000;
}

SampleDbResult create_sample_database(const std::string& path,
                                      std::chrono::system_clock::time_point now)
{
    std::error_code ec;
    fs::remove(path, ec);
    if (ec)
        return failed("cannot remove existing '" + path + "': " + ec.message());

    sqlite3* raw_db = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw_db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                                   nullptr);
    std::unique_ptr<sqlite3, SampleDbCloser> db(raw_db);
    if (rc != SQLITE_OK) {
        return failed("cannot create '" + path + "': " +
                      (db ? sqlite3_errmsg(db.get()) : sqlite3_errstr(rc)));
    }

    std::string error;
    if (!exec_sql(db.get(), kCreateTableSql, error) ||
        !exec_sql(db.get(), "BEGIN;", error))
        return failed(error);

    sqlite3_stmt* raw_st = nullptr;
    if (sqlite3_prepare_v2(db.get(), kInsertSql, -1, &raw_st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(raw_st);
        return failed(sqlite3_errmsg(db.get()));
    }
    std::unique_ptr<sqlite3_stmt, SampleStmtFinalizer> st(raw_st);

    SampleDbResult result;
    result.min_timestamp_ms = std::numeric_limits<std::int64_t>::max();
    result.max_timestamp_ms = std::numeric_limits<std::int64_t>::min();

    for (const auto& f : kSampleFixes) {
        const std::int64_t ts = sample_timestamp_ms(now, f.days_ago, f.hour, f.minute);

        sqlite3_reset(st.get());
        sqlite3_bind_int64 (st.get(), 1, ts);
        sqlite3_bind_double(st.get(), 2, f.latitude);
        sqlite3_bind_double(st.get(), 3, f.longitude);
        sqlite3_bind_int   (st.get(), 4, f.accuracy);
        sqlite3_bind_double(st.get(), 5, f.altitude);
        sqlite3_bind_double(st.get(), 6, f.speed);
        sqlite3_bind_double(st.get(), 7, f.bearing);
        sqlite3_bind_text  (st.get(), 8, f.provider, -1, SQLITE_STATIC);

        if (sqlite3_step(st.get()) != SQLITE_DONE)
            return failed(sqlite3_errmsg(db.get()));

        ++result.records;
        result.min_timestamp_ms = std::min(result.min_timestamp_ms, ts);
        result.max_timestamp_ms = std::max(result.max_timestamp_ms, ts);
    }
    st.reset();

    if (!exec_sql(db.get(), kCreateIndexSql, error) ||
        !exec_sql(db.get(), "COMMIT;", error))
        return failed(error);

    result.ok = true;
    return result;
}
