/*
 * db_reader.h — Location fix extraction from an SQLite location database
 */

#ifndef DB_READER_H
#define DB_READER_H

#include "location/location.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/// Default schema: the Android-style `locations` table with epoch-millisecond
/// timestamps and plain decimal-degree coordinates (not E7).
inline constexpr const char* kDefaultTable           = "locations";
inline constexpr const char* kDefaultTimestampColumn = "timestamp";
inline constexpr const char* kDefaultLatitudeColumn  = "latitude";
inline constexpr const char* kDefaultLongitudeColumn = "longitude";
inline constexpr int         kDefaultLookbackDays    = 7;

struct LocationQuery {
    std::string table            = kDefaultTable;
    std::string timestamp_column = kDefaultTimestampColumn;
    std::string latitude_column  = kDefaultLatitudeColumn;
    std::string longitude_column = kDefaultLongitudeColumn;

    /// Only rows at or after this instant; unset reads everything.
    std::optional<Timestamp> since;
};

enum class DbReadStatus {
    kOk,
    kOpenFailed,    // file missing, unreadable or not a database
    kTableMissing,  // database opened but the configured table does not exist
    kQueryFailed    // SELECT could not be prepared or stepping failed
};

struct DbReadResult {
    DbReadStatus             status = DbReadStatus::kOk;
    std::vector<LocationFix> fixes;          // ascending by timestamp
    std::size_t              rows_read    = 0;
    std::size_t              rows_skipped = 0;  // non-numeric field
    std::string              error;             // empty when status == kOk
};

/// `now` minus `days` whole days.
Timestamp lookback_start(Timestamp now, int days);

/// Read every fix matching `query` from the database at `db_path`.
/// Rows whose timestamp or coordinates are not numbers (NULL, TEXT, BLOB)
/// or not finite are counted in `rows_skipped`, never returned. A NULL
/// timestamp reaches that count even when `query.since` is set.
DbReadResult read_location_fixes(const std::string& db_path,
                                 const LocationQuery& query);

/// Human-readable name of a status, for log lines.
const char* to_string(DbReadStatus status);

#endif // DB_READER_H
