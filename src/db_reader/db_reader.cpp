/*
 * db_reader.cpp — Location fix extraction from an SQLite location database
 */

#include "db_reader.h"

#include <sqlite3.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>

// ─── Result column positions in the SELECT below ───────────────────────────

static constexpr int kColTimestamp = 0;
static constexpr int kColLatitude  = 1;
static constexpr int kColLongitude = 2;

static constexpr std::int64_t kMsPerDay = 24LL * 60 * 60 * 1000;

// ─── RAII handles ───────────────────────────────────────────────────────────

struct SqliteCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};

struct StmtFinalizer {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

using DbHandle   = std::unique_ptr<sqlite3, SqliteCloser>;
using StmtHandle = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

// ─── Internal helpers ───────────────────────────────────────────────────────

/// Quote an identifier for SQL (`name` with embedded backticks doubled).
/// Backticks, unlike double quotes, never degrade to a string literal when
/// the column does not exist.
static std::string quote_ident(const std::string& name)
{
    std::string out;
    out.reserve(name.size() + 2);
    out.push_back('`');
    for (char ch : name) {
        if (ch == '`') out.push_back('`');
        out.push_back(ch);
    }
    out.push_back('`');
    return out;
}

static StmtHandle prepare(sqlite3* db, const std::string& sql, int* rc_out)
{
    sqlite3_stmt* raw = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr);
    if (rc_out) *rc_out = rc;
    if (rc != SQLITE_OK) {
        sqlite3_finalize(raw);
        return nullptr;
    }
    return StmtHandle(raw);
}

/// PRAGMA table_info yields one row per column; none means no such table.
/// Returns SQLITE_ROW (exists), SQLITE_DONE (missing) or an error code.
static int probe_table(sqlite3* db, const std::string& table)
{
    int rc = SQLITE_OK;
    auto st = prepare(db, "PRAGMA table_info(" + quote_ident(table) + ");", &rc);
    if (!st) return rc;
    return sqlite3_step(st.get());
}

/// SQLite has no column types, only value types: INTEGER or REAL counts as
/// a number, TEXT/BLOB/NULL does not.
static bool is_numeric(sqlite3_stmt* st, int col)
{
    const int type = sqlite3_column_type(st, col);
    return type == SQLITE_INTEGER || type == SQLITE_FLOAT;
}

static DbReadResult failure(DbReadStatus status, std::string message)
{
    DbReadResult r;
    r.status = status;
    r.error  = std::move(message);
    return r;
}

// ─── Public API ─────────────────────────────────────────────────────────────

Timestamp lookback_start(Timestamp now, int days)
{
    return now - std::chrono::milliseconds(kMsPerDay * days);
}

DbReadResult read_location_fixes(const std::string& db_path,
                                 const LocationQuery& query)
{
    sqlite3* raw_db = nullptr;
    int rc = sqlite3_open_v2(db_path.c_str(), &raw_db,
                             SQLITE_OPEN_READONLY, nullptr);
    DbHandle db(raw_db);  // sqlite3_open_v2 allocates a handle even on error
    if (rc != SQLITE_OK) {
        return failure(DbReadStatus::kOpenFailed,
                       "cannot open '" + db_path + "': " +
                       (db ? sqlite3_errmsg(db.get()) : sqlite3_errstr(rc)));
    }

    // The file is only read lazily, so a non-database file fails here.
    rc = probe_table(db.get(), query.table);
    if (rc == SQLITE_DONE) {
        return failure(DbReadStatus::kTableMissing,
                       "table '" + query.table + "' not found in database '" +
                       db_path + "'");
    }
    if (rc != SQLITE_ROW) {
        return failure(DbReadStatus::kOpenFailed,
                       "cannot read '" + db_path + "': " + sqlite3_errstr(rc));
    }

    const std::string ts_col = quote_ident(query.timestamp_column);
    const std::string sql =
        "SELECT " + ts_col + ", " +
        quote_ident(query.latitude_column) + ", " +
        quote_ident(query.longitude_column) +
        " FROM " + quote_ident(query.table) +
        " WHERE (" + ts_col + " >= ? OR " + ts_col + " IS NULL)" +
        " ORDER BY " + ts_col + " ASC;";

    auto st = prepare(db.get(), sql, nullptr);
    if (!st) {
        return failure(DbReadStatus::kQueryFailed, sqlite3_errmsg(db.get()));
    }

    const std::int64_t since_ms = query.since
        ? epoch_ms(*query.since)
        : std::numeric_limits<std::int64_t>::min();
    sqlite3_bind_int64(st.get(), 1, since_ms);

    DbReadResult result;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        ++result.rows_read;

        if (!is_numeric(st.get(), kColTimestamp) ||
            !is_numeric(st.get(), kColLatitude)  ||
            !is_numeric(st.get(), kColLongitude)) {
            ++result.rows_skipped;
            continue;
        }

        LocationFix fix;
        fix.timestamp = timestamp_from_epoch_ms(
            sqlite3_column_int64(st.get(), kColTimestamp));
        fix.latitude  = sqlite3_column_double(st.get(), kColLatitude);
        fix.longitude = sqlite3_column_double(st.get(), kColLongitude);
        if (!std::isfinite(fix.latitude) || !std::isfinite(fix.longitude)) {
            ++result.rows_skipped;
            continue;
        }
        result.fixes.push_back(fix);
    }

    if (rc != SQLITE_DONE) {
        return failure(DbReadStatus::kQueryFailed, sqlite3_errmsg(db.get()));
    }
    return result;
}

const char* to_string(DbReadStatus status)
{
    switch (status) {
        case DbReadStatus::kOk:           return "ok";
        case DbReadStatus::kOpenFailed:   return "open failed";
        case DbReadStatus::kTableMissing: return "table missing";
        case DbReadStatus::kQueryFailed:  return "query failed";
    }
    return "unknown";
}
