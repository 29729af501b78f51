/*
 * location.cpp — Location fix / stop records and UTC timestamp helpers
 */

#include "location.h"

#include <ctime>

// ─── Formatting constants ──────────────────────────────────────────────────

static constexpr const char* kFmtSeconds = "%Y-%m-%d %H:%M:%S";
static constexpr const char* kFmtMinutes = "%Y-%m-%d %H:%M";
static constexpr std::size_t kFmtBufLen  = 32;

// ─── Internal helpers ───────────────────────────────────────────────────────

static std::string format_utc_with(Timestamp t, const char* fmt)
{
    // Floor to whole seconds so pre-epoch instants do not round up.
    auto secs = std::chrono::floor<std::chrono::seconds>(t);
    std::time_t tt = std::chrono::system_clock::to_time_t(secs);

    std::tm tm{};
    if (gmtime_r(&tt, &tm) == nullptr)
        return {};

    char buf[kFmtBufLen];
    std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

// ─── Public API ─────────────────────────────────────────────────────────────

Timestamp timestamp_from_epoch_ms(std::int64_t ms)
{
    return Timestamp(std::chrono::milliseconds(ms));
}

std::int64_t epoch_ms(Timestamp t)
{
    return t.time_since_epoch().count();
}

double minutes_between(Timestamp from, Timestamp to)
{
    using FractionalMinutes = std::chrono::duration<double, std::ratio<60>>;
    return std::chrono::duration_cast<FractionalMinutes>(to - from).count();
}

std::string format_utc(Timestamp t)
{
    return format_utc_with(t, kFmtSeconds);
}

std::string format_utc_minutes(Timestamp t)
{
    return format_utc_with(t, kFmtMinutes);
}
