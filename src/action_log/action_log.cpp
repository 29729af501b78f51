/*
 * action_log.cpp — Timestamped audit trail of everything the extractor does
 */

#include "action_log.h"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

// ─── Log file layout ───────────────────────────────────────────────────────

static constexpr const char* kLogTitle =
    "Location Timeline Extractor - Detailed Action Log";
static constexpr std::size_t kRuleWidth  = 70;
static constexpr const char* kTimeFormat = "%Y-%m-%d %H:%M:%S";

ActionLog::ActionLog(std::ostream* echo, Clock clock)
    : echo_(echo), clock_(std::move(clock))
{
    if (!clock_)
        clock_ = [] { return std::chrono::system_clock::now(); };
}

std::string ActionLog::now_string(bool with_millis) const
{
    const auto now = clock_();
    const std::time_t tt = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&tt, &tm);

    std::ostringstream os;
    os << std::put_time(&tm, kTimeFormat);
    if (with_millis)
        os << '.' << std::setw(3) << std::setfill('0') << millis;
    return os.str();
}

void ActionLog::log(const std::string& message)
{
    std::string entry = "[" + now_string(true) + "] " + message;
    if (echo_)
        *echo_ << entry << '\n';
    entries_.push_back(std::move(entry));
}

bool ActionLog::write(const std::string& path) const
{
    std::ofstream ofs(path);
    if (!ofs)
        return false;

    const std::string rule(kRuleWidth, '=');
    ofs << kLogTitle << '\n'
        << rule << '\n'
        << "Generated at: " << now_string(false) << '\n'
        << rule << "\n\n";

    for (const auto& entry : entries_)
        ofs << entry << '\n';

    ofs << "\n[" << now_string(false) << "] Action log completed.";

    ofs.flush();
    return static_cast<bool>(ofs);
}
