/*
 * action_log.h — Timestamped audit trail of everything the extractor does
 */

#ifndef ACTION_LOG_H
#define ACTION_LOG_H

#include <chrono>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

/// Records "[YYYY-MM-DD HH:MM:SS.mmm] message" lines (local time), echoes
/// them to an optional stream and can dump them to action_log.txt.
/// Passed by reference to every collaborator that reports progress.
class ActionLog {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /// `echo` may be null (silent). `clock` defaults to system_clock::now.
    explicit ActionLog(std::ostream* echo = nullptr, Clock clock = {});

    void log(const std::string& message);

    const std::vector<std::string>& entries() const { return entries_; }

    /// Write the detailed action log file. Returns false on I/O failure.
    bool write(const std::string& path) const;

    /// Current local time as "YYYY-MM-DD HH:MM:SS" (or with ".mmm").
    std::string now_string(bool with_millis) const;

private:
    std::ostream*            echo_;
    Clock                    clock_;
    std::vector<std::string> entries_;
};

#endif // ACTION_LOG_H
