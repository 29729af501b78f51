/*
 * device.cpp — Device access (adb) for pulling the on-device location database
 */

#include "device.h"

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

// ─── adb constants ─────────────────────────────────────────────────────────

static constexpr const char* kAdb          = "adb";
static constexpr const char* kDeviceState  = "\tdevice";
static constexpr const char* kPulledMarker = "pulled";
static constexpr int         kExitNotFound = 127;
static constexpr std::size_t kReadChunk    = 4096;

/// Google Play Services location stores, most likely first.
static const std::array<const char*, 2> kCommonDbPaths = {
    "/data/data/com.google.android.gms/databases/locations.db",
    "/data/data/com.google.android.gms/databases/cache.db",
};

/// Output fragments meaning "this path cannot be read, try the next one".
static const std::array<const char*, 3> kNotAccessibleMarkers = {
    "Permission denied",
    "failed to stat",
    "No such file or directory",
};

// ─── Internal helpers ───────────────────────────────────────────────────────

static std::string shell_quote(const std::string& arg)
{
    std::string out = "'";
    for (char ch : arg) {
        if (ch == '\'') out += "'\\''";
        else            out.push_back(ch);
    }
    out.push_back('\'');
    return out;
}

static std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

static std::string join(const std::vector<std::string>& parts, const char* sep)
{
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

static bool contains(const std::string& haystack, const char* needle)
{
    return haystack.find(needle) != std::string::npos;
}

// ─── Command execution ─────────────────────────────────────────────────────

CommandResult run_command(const std::vector<std::string>& argv)
{
    CommandResult result;
    if (argv.empty()) return result;

    std::string cmd;
    for (const auto& a : argv) {
        if (!cmd.empty()) cmd.push_back(' ');
        cmd += shell_quote(a);
    }
    cmd += " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (pipe == nullptr) {
        result.output = "cannot start '" + argv.front() + "'";
        return result;
    }

    std::array<char, kReadChunk> buf{};
    std::size_t n = 0;
    while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0)
        result.output.append(buf.data(), n);

    const int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    return result;
}

// ─── AdbDeviceRepository ────────────────────────────────────────────────────

AdbDeviceRepository::AdbDeviceRepository(ActionLog& log, CommandRunner runner)
    : log_(log), runner_(std::move(runner))
{
}

std::vector<std::string> AdbDeviceRepository::list_devices()
{
    log_.log("Checking for connected ADB devices...");

    CommandResult r = runner_({kAdb, "devices"});
    if (r.exit_code != 0) {
        if (r.exit_code == kExitNotFound)
            log_.log("Error checking devices: ADB not found. Please ensure "
                     "ADB is installed and in your system's PATH.");
        else
            log_.log("Error checking devices: " + trim(r.output));
        return {};
    }

    // First line is the "List of devices attached" banner.
    std::vector<std::string> devices;
    std::istringstream lines(r.output);
    std::string line;
    bool banner = true;
    while (std::getline(lines, line)) {
        if (banner) { banner = false; continue; }
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!contains(line, kDeviceState))
            continue;
        devices.push_back(trim(line.substr(0, line.find('\t'))));
    }

    if (devices.empty())
        log_.log("No ADB devices found. Ensure device is connected and USB "
                 "debugging is enabled.");
    else
        log_.log("Found " + std::to_string(devices.size()) + " device(s): " +
                 join(devices, ", "));
    return devices;
}

std::vector<std::string>
AdbDeviceRepository::list_candidate_databases(const std::string& /*device_id*/)
{
    return {kCommonDbPaths.begin(), kCommonDbPaths.end()};
}

PullResult AdbDeviceRepository::pull(const std::string& device_id,
                                     const std::string& remote_path,
                                     const std::string& local_path)
{
    CommandResult r = runner_({kAdb, "-s", device_id, "pull",
                               remote_path, local_path});

    PullResult out;
    out.message = trim(r.output);

    for (const char* marker : kNotAccessibleMarkers) {
        if (contains(r.output, marker)) {
            out.status = PullStatus::kNotAccessible;
            return out;
        }
    }

    if (r.exit_code == 0 && contains(r.output, kPulledMarker))
        out.status = PullStatus::kPulled;
    else
        out.status = PullStatus::kFailed;
    return out;
}

// ─── Public API ─────────────────────────────────────────────────────────────

std::optional<std::string> pull_location_db(DeviceRepository& repo,
                                            const std::string& device_id,
                                            const std::string& output_dir,
                                            ActionLog& log)
{
    log.log("Attempting to pull location database from device '" +
            device_id + "'...");

    for (const auto& remote : repo.list_candidate_databases(device_id)) {
        const std::string local =
            (fs::path(output_dir) / fs::path(remote).filename()).string();

        log.log("Trying to pull '" + remote + "' to '" + local + "'...");
        PullResult r = repo.pull(device_id, remote, local);

        if (r.status == PullStatus::kPulled) {
            log.log("Successfully pulled '" + remote + "' to '" + local + "'");
            return local;
        }

        if (r.status == PullStatus::kNotAccessible)
            log.log("Permission denied or path not found for '" + remote +
                    "'. Error: " + r.message + ". Trying next path...");
        else
            log.log("ADB pull error for '" + remote + "': " + r.message +
                    ". Trying next path...");

        std::error_code ec;
        fs::remove(local, ec);
        if (ec)
            log.log("Could not remove partial file '" + local + "': " +
                    ec.message());
    }

    log.log("Failed to pull location database from device '" + device_id +
            "' using any common path.");
    log.log("TIP: If your phone is not rooted, you may need to use an "
            "emulator or a publicly available SQLite location DB.");
    return std::nullopt;
}
