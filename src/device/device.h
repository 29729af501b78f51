/*
 * device.h — Device access (adb) for pulling the on-device location database
 */

#ifndef DEVICE_H
#define DEVICE_H

#include "action_log/action_log.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

/// Exit status and combined stdout/stderr of an external command.
struct CommandResult {
    int         exit_code = -1;
    std::string output;
};

/// Runs argv[0] with arguments; must never throw.
using CommandRunner = std::function<CommandResult(const std::vector<std::string>&)>;

/// Run a command through the shell (arguments single-quoted, stderr merged
/// into stdout). exit_code is 127 when the program cannot be found.
CommandResult run_command(const std::vector<std::string>& argv);

enum class PullStatus {
    kPulled,         // file copied to the local path
    kNotAccessible,  // remote path missing or permission denied
    kFailed          // any other transport/command failure
};

struct PullResult {
    PullStatus  status = PullStatus::kFailed;
    std::string message;  // tool output, trimmed
};

/// Capability interface over a connected device.
class DeviceRepository {
public:
    virtual ~DeviceRepository() = default;

    /// IDs of devices that are attached and authorised.
    virtual std::vector<std::string> list_devices() = 0;

    /// Remote paths that may hold a location database, most likely first.
    virtual std::vector<std::string>
    list_candidate_databases(const std::string& device_id) = 0;

    virtual PullResult pull(const std::string& device_id,
                            const std::string& remote_path,
                            const std::string& local_path) = 0;
};

/// DeviceRepository backed by the `adb` command-line tool.
class AdbDeviceRepository : public DeviceRepository {
public:
    explicit AdbDeviceRepository(ActionLog& log,
                                 CommandRunner runner = run_command);

    std::vector<std::string> list_devices() override;
    std::vector<std::string>
    list_candidate_databases(const std::string& device_id) override;
    PullResult pull(const std::string& device_id,
                    const std::string& remote_path,
                    const std::string& local_path) override;

private:
    ActionLog&    log_;
    CommandRunner runner_;
};

/// Try every candidate database of `device_id` in turn, pulling into
/// `output_dir`. Partial local files from failed attempts are removed.
/// Returns the local path of the first successful pull.
std::optional<std::string> pull_location_db(DeviceRepository& repo,
                                            const std::string& device_id,
                                            const std::string& output_dir,
                                            ActionLog& log);

#endif // DEVICE_H
