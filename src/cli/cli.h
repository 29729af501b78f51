/*
 * cli.h — Command-line options and the extraction run behind main()
 */

#ifndef CLI_H
#define CLI_H

#include "action_log/action_log.h"
#include "db_reader/db_reader.h"
#include "device/device.h"
#include "location/location.h"
#include "stop_detector/stop_detector.h"

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;

struct Options {
    std::string        output_dir;
    std::string        db_path;    // empty: pull from a device
    std::string        device_id;  // empty: the only device, or ask
    int                days = kDefaultLookbackDays;  // 0 = no window
    StopDetectorConfig detector;
};

enum class ParseStatus {
    kOk,
    kHelp,   // -h / --help given
    kError   // reason already written to the error stream
};

/// Parse `args` (program name excluded) into `opts`.
ParseStatus parse_args(const std::vector<std::string>& args, Options& opts,
                       std::ostream& err);

void print_usage(const std::string& program, std::ostream& os);

/// Ask on `out`/`in` for one of several devices, by 1-based number or ID.
/// nullopt on end of input or an unknown choice.
std::optional<std::string> choose_device(const std::vector<std::string>& devices,
                                         std::istream& in, std::ostream& out,
                                         ActionLog& log);

/// Phase 1: the local database path, either `opts.db_path` or a copy
/// pulled from a device into `opts.output_dir`.
std::optional<std::string> acquire_database(const Options& opts,
                                            DeviceRepository& repo,
                                            std::istream& in, std::ostream& out,
                                            ActionLog& log);

/// Phase 4: timeline.csv, map.html, action_log.txt, then hashes.csv over
/// those three. Written even when `stops` is empty.
bool generate_outputs(const std::vector<Stop>& stops,
                      const std::string& output_dir, ActionLog& log);

/// All four phases. Returns kExitSuccess or kExitFailure.
int run_extraction(const Options& opts, DeviceRepository& repo,
                   std::istream& in, std::ostream& out, ActionLog& log);

#endif // CLI_H
