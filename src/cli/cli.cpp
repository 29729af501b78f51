/*
 * cli.cpp — Command-line options and the extraction run behind main()
 */

#include "cli.h"

#include "integrity/integrity.h"
#include "output/output.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

// ─── Artifact names ────────────────────────────────────────────────────────

static constexpr const char* kTimelineFile  = "timeline.csv";
static constexpr const char* kMapFile       = "map.html";
static constexpr const char* kActionLogFile = "action_log.txt";
static constexpr const char* kHashesFile    = "hashes.csv";

static constexpr std::size_t kBannerWidth = 50;

static std::string absolute_path(const std::string& p)
{
    std::error_code ec;
    const fs::path abs = fs::absolute(p, ec);
    return ec ? p : abs.string();
}

static std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// ─── Command line ──────────────────────────────────────────────────────────

void print_usage(const std::string& program, std::ostream& os)
{
    os << "Usage: " << program << " -output_dir DIR [--db_path FILE]"
       << " [--device_id ID]\n"
       << "       [--days N] [--radius M] [--min-duration MIN]"
       << " [--max-gap MIN]\n"
       << "\n"
       << "  -output_dir DIR     where timeline.csv, map.html, hashes.csv"
       << " and action_log.txt go\n"
       << "  --db_path FILE      use a local location database instead of"
       << " pulling from a device\n"
       << "  --device_id ID      device to pull from when several are"
       << " connected\n"
       << "  --days N            only fixes from the last N days, 0 = all"
       << " (default " << kDefaultLookbackDays << ")\n"
       << "  --radius M          stop radius in metres (default "
       << kDefaultStopRadiusM << ")\n"
       << "  --min-duration MIN  minimum stop length in minutes (default "
       << kDefaultMinStopDurationMin << ")\n"
       << "  --max-gap MIN       maximum gap between fixes in minutes"
       << " (default " << kDefaultMaxTimeGapMin << ")\n"
       << "  -h, --help          show this help\n";
}

ParseStatus parse_args(const std::vector<std::string>& args, Options& opts,
                       std::ostream& err)
{
    for (const auto& a : args)
        if (a == "-h" || a == "--help")
            return ParseStatus::kHelp;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (i + 1 >= args.size()) {
            err << "Error: missing value for '" << flag << "'\n";
            return ParseStatus::kError;
        }
        const std::string& value = args[++i];

        try {
            if (flag == "-output_dir" || flag == "--output_dir")
                opts.output_dir = value;
            else if (flag == "--db_path")
                opts.db_path = value;
            else if (flag == "--device_id")
                opts.device_id = value;
            else if (flag == "--days")
                opts.days = std::stoi(value);
            else if (flag == "--radius")
                opts.detector.stop_radius_m = std::stod(value);
            else if (flag == "--min-duration")
                opts.detector.min_stop_duration_min = std::stod(value);
            else if (flag == "--max-gap")
                opts.detector.max_time_gap_min = std::stod(value);
            else {
                err << "Error: unknown option '" << flag << "'\n";
                return ParseStatus::kError;
            }
        } catch (const std::invalid_argument&) {
            err << "Error: '" << value << "' is not a number for '"
                << flag << "'\n";
            return ParseStatus::kError;
        } catch (const std::out_of_range&) {
            err << "Error: '" << value << "' is out of range for '"
                << flag << "'\n";
            return ParseStatus::kError;
        }
    }

    if (opts.output_dir.empty()) {
        err << "Error: -output_dir is required\n";
        return ParseStatus::kError;
    }
    if (opts.days < 0) {
        err << "Error: --days must not be negative\n";
        return ParseStatus::kError;
    }
    return ParseStatus::kOk;
}

// ─── Device selection ──────────────────────────────────────────────────────

std::optional<std::string> choose_device(const std::vector<std::string>& devices,
                                         std::istream& in, std::ostream& out,
                                         ActionLog& log)
{
    log.log("Multiple devices found. Please select one:");
    for (std::size_t i = 0; i < devices.size(); ++i)
        out << "  " << (i + 1) << ". " << devices[i] << '\n';
    out << "Enter device number or ID: " << std::flush;

    std::string line;
    if (!std::getline(in, line)) {
        log.log("Operation cancelled by user.");
        return std::nullopt;
    }
    const std::string choice = trim(line);

    if (!choice.empty() &&
        choice.find_first_not_of("0123456789") == std::string::npos) {
        try {
            const unsigned long n = std::stoul(choice);
            if (n >= 1 && n <= devices.size())
                return devices[n - 1];
        } catch (const std::out_of_range&) {
            // fall through to the ID comparison
        }
    }
    for (const auto& d : devices)
        if (d == choice) return d;

    log.log("Invalid choice. Exiting.");
    return std::nullopt;
}

std::optional<std::string> acquire_database(const Options& opts,
                                            DeviceRepository& repo,
                                            std::istream& in, std::ostream& out,
                                            ActionLog& log)
{
    if (!opts.db_path.empty()) {
        std::error_code ec;
        if (!fs::exists(opts.db_path, ec)) {
            log.log("Error: Specified DB path '" + opts.db_path +
                    "' does not exist.");
            return std::nullopt;
        }
        log.log("Using provided local DB path: '" + opts.db_path + "'");
        return opts.db_path;
    }

    const auto devices = repo.list_devices();
    if (devices.empty()) {
        log.log("No devices found to pull from. Please connect an "
                "ADB-enabled device or provide a --db_path.");
        return std::nullopt;
    }

    std::optional<std::string> device;
    if (!opts.device_id.empty()) {
        for (const auto& d : devices)
            if (d == opts.device_id) device = d;
        if (!device) {
            log.log("Specified device ID '" + opts.device_id +
                    "' not found among connected devices.");
            return std::nullopt;
        }
    } else if (devices.size() == 1) {
        device = devices.front();
    } else {
        device = choose_device(devices, in, out, log);
        if (!device) return std::nullopt;
    }

    auto pulled = pull_location_db(repo, *device, opts.output_dir, log);
    if (!pulled)
        log.log("Failed to pull DB from '" + *device + "'.");
    return pulled;
}

// ─── Artifacts ─────────────────────────────────────────────────────────────

bool generate_outputs(const std::vector<Stop>& stops,
                      const std::string& output_dir, ActionLog& log)
{
    const std::string banner(kBannerWidth, '=');
    log.log(banner);
    log.log("Starting output file generation");
    log.log(banner);

    const std::string timeline = (fs::path(output_dir) / kTimelineFile).string();
    const std::string map      = (fs::path(output_dir) / kMapFile).string();
    const std::string log_file = (fs::path(output_dir) / kActionLogFile).string();
    const std::string hashes   = (fs::path(output_dir) / kHashesFile).string();

    log.log("Generating timeline.csv...");
    if (!write_text_file(timeline, build_timeline_csv(stops))) {
        log.log("Error generating timeline.csv: cannot write '" + timeline + "'");
        return false;
    }
    log.log("Generated timeline.csv with " + std::to_string(stops.size()) +
            " stops");

    log.log("Generating map.html...");
    if (!write_text_file(map, build_map_html(stops))) {
        log.log("Error generating map.html: cannot write '" + map + "'");
        return false;
    }
    log.log("Generated map.html with " + std::to_string(stops.size()) +
            " markers and heatmap");

    log.log("Generating action_log.txt...");
    if (!log.write(log_file)) {
        log.log("Error generating action_log.txt: cannot write '" + log_file + "'");
        return false;
    }
    log.log("Generated action_log.txt");

    if (!write_hashes_csv({timeline, map, log_file}, hashes, log))
        return false;

    log.log(banner);
    log.log("All output files generated successfully!");
    log.log("Output directory: " + absolute_path(output_dir));
    log.log(banner);
    return true;
}

// ─── Run ───────────────────────────────────────────────────────────────────

int run_extraction(const Options& opts, DeviceRepository& repo,
                   std::istream& in, std::ostream& out, ActionLog& log)
{
    std::error_code ec;
    fs::create_directories(opts.output_dir, ec);
    if (ec) {
        log.log("Error: Could not create output directory '" +
                opts.output_dir + "'. " + ec.message());
        return kExitFailure;
    }
    log.log("Output directory '" + opts.output_dir + "' ensured.");

    // ── Phase 1: Obtain the database ────────────────────────────────────
    const auto db_path = acquire_database(opts, repo, in, out, log);
    if (!db_path)
        return kExitFailure;
    log.log("Location database ready at: " + *db_path);

    // ── Phase 2: Extract fixes ──────────────────────────────────────────
    LocationQuery query;
    if (opts.days > 0) {
        const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now());
        query.since = lookback_start(now, opts.days);
    }

    log.log("Starting database parsing...");
    log.log("DB Config: Table='" + query.table + "', Timestamp='" +
            query.timestamp_column + "', Lat='" + query.latitude_column +
            "', Lon='" + query.longitude_column + "'");
    if (query.since)
        log.log("Filtering data from: " + format_utc(*query.since) + " UTC");

    DbReadResult extracted = read_location_fixes(*db_path, query);
    if (extracted.status != DbReadStatus::kOk) {
        log.log(std::string("Error: database read ") +
                to_string(extracted.status) + ": " + extracted.error);
        return kExitFailure;
    }
    if (extracted.rows_skipped > 0)
        log.log("Skipped " + std::to_string(extracted.rows_skipped) +
                " rows with a missing or non-numeric timestamp or coordinate.");
    if (extracted.fixes.empty()) {
        log.log("No location data extracted or an error occurred during parsing.");
        return kExitFailure;
    }
    log.log("Successfully parsed " + std::to_string(extracted.fixes.size()) +
            " location points.");

    // ── Phase 3: Detect stops ───────────────────────────────────────────
    log.log("Starting location analysis...");
    std::ostringstream thresholds;
    thresholds << "Stop radius=" << opts.detector.stop_radius_m
               << " m, min duration=" << opts.detector.min_stop_duration_min
               << " min, max gap=" << opts.detector.max_time_gap_min << " min";
    log.log(thresholds.str());

    const std::size_t fix_count = extracted.fixes.size();
    const auto stops = detect_stops(std::move(extracted.fixes), opts.detector);
    log.log("Analyzed " + std::to_string(fix_count) +
            " location points and found " + std::to_string(stops.size()) +
            " stops.");
    if (stops.empty())
        log.log("No stops identified in the location data.");
    else
        log.log("Identified " + std::to_string(stops.size()) +
                " stops from location data.");

    // ── Phase 4: Artifacts ──────────────────────────────────────────────
    log.log("Starting output generation...");
    if (!generate_outputs(stops, opts.output_dir, log))
        return kExitFailure;

    log.log("Location Timeline Extractor completed successfully!");
    log.log("All outputs saved to: " + absolute_path(opts.output_dir));
    return kExitSuccess;
}
