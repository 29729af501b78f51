#include "cli/cli.h"
#include "sample_db/sample_db.h"

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

/// Devices are canned; pull() copies `source_db` to the requested local path.
class LocalCopyRepository : public DeviceRepository {
public:
    std::vector<std::string> devices;
    std::string              source_db;
    std::vector<std::string> pulled_from;

    std::vector<std::string> list_devices() override { return devices; }

    std::vector<std::string>
    list_candidate_databases(const std::string&) override
    {
        return {"/data/data/com.google.android.gms/databases/locations.db"};
    }

    PullResult pull(const std::string& device_id, const std::string&,
                    const std::string& local) override
    {
        pulled_from.push_back(device_id);
        PullResult r;
        std::error_code ec;
        fs::copy_file(source_db, local, fs::copy_options::overwrite_existing, ec);
        r.status  = ec ? PullStatus::kFailed : PullStatus::kPulled;
        r.message = ec ? ec.message() : "1 file pulled";
        return r;
    }
};

bool logged(const ActionLog& log, const std::string& needle)
{
    for (const auto& e : log.entries())
        if (e.find(needle) != std::string::npos) return true;
    return false;
}

std::size_t line_count(const fs::path& p)
{
    std::ifstream ifs(p);
    std::size_t n = 0;
    for (std::string line; std::getline(ifs, line);) ++n;
    return n;
}

} // namespace

// ─── parse_args ─────────────────────────────────────────────────────────────

TEST(ParseArgs, DefaultsAndOverrides)
{
    Options opts;
    std::ostringstream err;
    ASSERT_EQ(parse_args({"-output_dir", "out"}, opts, err), ParseStatus::kOk);
    EXPECT_EQ(opts.output_dir, "out");
    EXPECT_EQ(opts.days, kDefaultLookbackDays);
    EXPECT_DOUBLE_EQ(opts.detector.stop_radius_m, kDefaultStopRadiusM);

    Options full;
    ASSERT_EQ(parse_args({"--output_dir", "o", "--db_path", "x.db",
                          "--device_id", "emulator-5554", "--days", "0",
                          "--radius", "75.5", "--min-duration", "5",
                          "--max-gap", "12"},
                         full, err),
              ParseStatus::kOk);
    EXPECT_EQ(full.db_path, "x.db");
    EXPECT_EQ(full.device_id, "emulator-5554");
    EXPECT_EQ(full.days, 0);
    EXPECT_DOUBLE_EQ(full.detector.stop_radius_m, 75.5);
    EXPECT_DOUBLE_EQ(full.detector.min_stop_duration_min, 5.0);
    EXPECT_DOUBLE_EQ(full.detector.max_time_gap_min, 12.0);
    EXPECT_TRUE(err.str().empty());
}

TEST(ParseArgs, RejectsMalformedCommandLines)
{
    const std::vector<std::vector<std::string>> bad = {
        {},
        {"--db_path", "x.db"},
        {"-output_dir"},
        {"-output_dir", "o", "--bogus", "1"},
        {"-output_dir", "o", "--days", "seven"},
        {"-output_dir", "o", "--days", "-1"},
        {"-output_dir", "o", "--radius", "1e999"},
    };
    for (const auto& args : bad) {
        Options opts;
        std::ostringstream err;
        EXPECT_EQ(parse_args(args, opts, err), ParseStatus::kError)
            << "args: " << args.size();
        EXPECT_NE(err.str().find("Error:"), std::string::npos);
    }
}

TEST(ParseArgs, HelpNeedsNoValue)
{
    for (const std::string flag : {"-h", "--help"}) {
        Options opts;
        std::ostringstream err;
        EXPECT_EQ(parse_args({flag}, opts, err), ParseStatus::kHelp);
        EXPECT_EQ(parse_args({"-output_dir", "o", flag}, opts, err),
                  ParseStatus::kHelp);
        EXPECT_TRUE(err.str().empty());
    }

    std::ostringstream usage;
    print_usage("location_timeline", usage);
    EXPECT_EQ(usage.str().rfind("Usage: location_timeline -output_dir DIR", 0), 0u);
    EXPECT_NE(usage.str().find("--help"), std::string::npos);
}

// ─── choose_device ──────────────────────────────────────────────────────────

TEST(ChooseDevice, ByNumberOrId)
{
    const std::vector<std::string> devices = {"emulator-5554", "R58M123"};
    ActionLog log;
    std::ostringstream out;

    std::istringstream by_number("2\n");
    EXPECT_EQ(choose_device(devices, by_number, out, log), "R58M123");

    std::istringstream by_id("  emulator-5554 \r\n");
    EXPECT_EQ(choose_device(devices, by_id, out, log), "emulator-5554");

    EXPECT_NE(out.str().find("  1. emulator-5554\n  2. R58M123\n"), std::string::npos);
    EXPECT_NE(out.str().find("Enter device number or ID: "), std::string::npos);
}

TEST(ChooseDevice, RejectsUnknownChoices)
{
    const std::vector<std::string> devices = {"emulator-5554", "R58M123"};
    std::ostringstream out;

    for (const std::string input : {"0\n", "3\n", "99999999999999999999999\n",
                                    "pixel\n", "\n"}) {
        ActionLog log;
        std::istringstream in(input);
        EXPECT_FALSE(choose_device(devices, in, out, log).has_value()) << input;
        EXPECT_TRUE(logged(log, "Invalid choice"));
    }

    ActionLog log;
    std::istringstream eof("");
    EXPECT_FALSE(choose_device(devices, eof, out, log).has_value());
    EXPECT_TRUE(logged(log, "Operation cancelled"));
}

// ─── run_extraction ─────────────────────────────────────────────────────────

class RunExtractionTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::path(::testing::TempDir()) / ("cli_" + std::string(info->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        opts_.output_dir = (dir_ / "out").string();
        opts_.days       = 0;
    }

    void TearDown() override { fs::remove_all(dir_); }

    std::string sample_db()
    {
        const std::string path = (dir_ / "locations.db").string();
        const SampleDbResult r =
            create_sample_database(path, std::chrono::system_clock::now());
        EXPECT_TRUE(r.ok) << r.error;
        return path;
    }

    std::string db_with(const std::string& sql)
    {
        const std::string path = (dir_ / "custom.db").string();
        sqlite3* db = nullptr;
        EXPECT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
        EXPECT_EQ(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);
        sqlite3_close(db);
        return path;
    }

    int run(std::istream& in)
    {
        return run_extraction(opts_, repo_, in, out_, log_);
    }

    int run()
    {
        std::istringstream in;
        return run(in);
    }

    void expect_artifacts() const
    {
        const fs::path out = opts_.output_dir;
        for (const char* name : {"timeline.csv", "map.html", "action_log.txt",
                                 "hashes.csv"})
            EXPECT_TRUE(fs::exists(out / name)) << name;
        EXPECT_EQ(line_count(out / "hashes.csv"), 4u);
    }

    fs::path            dir_;
    Options             opts_;
    LocalCopyRepository repo_;
    ActionLog           log_;
    std::ostringstream  out_;
};

TEST_F(RunExtractionTest, SampleDatabaseProducesAllArtifacts)
{
    opts_.db_path = sample_db();

    ASSERT_EQ(run(), kExitSuccess);
    expect_artifacts();

    // The home visit alone (08:00-08:30, same coordinate) is one stop.
    EXPECT_GT(line_count(fs::path(opts_.output_dir) / "timeline.csv"), 1u);
    EXPECT_TRUE(logged(log_, "Successfully parsed 29 location points."));
    EXPECT_TRUE(logged(log_, "Location Timeline Extractor completed successfully!"));
    EXPECT_TRUE(repo_.pulled_from.empty());
}

TEST_F(RunExtractionTest, PullsFromTheOnlyDevice)
{
    repo_.source_db = sample_db();
    repo_.devices   = {"emulator-5554"};

    ASSERT_EQ(run(), kExitSuccess);
    EXPECT_EQ(repo_.pulled_from, (std::vector<std::string>{"emulator-5554"}));
    EXPECT_TRUE(fs::exists(fs::path(opts_.output_dir) / "locations.db"));
    expect_artifacts();
}

TEST_F(RunExtractionTest, AsksWhichDeviceWhenSeveralAreConnected)
{
    repo_.source_db = sample_db();
    repo_.devices   = {"emulator-5554", "R58M123"};

    std::istringstream in("2\n");
    ASSERT_EQ(run(in), kExitSuccess);
    EXPECT_EQ(repo_.pulled_from, (std::vector<std::string>{"R58M123"}));
}

TEST_F(RunExtractionTest, InvalidDeviceChoiceFails)
{
    repo_.devices = {"emulator-5554", "R58M123"};
    std::istringstream in("7\n");
    EXPECT_EQ(run(in), kExitFailure);
    EXPECT_TRUE(repo_.pulled_from.empty());
}

TEST_F(RunExtractionTest, NoDevicesFails)
{
    EXPECT_EQ(run(), kExitFailure);
    EXPECT_TRUE(logged(log_, "No devices found to pull from"));
}

TEST_F(RunExtractionTest, UnknownDeviceIdFails)
{
    repo_.devices    = {"emulator-5554"};
    opts_.device_id  = "R58M123";
    EXPECT_EQ(run(), kExitFailure);
    EXPECT_TRUE(logged(log_, "Specified device ID 'R58M123' not found"));
    EXPECT_TRUE(repo_.pulled_from.empty());
}

TEST_F(RunExtractionTest, MissingDbPathFails)
{
    opts_.db_path = (dir_ / "absent.db").string();
    EXPECT_EQ(run(), kExitFailure);
    EXPECT_TRUE(logged(log_, "does not exist"));
}

TEST_F(RunExtractionTest, EmptyTableFails)
{
    opts_.db_path = db_with(
        "CREATE TABLE locations (timestamp INTEGER, latitude REAL, longitude REAL);");
    EXPECT_EQ(run(), kExitFailure);
    EXPECT_TRUE(logged(log_, "No location data extracted"));
    EXPECT_FALSE(fs::exists(fs::path(opts_.output_dir) / "timeline.csv"));
}

TEST_F(RunExtractionTest, MissingTableFails)
{
    opts_.db_path = db_with("CREATE TABLE other (x INTEGER);");
    EXPECT_EQ(run(), kExitFailure);
    EXPECT_TRUE(logged(log_, "table missing"));
}

TEST_F(RunExtractionTest, NoStopsStillWritesArtifacts)
{
    opts_.db_path = db_with(
        "CREATE TABLE locations (timestamp INTEGER, latitude REAL, longitude REAL);"
        "INSERT INTO locations VALUES (1700000000000, 37.7749, -122.4194);");

    ASSERT_EQ(run(), kExitSuccess);
    expect_artifacts();
    EXPECT_EQ(line_count(fs::path(opts_.output_dir) / "timeline.csv"), 1u);
    EXPECT_TRUE(logged(log_, "No stops identified in the location data."));
}

TEST_F(RunExtractionTest, ThresholdsReachTheDetector)
{
    opts_.db_path = sample_db();
    opts_.detector.min_stop_duration_min = 100000.0;

    ASSERT_EQ(run(), kExitSuccess);
    EXPECT_EQ(line_count(fs::path(opts_.output_dir) / "timeline.csv"), 1u);
    EXPECT_TRUE(logged(log_, "min duration=100000 min"));
}
