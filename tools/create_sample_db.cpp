/*
 * create_sample_db.cpp — Writes a sample location database for offline runs
 *
 * Usage:  ./create_sample_db [OUTPUT_DB]      (default sample_data/locations.db)
 */

#include "location/location.h"
#include "sample_db/sample_db.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

static constexpr const char* kDefaultOutput = "sample_data/locations.db";

int main(int argc, char* argv[])
{
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [OUTPUT_DB]\n";
        return 1;
    }
    const fs::path out = (argc == 2) ? fs::path(argv[1]) : fs::path(kDefaultOutput);

    std::error_code ec;
    if (out.has_parent_path()) {
        fs::create_directories(out.parent_path(), ec);
        if (ec) {
            std::cerr << "Error: cannot create '" << out.parent_path().string()
                      << "': " << ec.message() << '\n';
            return 1;
        }
    }

    const bool existed = fs::exists(out, ec);
    const SampleDbResult r =
        create_sample_database(out.string(), std::chrono::system_clock::now());
    if (!r.ok) {
        std::cerr << "Error: " << r.error << '\n';
        return 1;
    }
    if (existed)
        std::cout << "Existing " << out.string() << " replaced.\n";

    const fs::path abs = fs::absolute(out, ec);
    std::cout << "Created " << (ec ? out : abs).string() << '\n'
              << "  Total records: " << r.records << '\n'
              << "  Date range:    "
              << format_utc(timestamp_from_epoch_ms(r.min_timestamp_ms)) << " to "
              << format_utc(timestamp_from_epoch_ms(r.max_timestamp_ms)) << " UTC\n";

    const auto size = fs::file_size(out, ec);
    if (!ec)
        std::cout << "  File size:     " << size << " bytes\n";
    return 0;
}
