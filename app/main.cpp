/*
 * main.cpp — Location timeline extractor (C++17)
 *
 * Thin orchestrator: parses the command line, then hands over to cli for
 * the four phases (obtain database, extract fixes, detect stops, write
 * timeline.csv / map.html / action_log.txt / hashes.csv).
 *
 * Usage:  ./location_timeline -output_dir DIR [--db_path FILE]
 *                             [--device_id ID] [--days N] [--radius M]
 *                             [--min-duration MIN] [--max-gap MIN]
 */

#include "action_log/action_log.h"
#include "cli/cli.h"
#include "device/device.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    const std::vector<std::string> args(argv + 1, argv + argc);

    Options opts;
    switch (parse_args(args, opts, std::cerr)) {
        case ParseStatus::kOk:
            break;
        case ParseStatus::kHelp:
            print_usage(argv[0], std::cout);
            return kExitSuccess;
        case ParseStatus::kError:
            print_usage(argv[0], std::cerr);
            return kExitFailure;
    }

    ActionLog log(&std::cout);
    log.log("Location Timeline Extractor started");
    {
        std::string cmdline = argv[0];
        for (const auto& a : args)
            cmdline += ' ' + a;
        log.log("Command line arguments: " + cmdline);
    }

    AdbDeviceRepository repo(log);
    return run_extraction(opts, repo, std::cin, std::cout, log);
}
