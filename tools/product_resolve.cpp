#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <libprecise++/resolver.hpp>

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] -s <start> -e <end>\n"
              << "\nOptions:\n"
              << "  -s, --start <datetime>   Window start, YYYY-MM-DD_HH:MM:SS\n"
              << "  -e, --end <datetime>     Window end, YYYY-MM-DD_HH:MM:SS\n"
              << "  -l, --listing <file>     Listing file, one product per line\n"
              << "  -d, --mirror <dir>       Local archive mirror (<dir>/<gps week>/<files>)\n"
              << "  -c, --config <file>      YAML configuration file\n"
              << "  -t, --targets <list>     Required categories [default: CLK,BIA,SP3]\n"
              << "  -a, --center <code>      Print the preferred combination for one center\n"
              << "  -w, --write <file>       Write the fetched listing to a file\n"
              << "  -v, --verbose            Verbose output\n"
              << "  -h, --help               Show this help message\n"
              << "\nExamples:\n"
              << "  " << program_name << " -l CDDIS.list -s 2025-04-06_00:00:00 -e 2025-04-06_00:00:00\n"
              << "  " << program_name << " -d mirror/ -a COD -s 2025-07-05_00:00:00 -e 2025-07-05_23:59:30\n";
}

struct CommandLineArgs {
    std::string start;
    std::string end;
    std::string listing_file;
    std::string mirror_dir;
    std::string config_file;
    std::string targets;
    std::string center;
    std::string write_file;
    bool verbose = false;
};

bool parseArguments(int argc, char* argv[], CommandLineArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return false;
        }
        else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }

        std::string* target = nullptr;
        if (arg == "-s" || arg == "--start") target = &args.start;
        else if (arg == "-e" || arg == "--end") target = &args.end;
        else if (arg == "-l" || arg == "--listing") target = &args.listing_file;
        else if (arg == "-d" || arg == "--mirror") target = &args.mirror_dir;
        else if (arg == "-c" || arg == "--config") target = &args.config_file;
        else if (arg == "-t" || arg == "--targets") target = &args.targets;
        else if (arg == "-a" || arg == "--center") target = &args.center;
        else if (arg == "-w" || arg == "--write") target = &args.write_file;
        else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return false;
        }

        if (++i >= argc) {
            std::cerr << "Error: Missing argument for " << arg << "\n";
            return false;
        }
        *target = argv[i];
    }

    if (args.start.empty() || args.end.empty()) {
        std::cerr << "Error: Window start and end are required\n";
        return false;
    }

    if (args.listing_file.empty() == args.mirror_dir.empty()) {
        std::cerr << "Error: Exactly one of --listing or --mirror is required\n";
        return false;
    }

    return true;
}

std::set<std::string> splitTargets(const std::string& text) {
    std::set<std::string> targets;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        if (!item.empty()) {
            targets.insert(item);
        }
    }
    return targets;
}

int main(int argc, char* argv[]) {
    CommandLineArgs args;

    if (!parseArguments(argc, argv, args)) {
        return 1;
    }

    try {
        libprecise::ProductResolver resolver;

        if (!args.config_file.empty()) {
            std::string error;
            if (!resolver.loadConfig(args.config_file, &error)) {
                std::cerr << "Warning: Could not load config file " << args.config_file
                          << ": " << error << "\n";
            }
        }

        if (!args.targets.empty()) {
            auto config = resolver.getConfig();
            config.required_categories = splitTargets(args.targets);
            if (config.required_categories.empty()) {
                std::cerr << "Error: Empty target category list\n";
                return 1;
            }
            resolver.setConfig(config);
        }

        // Fails fast on a malformed boundary
        const auto window = libprecise::TimeWindow::fromStrings(args.start, args.end);

        if (args.verbose) {
            std::cout << "Window: " << libprecise::time_utils::formatDateTime(window.start)
                      << " -> " << libprecise::time_utils::formatDateTime(window.end) << std::endl;
            std::cout << "Required categories:";
            for (const auto& category : resolver.getConfig().required_categories) {
                std::cout << " " << category;
            }
            std::cout << std::endl;
        }

        libprecise::CoverageResult result;
        if (!args.listing_file.empty()) {
            std::vector<std::string> lines;
            if (!libprecise::io::readListingFile(args.listing_file, lines)) {
                std::cerr << "Error: Could not read listing file " << args.listing_file << "\n";
                return 1;
            }
            result = resolver.resolve(lines, window);
            if (!args.write_file.empty()) {
                std::cerr << "Warning: --write ignored with --listing\n";
            }
        } else {
            libprecise::io::DirectoryListingProvider provider(args.mirror_dir);
            if (args.write_file.empty()) {
                result = resolver.resolve(provider, window);
            } else {
                const auto lines = libprecise::io::fetchListings(provider,
                                                                 libprecise::gpsWeekRange(window),
                                                                 resolver.getConfig().listing_workers);
                if (libprecise::io::writeListingFile(args.write_file, lines)) {
                    std::cout << "Listing written to: " << args.write_file << "\n";
                } else {
                    std::cerr << "Warning: Could not write listing file " << args.write_file << "\n";
                }
                result = resolver.resolve(lines, window);
            }
        }

        const auto stats = resolver.getStats();
        if (args.verbose) {
            std::cout << "\nCatalog:\n";
            std::cout << "  Lines read: " << stats.total_lines << "\n";
            std::cout << "  Records accepted: " << stats.accepted_records << "\n";
            std::cout << "  Lines rejected: " << stats.rejected_lines << "\n";
            std::cout << "  Candidates: " << stats.candidates << "\n";
            std::cout << "  Processing time: " << stats.processing_time_ms << " ms\n";

            for (const auto& candidate : result.candidates) {
                std::cout << "  " << candidate.identity.toString() << ": "
                          << libprecise::outcomeToString(candidate.outcome);
                if (candidate.outcome == libprecise::CandidateOutcome::MISSING_CATEGORY) {
                    std::cout << " at " << libprecise::time_utils::formatDateTime(candidate.failing_epoch)
                              << " (";
                    for (size_t i = 0; i < candidate.missing_categories.size(); ++i) {
                        std::cout << (i ? "," : "") << candidate.missing_categories[i];
                    }
                    std::cout << ")";
                }
                std::cout << "\n";
            }
        }

        if (!result.isCovered()) {
            std::cerr << "Error: " << libprecise::statusToString(result.status)
                      << " - try widening the window\n";
            return 1;
        }

        std::cout << "\nValid products:\n";
        for (const auto& entry : result.valid_products) {
            std::cout << "  " << entry.first << ":";
            for (const auto& combination : entry.second) {
                std::cout << " " << combination.project_type << "/" << combination.solution_type;
            }
            std::cout << "\n";
        }

        if (!args.center.empty()) {
            auto optimal = resolver.selectOptimal(result, args.center);
            if (optimal) {
                std::cout << "Preferred for " << args.center << ": "
                          << optimal->project_type << "/" << optimal->solution_type << "\n";
            } else {
                std::cout << "No preferred combination for " << args.center << "\n";
            }
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
