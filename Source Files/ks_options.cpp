#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "ks_options.h"

// Function to parse command-line arguments
ProgramOptions parseArguments(int argc, char* argv[]) {
    ProgramOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string argLower = arg;
        std::transform(argLower.begin(), argLower.end(), argLower.begin(), ::tolower);

        if (argLower == "--config" || argLower == "-c") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("option " + arg + " requires a file path");
            }
            options.configPath = argv[++i];
        }
        else if (argLower == "--mode" || argLower == "-m") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("option " + arg + " requires 'full' or 'incremental'");
            }
            std::string value = argv[++i];
            std::transform(value.begin(), value.end(), value.begin(), ::tolower);
            options.mode = parseRunMode(value);
            if (!options.mode) {
                throw std::invalid_argument("unknown run mode '" + value + "'");
            }
        }
        else if (argLower == "--dry-run") {
            options.dryRun = true;
        }
        else if (argLower == "--auto-approve") {
            options.autoApprove = true;
        }
        else if (argLower == "--silent" || argLower == "-s") {
            options.silentMode = true;
        }
        else if (argLower == "--verbose" || argLower == "-v") {
            options.verbose = true;
        }
        else if (argLower == "--help" || argLower == "-h") {
            printHelp();
            std::exit(EXIT_SUCCESS);
        }
        else {
            throw std::invalid_argument("unknown argument '" + arg + "'");
        }
    }

    return options;
}

// Function to print the command-line help
void printHelp() {
    std::cout << "==============\n"
        << "KeySync - Help\n"
        << "==============\n\n"
        << "Usage:\n"
        << "  keysync [OPTIONS]\n\n"
        << "Options:\n"
        << "  -c, --config PATH     Configuration file (default: " << DEFAULT_CONFIG_PATH << ")\n"
        << "  -m, --mode MODE       Reconciliation mode: full or incremental\n"
        << "      --dry-run         Run every step without activating keys or printing reports\n"
        << "      --auto-approve    Activate proposed master keys at the end of the run\n"
        << "  -s, --silent          Suppress non-critical messages\n"
        << "  -v, --verbose         List every discrepancy and proposed key\n"
        << "  -h, --help            Show this help message\n\n"
        << "Exit status is non-zero when the run fails.\n";
}

// Function to derive the execution mode from the flags
ExecutionMode executionModeOf(const ProgramOptions& options, bool configAutoApprove) {
    if (options.dryRun) return ExecutionMode::DryRun;
    if (options.autoApprove || configAutoApprove) return ExecutionMode::AutoApprove;
    return ExecutionMode::Normal;
}
