#pragma once
#include <optional>
#include <string>

#include "ks_constants.h"
#include "ks_types.h"

// Structure for storing program configuration options
struct ProgramOptions {
    std::string configPath = DEFAULT_CONFIG_PATH;
    std::optional<RunMode> mode;
    bool dryRun = false;
    bool autoApprove = false;
    bool silentMode = false;
    bool verbose = false;
};

// Function to parse command-line arguments, throws std::invalid_argument on unusable input
ProgramOptions parseArguments(int argc, char* argv[]);

// Function to print the command-line help
void printHelp();

// Function to derive the execution mode, dry-run wins over auto-approve from the flag or the configuration
ExecutionMode executionModeOf(const ProgramOptions& options, bool configAutoApprove);
