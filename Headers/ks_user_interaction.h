#pragma once
#include <fstream>
#include <map>
#include <string>

#include "ks_config.h"
#include "ks_options.h"
#include "ks_reconciler.h"

// Function to build the system -> key file map from the configured sources
std::map<std::string, std::string> resolveSystemFiles(const AppConfig& config, const ProgramOptions& options, std::ofstream& logFile);

// Function to print the console summary of a finished run
void printRunReport(const ReconciliationResult& result, const ProgramOptions& options, std::ofstream& logFile);
