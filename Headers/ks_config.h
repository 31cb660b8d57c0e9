#pragma once
#include <cstddef>
#include <fstream>
#include <map>
#include <optional>
#include <string>

#include "ks_types.h"

// Action taken when a system's key file does not exist
enum class MissingFilePolicy {
    Skip,   // treat the system as an empty key list
    Fail    // abort the comparison
};

// Action taken when a row of a key file cannot be used
enum class CorruptDataPolicy {
    Log,    // warn and continue
    Skip,   // continue silently
    Fail    // abort the comparison
};

// Key normalization rules, applied in declaration order
struct NormalizeConfig {
    bool trimWhitespace = true;
    bool uppercase = true;
    std::optional<char> collapseDelims = '-';   // nullopt disables collapsing
    bool stripNonAlnum = true;
    std::optional<bool> leftPadNumbers;         // padding only when explicitly set to true
    int padLength = 6;
};

struct ProvisioningConfig {
    std::string strategy = "mirror";            // mirror | namespaced
    bool autoApprove = false;
    std::string namespacePrefix = "MASTER";
};

struct ProcessingConfig {
    RunMode mode = RunMode::Full;
    std::size_t batchSize = 1000;
    bool parallel = true;
    std::size_t maxWorkers = 5;
};

struct ErrorHandlingConfig {
    MissingFilePolicy onMissingFile = MissingFilePolicy::Skip;
    CorruptDataPolicy onCorruptData = CorruptDataPolicy::Log;
    int retryAttempts = 3;
    double retryDelaySeconds = 5.0;
    std::size_t maxErrorsBeforeFail = 100;
    bool enablePartialProcessing = true;
};

// Structure for storing the complete application configuration
struct AppConfig {
    NormalizeConfig normalize;
    ProvisioningConfig provisioning;
    ProcessingConfig processing;
    ErrorHandlingConfig errorHandling;
    std::map<std::string, std::string> sources;   // system name -> key file path
    std::string databasePath;
    std::string logFile;
    bool verbose = false;
};

// Function to build the configuration used when no file is supplied
AppConfig defaultAppConfig();

// Function to load configuration from a JSON file, falling back to defaults on any problem
AppConfig loadConfig(const std::string& configPath, std::ofstream& logFile);

// Function to parse configuration from an already decoded JSON document
AppConfig parseConfig(const ordered_json& document, std::ofstream& logFile);

// Function to serialize the configuration for run snapshots
ordered_json configToJson(const AppConfig& config);

std::string toString(MissingFilePolicy policy);
std::string toString(CorruptDataPolicy policy);
std::optional<MissingFilePolicy> parseMissingFilePolicy(const std::string& value);
std::optional<CorruptDataPolicy> parseCorruptDataPolicy(const std::string& value);
