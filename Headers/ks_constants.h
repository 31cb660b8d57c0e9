#pragma once
#include <algorithm>
#include <array>
#include <string_view>

// Define program metadata constants
constexpr const char* PROGRAM_NAME = "KeySync";
constexpr const char* PROGRAM_VERSION = "V 1.0.0";

// Define default file locations
constexpr const char* DEFAULT_CONFIG_PATH = "keysync-config.json";
constexpr const char* DEFAULT_DATABASE_PATH = "data/keysync.db";
constexpr const char* DEFAULT_LOG_PATH = "keysync.log";
constexpr const char* DEFAULT_INPUT_DIR = "input";

// Define the authoritative system and the dependent systems compared against it
constexpr std::string_view AUTHORITY_SYSTEM = "A";
constexpr std::array<std::string_view, 4> DEPENDENT_SYSTEMS = { "B", "C", "D", "E" };

inline bool isDependentSystem(std::string_view system) {
    return std::find(DEPENDENT_SYSTEMS.begin(), DEPENDENT_SYSTEMS.end(), system) != DEPENDENT_SYSTEMS.end();
}

inline bool isKnownSystem(std::string_view system) {
    return system == AUTHORITY_SYSTEM || isDependentSystem(system);
}

// Define checkpoint stage names
constexpr const char* CHECKPOINT_COMPARISON = "comparison_complete";
constexpr const char* CHECKPOINT_DISCREPANCIES = "discrepancy_analysis_complete";
