#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Define an alias for ordered_json type from the nlohmann library
using ordered_json = nlohmann::ordered_json;

// Reconciliation scope of a run
enum class RunMode {
    Full,
    Incremental
};

// How the results of a run are applied
enum class ExecutionMode {
    Normal,
    DryRun,
    AutoApprove
};

// Lifecycle of a reconciliation run
enum class RunStatus {
    Running,
    Completed,
    Failed
};

// Lifecycle of a master key registry record
enum class MasterKeyStatus {
    Proposed,
    Active,
    Deprecated
};

std::string toString(RunMode mode);
std::string toString(ExecutionMode mode);
std::string toString(RunStatus status);
std::string toString(MasterKeyStatus status);

// Parse the persisted spelling of each enumeration, nullopt when unknown
std::optional<RunMode> parseRunMode(const std::string& value);
std::optional<ExecutionMode> parseExecutionMode(const std::string& value);
std::optional<RunStatus> parseRunStatus(const std::string& value);
std::optional<MasterKeyStatus> parseMasterKeyStatus(const std::string& value);
