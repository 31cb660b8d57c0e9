#include "ks_types.h"

std::string toString(RunMode mode) {
    return mode == RunMode::Incremental ? "incremental" : "full";
}

std::string toString(ExecutionMode mode) {
    switch (mode) {
    case ExecutionMode::DryRun:      return "dry-run";
    case ExecutionMode::AutoApprove: return "auto-approve";
    default:                         return "normal";
    }
}

std::string toString(RunStatus status) {
    switch (status) {
    case RunStatus::Completed: return "completed";
    case RunStatus::Failed:    return "failed";
    default:                   return "running";
    }
}

std::string toString(MasterKeyStatus status) {
    switch (status) {
    case MasterKeyStatus::Active:     return "active";
    case MasterKeyStatus::Deprecated: return "deprecated";
    default:                          return "proposed";
    }
}

std::optional<RunMode> parseRunMode(const std::string& value) {
    if (value == "full") return RunMode::Full;
    if (value == "incremental") return RunMode::Incremental;
    return std::nullopt;
}

std::optional<ExecutionMode> parseExecutionMode(const std::string& value) {
    if (value == "normal") return ExecutionMode::Normal;
    if (value == "dry-run") return ExecutionMode::DryRun;
    if (value == "auto-approve") return ExecutionMode::AutoApprove;
    return std::nullopt;
}

std::optional<RunStatus> parseRunStatus(const std::string& value) {
    if (value == "running") return RunStatus::Running;
    if (value == "completed") return RunStatus::Completed;
    if (value == "failed") return RunStatus::Failed;
    return std::nullopt;
}

std::optional<MasterKeyStatus> parseMasterKeyStatus(const std::string& value) {
    if (value == "proposed") return MasterKeyStatus::Proposed;
    if (value == "active") return MasterKeyStatus::Active;
    if (value == "deprecated") return MasterKeyStatus::Deprecated;
    return std::nullopt;
}
