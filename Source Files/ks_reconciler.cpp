#include <algorithm>
#include <iterator>
#include <stdexcept>

#include "ks_constants.h"
#include "ks_logger.h"
#include "ks_reconciler.h"

namespace {

    KeySet keySetFrom(const ordered_json& node) {
        KeySet keys;
        if (!node.is_array()) return keys;
        for (const auto& item : node) {
            if (item.is_string()) keys.insert(item.get<std::string>());
        }
        return keys;
    }

    KeySet difference(const KeySet& left, const KeySet& right) {
        KeySet result;
        std::set_difference(left.begin(), left.end(), right.begin(), right.end(), std::inserter(result, result.end()));
        return result;
    }

    KeySet intersection(const KeySet& left, const KeySet& right) {
        KeySet result;
        std::set_intersection(left.begin(), left.end(), right.begin(), right.end(), std::inserter(result, result.end()));
        return result;
    }
}

// Function to store the key sets an incremental run is compared against
ordered_json buildKeySnapshot(const ComparisonResult& comparison) {
    return {
        {"all_keys", comparison.allKeys},
        {"keys_in_all_systems", comparison.keysInAllSystems}
    };
}

// Function to diff a comparison against the key snapshot of a previous run
IncrementalChanges calculateIncrementalChanges(const ComparisonResult& current, const ordered_json& previousSnapshot) {
    IncrementalChanges changes;
    if (!previousSnapshot.is_object()) return changes;

    const KeySet previousAll = keySetFrom(previousSnapshot.value("all_keys", ordered_json::array()));
    const KeySet previousSynchronized = keySetFrom(previousSnapshot.value("keys_in_all_systems", ordered_json::array()));

    changes.newKeys = difference(current.allKeys, previousAll);
    changes.removedKeys = difference(previousAll, current.allKeys);
    changes.newlySynchronized = intersection(difference(current.keysInAllSystems, previousSynchronized), previousAll);
    changes.newlyDiverged = intersection(difference(previousSynchronized, current.keysInAllSystems), current.allKeys);
    return changes;
}

// Function to serialize incremental changes
ordered_json incrementalChangesToJson(const IncrementalChanges& changes) {
    ordered_json json = {
        {"previous_run_id", nullptr},
        {"new_keys", changes.newKeys.size()},
        {"removed_keys", changes.removedKeys.size()},
        {"newly_synchronized", changes.newlySynchronized.size()},
        {"newly_diverged", changes.newlyDiverged.size()}
    };
    if (changes.previousRunId) json["previous_run_id"] = *changes.previousRunId;
    return json;
}

ReconciliationOrchestrator::ReconciliationOrchestrator(StateStore& store, const KeyNormalizer& normalizer,
                                                       SystemComparator& comparator, MasterKeyProvisioner& provisioner,
                                                       ErrorHandler& errorHandler, const ordered_json& configSnapshot,
                                                       std::ofstream& logFile, bool silentMode)
    : store_(store), normalizer_(normalizer), comparator_(comparator), provisioner_(provisioner),
      errorHandler_(errorHandler), configSnapshot_(configSnapshot), logFile_(logFile), silentMode_(silentMode) {
}

ReconciliationResult ReconciliationOrchestrator::runReconciliation(RunMode mode, ExecutionMode executionMode,
                                                                   const std::map<std::string, std::string>& systemFiles) {
    ReconciliationResult result;
    result.runId = startRun(mode, executionMode, systemFiles);
    result.mode = mode;
    result.executionMode = executionMode;

    // From here on any failure marks the run failed
    try {
        store_.logEvent(result.runId, "run_started",
                        "Reconciliation started in " + toString(mode) + " mode with " + toString(executionMode) + " execution");
        performSteps(result, systemFiles);

        result.stats = buildRunStats(result);
        store_.completeRun(result.runId, result.stats);
    }
    catch (const std::exception& e) {
        logMessage("ERROR - reconciliation run " + std::to_string(result.runId) + " failed: " + e.what(), logFile_);
        markFailed(e.what());
        throw;
    }

    // The run is already completed, a lost audit entry does not fail it
    try {
        store_.logEvent(result.runId, "reconciliation_complete",
                        "Reconciliation completed: " + std::to_string(result.discrepancies.summary.totalOutOfAuthority) +
                        " out-of-authority keys, " + std::to_string(result.proposedKeys.size()) + " master keys proposed",
                        std::string("success"));
    }
    catch (const std::exception& e) {
        logMessage("ERROR - could not record completion of run " + std::to_string(result.runId) + ": " + e.what(), logFile_);
    }

    if (!silentMode_) {
        logMessage("Reconciliation run " + std::to_string(result.runId) + " completed", logFile_);
    }
    return result;
}

RunId ReconciliationOrchestrator::startRun(RunMode mode, ExecutionMode executionMode,
                                           const std::map<std::string, std::string>& systemFiles) {
    ordered_json snapshot = configSnapshot_;
    snapshot["system_files"] = systemFiles;

    const RunId runId = store_.startRun(mode, executionMode, snapshot);
    runId_ = runId;
    checkpointData_ = ordered_json::object();

    if (!silentMode_) {
        logMessage("Started reconciliation run " + std::to_string(runId) + " (" + toString(mode) + ", " +
                   toString(executionMode) + ")", logFile_);
    }
    return runId;
}

void ReconciliationOrchestrator::performSteps(ReconciliationResult& result,
                                              const std::map<std::string, std::string>& systemFiles) {
    // Compare every system against the authority
    result.comparison = comparator_.compareAll(systemFiles);
    if (!result.comparison.hasAuthority) {
        throw SystemUnavailableError("System " + std::string(AUTHORITY_SYSTEM) + " data not found - cannot perform comparison");
    }
    saveCheckpoint(CHECKPOINT_COMPARISON, "ComparisonResult", result.comparison.allKeys.size());

    // Classify discrepancies
    result.discrepancies = analyzeDiscrepancies(result.comparison);
    const auto& summary = result.discrepancies.summary;
    if (!silentMode_) {
        logMessage("Discrepancies: " + std::to_string(summary.totalOutOfAuthority) + " out of authority, " +
                   std::to_string(summary.totalPropagationGaps) + " propagation gaps, " +
                   std::to_string(summary.totalDuplicateGroups) + " duplicate groups", logFile_);
    }
    saveCheckpoint(CHECKPOINT_DISCREPANCIES, "DiscrepancyReport",
                   summary.totalOutOfAuthority + summary.totalPropagationGaps + summary.totalDuplicateGroups);

    result.keysTracked = trackKeys(result.comparison);

    if (!result.discrepancies.outOfAuthority.empty()) {
        provisionKeys(result);
    }

    if (result.mode == RunMode::Incremental) {
        diffAgainstLastRun(result);
    }
}

void ReconciliationOrchestrator::saveCheckpoint(const std::string& stage, const std::string& dataType, std::size_t dataSize) {
    checkpointData_[stage] = {
        {"timestamp", currentTimestamp()},
        {"data_summary", {{"type", dataType}, {"size", dataSize}}}
    };
    store_.saveCheckpoint(*runId_, checkpointData_);
}

std::size_t ReconciliationOrchestrator::trackKeys(const ComparisonResult& comparison) {
    std::vector<TrackedKey> keys;
    for (const auto& [system, groups] : comparison.systemKeys) {
        for (const auto& [normalizedKey, rawKeys] : groups) {
            for (const auto& rawKey : rawKeys) {
                keys.push_back(TrackedKey{ system, rawKey, normalizedKey });
            }
        }
    }

    const std::size_t tracked = store_.trackKeys(*runId_, keys);
    store_.logEvent(*runId_, "keys_tracked", "Tracked " + std::to_string(tracked) + " keys across " +
                    std::to_string(comparison.systemKeys.size()) + " systems");
    return tracked;
}

void ReconciliationOrchestrator::provisionKeys(ReconciliationResult& result) {
    result.proposedKeys = provisioner_.propose(result.runId, result.discrepancies.outOfAuthority);

    for (const auto& key : result.proposedKeys) {
        AuditEvent event;
        event.runId = result.runId;
        event.eventType = "master_key_proposed";
        event.details = "Proposed master key '" + key.masterKey + "' for normalized key '" + key.normalizedKey + "'";
        event.system = key.sourceSystem;
        event.key = key.sourceKey;
        event.action = "propose";
        event.result = toString(MasterKeyStatus::Proposed);
        store_.logEvent(event);
    }

    if (result.executionMode == ExecutionMode::AutoApprove) {
        result.keysActivated = provisioner_.activate(result.runId, true);
        store_.logEvent(result.runId, "master_keys_activated",
                        "Activated " + std::to_string(result.keysActivated) + " master keys", std::string("success"));
    }
}

void ReconciliationOrchestrator::diffAgainstLastRun(ReconciliationResult& result) {
    const auto previousRun = store_.getLastSuccessfulRun();
    if (!previousRun) {
        logMessage("No previous completed run, incremental comparison skipped", logFile_);
        return;
    }

    const ordered_json& previousStats = previousRun->stats;
    const ordered_json previousSnapshot = previousStats.is_object() ? previousStats.value("key_snapshot", ordered_json()) : ordered_json();

    IncrementalChanges changes = calculateIncrementalChanges(result.comparison, previousSnapshot);
    changes.previousRunId = previousRun->runId;

    store_.logEvent(result.runId, "incremental_changes",
                    "Compared against run " + std::to_string(previousRun->runId) + ": " +
                    std::to_string(changes.newKeys.size()) + " new keys, " +
                    std::to_string(changes.removedKeys.size()) + " removed keys");
    result.incrementalChanges = std::move(changes);
}

ordered_json ReconciliationOrchestrator::buildRunStats(const ReconciliationResult& result) const {
    ordered_json stats = {
        {"comparison", comparisonStatisticsToJson(result.comparison.statistics)},
        {"discrepancies", discrepancySummaryToJson(result.discrepancies.summary)},
        {"provisioning", {
            {"proposed", result.proposedKeys.size()},
            {"activated", result.keysActivated}
        }},
        {"keys_tracked", result.keysTracked},
        {"normalization", {{"total_normalized", normalizer_.totalNormalized()}}},
        {"errors", errorHandler_.errorSummary()},
        {"incremental_changes", nullptr},
        {"key_snapshot", buildKeySnapshot(result.comparison)}
    };
    if (result.incrementalChanges) {
        stats["incremental_changes"] = incrementalChangesToJson(*result.incrementalChanges);
    }
    return stats;
}

void ReconciliationOrchestrator::markFailed(const std::string& errorMessage) {
    try {
        store_.completeRun(*runId_, ordered_json{ {"errors", errorHandler_.errorSummary()} }, errorMessage);
    }
    catch (const std::exception& e) {
        logMessage("ERROR - could not mark run " + std::to_string(*runId_) + " as failed: " + e.what(), logFile_);
    }

    try {
        store_.logEvent(*runId_, "reconciliation_failed", "Reconciliation failed: " + errorMessage, std::string("failure"));
    }
    catch (const std::exception& e) {
        logMessage("ERROR - could not record failure of run " + std::to_string(*runId_) + ": " + e.what(), logFile_);
    }
}

CheckpointRecovery ReconciliationOrchestrator::recoverRun(RunId runId) const {
    const auto run = store_.getRun(runId);
    if (!run) {
        throw CheckpointRecoveryError("Run " + std::to_string(runId) + " not found");
    }
    return errorHandler_.recoverFromCheckpoint(run->checkpointData);
}

ordered_json ReconciliationOrchestrator::runSummary() const {
    ordered_json checkpoints = ordered_json::array();
    for (const auto& item : checkpointData_.items()) {
        checkpoints.push_back(item.key());
    }

    ordered_json summary = {
        {"run_id", nullptr},
        {"checkpoints", checkpoints},
        {"normalizer", normalizer_.statistics()},
        {"provisioning", provisioner_.statisticsToJson()},
        {"errors", errorHandler_.errorSummary()}
    };
    if (runId_) summary["run_id"] = *runId_;
    return summary;
}
