#pragma once
#include <cstddef>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ks_comparator.h"
#include "ks_discrepancies.h"
#include "ks_error_handler.h"
#include "ks_normalizer.h"
#include "ks_provisioner.h"
#include "ks_state_store.h"

// Key-level differences between a run and the last completed run
struct IncrementalChanges {
    std::optional<RunId> previousRunId;
    KeySet newKeys;
    KeySet removedKeys;
    KeySet newlySynchronized;
    KeySet newlyDiverged;
};

// Everything a reconciliation run produced
struct ReconciliationResult {
    RunId runId = 0;
    RunMode mode = RunMode::Full;
    ExecutionMode executionMode = ExecutionMode::Normal;
    ComparisonResult comparison;
    DiscrepancyReport discrepancies;
    std::vector<ProposedMasterKey> proposedKeys;
    int keysActivated = 0;
    std::size_t keysTracked = 0;
    std::optional<IncrementalChanges> incrementalChanges;
    ordered_json stats;
};

// Function to store the key sets an incremental run is compared against
ordered_json buildKeySnapshot(const ComparisonResult& comparison);

// Function to diff a comparison against the key snapshot of a previous run.
// Keys that are new or removed are not counted as newly synchronized or diverged.
IncrementalChanges calculateIncrementalChanges(const ComparisonResult& current, const ordered_json& previousSnapshot);

// Function to serialize incremental changes
ordered_json incrementalChangesToJson(const IncrementalChanges& changes);

// Sequences one reconciliation run through the store, comparator and provisioner
class ReconciliationOrchestrator {
public:
    ReconciliationOrchestrator(StateStore& store, const KeyNormalizer& normalizer, SystemComparator& comparator,
                               MasterKeyProvisioner& provisioner, ErrorHandler& errorHandler,
                               const ordered_json& configSnapshot, std::ofstream& logFile, bool silentMode = false);

    // Run a full reconciliation; a failed run is marked failed in the store and the error rethrown
    ReconciliationResult runReconciliation(RunMode mode, ExecutionMode executionMode,
                                           const std::map<std::string, std::string>& systemFiles);

    // Latest valid checkpoint stage of a stored run
    CheckpointRecovery recoverRun(RunId runId) const;

    // Run id, component statistics and checkpoint stages of the current run
    ordered_json runSummary() const;

    std::optional<RunId> currentRunId() const { return runId_; }

private:
    RunId startRun(RunMode mode, ExecutionMode executionMode, const std::map<std::string, std::string>& systemFiles);
    void performSteps(ReconciliationResult& result, const std::map<std::string, std::string>& systemFiles);
    void saveCheckpoint(const std::string& stage, const std::string& dataType, std::size_t dataSize);
    std::size_t trackKeys(const ComparisonResult& comparison);
    void provisionKeys(ReconciliationResult& result);
    void diffAgainstLastRun(ReconciliationResult& result);
    ordered_json buildRunStats(const ReconciliationResult& result) const;
    void markFailed(const std::string& errorMessage);

    StateStore& store_;
    const KeyNormalizer& normalizer_;
    SystemComparator& comparator_;
    MasterKeyProvisioner& provisioner_;
    ErrorHandler& errorHandler_;
    ordered_json configSnapshot_;
    std::ofstream& logFile_;
    bool silentMode_;

    std::optional<RunId> runId_;
    ordered_json checkpointData_ = ordered_json::object();
};
