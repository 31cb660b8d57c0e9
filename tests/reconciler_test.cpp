#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <variant>

#include "database.h"
#include "ks_reconciler.h"
#include "test_helpers.h"

namespace {

bool hasEvent(const std::vector<AuditEvent>& events, const std::string& eventType) {
    return std::any_of(events.begin(), events.end(),
                       [&eventType](const AuditEvent& event) { return event.eventType == eventType; });
}

}

class ReconciliationOrchestratorTest : public ::testing::Test {
protected:
    ReconciliationOrchestratorTest()
        : errorHandler_(fastErrorHandling(), logFile_),
          comparator_(normalizer_, errorHandler_, ProcessingConfig{}, logFile_),
          provisioner_(store_, ProvisioningConfig{}, logFile_),
          orchestrator_(store_, normalizer_, comparator_, provisioner_, errorHandler_,
                        ordered_json{ {"test", true} }, logFile_, true) {}

    std::map<std::string, std::string> writeSystems(const std::map<std::string, std::vector<std::string>>& systems) {
        std::map<std::string, std::string> files;
        for (const auto& [system, keys] : systems) {
            files[system] = dir_.writeKeyFile(system + ".csv", keys).string();
        }
        return files;
    }

    TempDir dir_;
    std::ofstream logFile_;
    StateStore store_{ ":memory:" };
    KeyNormalizer normalizer_;
    ErrorHandler errorHandler_;
    SystemComparator comparator_;
    MasterKeyProvisioner provisioner_;
    ReconciliationOrchestrator orchestrator_;
};

TEST(DiscrepancyTest, ClassifiesComparison) {
    std::map<std::string, NormalizedKeyGroup> systems;
    systems["A"] = { { "K1", { "K1" } }, { "K2", { "K2", "k2" } }, { "K3", { "K3" } } };
    systems["B"] = { { "K1", { "K1" } }, { "K2", { "K2" } }, { "K4", { "k4" } } };
    systems["C"] = { { "K1", { "K1" } }, { "K2", { "K2" } }, { "K3", { "K3" } }, { "K4", { "K_4" } } };

    const auto report = analyzeDiscrepancies(computeComparison(systems));

    ASSERT_EQ(report.outOfAuthority.size(), 1u);
    const auto& sources = report.outOfAuthority.at("K4");
    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[0], std::make_pair(std::string("B"), std::string("k4")));
    EXPECT_EQ(sources[1], std::make_pair(std::string("C"), std::string("K_4")));

    ASSERT_EQ(report.propagationGaps.size(), 1u);
    EXPECT_EQ(report.propagationGaps.at("B"), (KeySet{ "K3" }));

    EXPECT_EQ(report.summary.totalOutOfAuthority, 1u);
    EXPECT_EQ(report.summary.totalPropagationGaps, 1u);
    EXPECT_EQ(report.summary.totalDuplicateGroups, 1u);
    EXPECT_EQ(report.summary.affectedSystems, (std::set<std::string>{ "A", "B" }));

    const auto items = report.items();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<OutOfAuthority>(items[0]));
    EXPECT_EQ(std::get<PropagationGap>(items[1]), (PropagationGap{ "B", "K3" }));
    EXPECT_EQ(std::get<DuplicateGroup>(items[2]).rawKeys.size(), 2u);
}

TEST(IncrementalChangesTest, DiffsAgainstPreviousSnapshot) {
    ComparisonResult current;
    current.allKeys = { "K1", "K2", "K3", "K5" };
    current.keysInAllSystems = { "K1", "K3" };

    const ordered_json previous = {
        {"all_keys", {"K1", "K2", "K3", "K4"}},
        {"keys_in_all_systems", {"K1", "K2", "K4"}}
    };

    const auto changes = calculateIncrementalChanges(current, previous);

    EXPECT_EQ(changes.newKeys, (KeySet{ "K5" }));
    EXPECT_EQ(changes.removedKeys, (KeySet{ "K4" }));
    EXPECT_EQ(changes.newlySynchronized, (KeySet{ "K3" }));
    EXPECT_EQ(changes.newlyDiverged, (KeySet{ "K2" }));
}

TEST_F(ReconciliationOrchestratorTest, FullRunCompletesAndRecordsEverything) {
    const auto files = writeSystems({
        { "A", { "K1", "K2", "K3" } },
        { "B", { "K1", "K2", "k4" } },
        { "C", { "K1", "K2", "K3", " k4" } }
    });

    const auto result = orchestrator_.runReconciliation(RunMode::Full, ExecutionMode::Normal, files);

    EXPECT_EQ(result.comparison.keysMissingInA, (KeySet{ "K4" }));
    EXPECT_EQ(result.discrepancies.summary.totalOutOfAuthority, 1u);
    ASSERT_EQ(result.proposedKeys.size(), 1u);
    EXPECT_EQ(result.proposedKeys[0].masterKey, "K4");
    EXPECT_EQ(result.keysActivated, 0);
    EXPECT_EQ(result.keysTracked, 10u);
    EXPECT_FALSE(result.incrementalChanges.has_value());

    const auto run = store_.getRun(result.runId);
    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->status, RunStatus::Completed);
    EXPECT_EQ(run->stats["provisioning"]["proposed"], 1);
    EXPECT_EQ(run->stats["key_snapshot"]["all_keys"].size(), 4u);
    EXPECT_EQ(run->configSnapshot["system_files"]["A"], files.at("A"));
    EXPECT_TRUE(run->checkpointData.contains("comparison_complete"));
    EXPECT_TRUE(run->checkpointData.contains("discrepancy_analysis_complete"));

    const auto events = store_.getAuditEvents(result.runId);
    EXPECT_EQ(events.front().eventType, "run_started");
    EXPECT_TRUE(hasEvent(events, "master_key_proposed"));
    EXPECT_EQ(events.back().eventType, "reconciliation_complete");

    EXPECT_EQ(store_.getMasterKeys(MasterKeyStatus::Proposed).size(), 1u);
    EXPECT_EQ(store_.getTrackedKeys(std::string("C")).size(), 4u);

    const auto recovery = orchestrator_.recoverRun(result.runId);
    EXPECT_EQ(recovery.stage, "discrepancy_analysis_complete");

    const auto summary = orchestrator_.runSummary();
    EXPECT_EQ(summary["run_id"], result.runId);
    EXPECT_EQ(summary["checkpoints"].size(), 2u);
}

TEST_F(ReconciliationOrchestratorTest, AutoApproveActivatesProposedKeys) {
    const auto files = writeSystems({ { "A", { "K1" } }, { "B", { "K1", "K2" } } });

    const auto result = orchestrator_.runReconciliation(RunMode::Full, ExecutionMode::AutoApprove, files);

    EXPECT_EQ(result.keysActivated, 1);
    EXPECT_EQ(store_.getMasterKeys(MasterKeyStatus::Active).size(), 1u);
    EXPECT_TRUE(hasEvent(store_.getAuditEvents(result.runId), "master_keys_activated"));
}

TEST_F(ReconciliationOrchestratorTest, DryRunLeavesKeysProposed) {
    const auto files = writeSystems({ { "A", { "K1" } }, { "B", { "K1", "K2" } } });

    const auto result = orchestrator_.runReconciliation(RunMode::Full, ExecutionMode::DryRun, files);

    EXPECT_EQ(result.keysActivated, 0);
    EXPECT_EQ(store_.getMasterKeys(MasterKeyStatus::Proposed).size(), 1u);
    EXPECT_EQ(store_.getRun(result.runId)->status, RunStatus::Completed);
}

TEST_F(ReconciliationOrchestratorTest, MissingAuthorityFailsRun) {
    const auto files = writeSystems({ { "B", { "K1" } } });

    EXPECT_THROW(orchestrator_.runReconciliation(RunMode::Full, ExecutionMode::Normal, files), SystemUnavailableError);

    const auto runId = orchestrator_.currentRunId();
    ASSERT_TRUE(runId.has_value());
    const auto run = store_.getRun(*runId);
    EXPECT_EQ(run->status, RunStatus::Failed);
    ASSERT_TRUE(run->errorMessage.has_value());
    EXPECT_NE(run->errorMessage->find("System A"), std::string::npos);

    const auto events = store_.getAuditEvents(*runId);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().eventType, "reconciliation_failed");
    EXPECT_EQ(events.back().result.value_or(""), "failure");
}

TEST_F(ReconciliationOrchestratorTest, IncrementalRunDiffsAgainstLastCompletedRun) {
    const auto firstFiles = writeSystems({ { "A", { "K1", "K2", "K3" } }, { "B", { "K1", "K3" } } });
    const auto first = orchestrator_.runReconciliation(RunMode::Full, ExecutionMode::Normal, firstFiles);

    const auto secondFiles = writeSystems({ { "A", { "K1", "K2", "K5" } }, { "B", { "K1", "K2" } } });
    const auto second = orchestrator_.runReconciliation(RunMode::Incremental, ExecutionMode::Normal, secondFiles);

    ASSERT_TRUE(second.incrementalChanges.has_value());
    const auto& changes = *second.incrementalChanges;
    ASSERT_TRUE(changes.previousRunId.has_value());
    EXPECT_EQ(*changes.previousRunId, first.runId);
    EXPECT_EQ(changes.newKeys, (KeySet{ "K5" }));
    EXPECT_EQ(changes.removedKeys, (KeySet{ "K3" }));
    EXPECT_EQ(changes.newlySynchronized, (KeySet{ "K2" }));
    EXPECT_TRUE(changes.newlyDiverged.empty());

    EXPECT_EQ(store_.getRun(second.runId)->stats["incremental_changes"]["new_keys"], 1);
}

TEST_F(ReconciliationOrchestratorTest, IncrementalRunWithoutHistorySkipsDiff) {
    const auto files = writeSystems({ { "A", { "K1" } }, { "B", { "K1" } } });

    const auto result = orchestrator_.runReconciliation(RunMode::Incremental, ExecutionMode::Normal, files);

    EXPECT_FALSE(result.incrementalChanges.has_value());
    EXPECT_EQ(store_.getRun(result.runId)->status, RunStatus::Completed);
}

// File-backed store so a second connection can install failing audit triggers
class AuditFailureTest : public ::testing::Test {
protected:
    AuditFailureTest()
        : databasePath_((dir_.path() / "state.db").string()),
          store_(databasePath_),
          errorHandler_(fastErrorHandling(), logFile_),
          comparator_(normalizer_, errorHandler_, ProcessingConfig{}, logFile_),
          provisioner_(store_, ProvisioningConfig{}, logFile_),
          orchestrator_(store_, normalizer_, comparator_, provisioner_, errorHandler_,
                        ordered_json::object(), logFile_, true) {}

    void rejectAuditEvent(const std::string& eventType) {
        Database connection(databasePath_);
        connection.execute(
            "CREATE TRIGGER reject_" + eventType + " BEFORE INSERT ON audit_log "
            "WHEN NEW.event_type = '" + eventType + "' "
            "BEGIN SELECT RAISE(ABORT, 'audit log unavailable'); END;");
    }

    std::map<std::string, std::string> twoSystems() {
        return {
            { "A", dir_.writeKeyFile("A.csv", { "K1" }).string() },
            { "B", dir_.writeKeyFile("B.csv", { "K1", "K2" }).string() }
        };
    }

    TempDir dir_;
    std::string databasePath_;
    std::ofstream logFile_;
    StateStore store_;
    KeyNormalizer normalizer_;
    ErrorHandler errorHandler_;
    SystemComparator comparator_;
    MasterKeyProvisioner provisioner_;
    ReconciliationOrchestrator orchestrator_;
};

TEST_F(AuditFailureTest, StartEventFailureMarksRunFailed) {
    rejectAuditEvent("run_started");

    EXPECT_THROW(orchestrator_.runReconciliation(RunMode::Full, ExecutionMode::Normal, twoSystems()), std::runtime_error);

    const auto runId = orchestrator_.currentRunId();
    ASSERT_TRUE(runId.has_value());
    const auto run = store_.getRun(*runId);
    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->status, RunStatus::Failed);

    const auto events = store_.getAuditEvents(*runId);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].eventType, "reconciliation_failed");
}

TEST_F(AuditFailureTest, CompletionEventIsWrittenOnlyAfterRunCompletes) {
    rejectAuditEvent("reconciliation_complete");

    const auto result = orchestrator_.runReconciliation(RunMode::Full, ExecutionMode::Normal, twoSystems());

    EXPECT_EQ(store_.getRun(result.runId)->status, RunStatus::Completed);
    const auto events = store_.getAuditEvents(result.runId);
    EXPECT_FALSE(hasEvent(events, "reconciliation_complete"));
    EXPECT_FALSE(hasEvent(events, "reconciliation_failed"));
    EXPECT_EQ(events.front().eventType, "run_started");
}
