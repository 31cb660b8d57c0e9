#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "database.h"
#include "ks_types.h"

using RunId = std::int64_t;

struct RunRecord {
    RunId runId = 0;
    std::string runTimestamp;
    RunMode mode = RunMode::Full;
    ExecutionMode executionMode = ExecutionMode::Normal;
    RunStatus status = RunStatus::Running;
    ordered_json configSnapshot;
    ordered_json stats;
    std::optional<std::string> errorMessage;
    ordered_json checkpointData;
    std::optional<std::string> completedAt;
};

struct MasterKeyRecord {
    std::int64_t masterKeyId = 0;
    std::string masterKey;
    std::string normalizedKey;
    std::string sourceSystem;
    std::string sourceKey;
    MasterKeyStatus status = MasterKeyStatus::Proposed;
    std::string strategy;
    std::optional<RunId> runId;
    std::string createdAt;
    std::optional<std::string> activatedAt;
    std::optional<std::string> deprecatedAt;
};

// Raw key observed in a system during a run
struct TrackedKey {
    std::string system;
    std::string keyValue;
    std::string normalizedKey;
};

struct KeyTrackingEntry {
    std::string system;
    std::string keyValue;
    std::string normalizedKey;
    std::string firstSeenAt;
    std::string lastSeenAt;
    std::optional<RunId> runId;
};

struct AuditEvent {
    std::int64_t auditId = 0;
    std::optional<RunId> runId;
    std::string timestamp;
    std::string eventType;
    std::string details;
    std::optional<std::string> system;
    std::optional<std::string> key;
    std::optional<std::string> action;
    std::optional<std::string> result;
};

// Persistent registry of runs, master keys, key tracking and audit events.
// One connection per process; every mutating call commits before returning.
class StateStore {
public:
    explicit StateStore(const std::string& databasePath);

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // Insert a run in the running state
    RunId startRun(RunMode mode, ExecutionMode executionMode, const ordered_json& configSnapshot);

    // Move a running run to completed, or to failed when an error is given.
    // Throws std::runtime_error when the run is unknown or already finished.
    void completeRun(RunId runId, const ordered_json& stats, const std::optional<std::string>& errorMessage = std::nullopt);

    void saveCheckpoint(RunId runId, const ordered_json& checkpointData);

    // Insert the key or refresh last_seen_at and run_id on (system, normalized_key) conflict
    void trackKey(RunId runId, const TrackedKey& key);

    // Same as trackKey for many keys inside one transaction, returns the number of keys written
    std::size_t trackKeys(RunId runId, const std::vector<TrackedKey>& keys);

    std::int64_t logEvent(const AuditEvent& event);
    std::int64_t logEvent(RunId runId, const std::string& eventType, const std::string& details,
                          const std::optional<std::string>& result = std::nullopt);

    // Insert a proposed master key, throws std::runtime_error on constraint violations
    std::int64_t proposeMasterKey(RunId runId, const std::string& masterKey, const std::string& normalizedKey,
                                  const std::string& sourceSystem, const std::string& sourceKey,
                                  const std::string& strategy);

    // Activate every proposed key of a run, returns the number of keys activated
    int activateMasterKeys(RunId runId);

    std::vector<MasterKeyRecord> getMasterKeys(std::optional<MasterKeyStatus> status = std::nullopt) const;
    std::optional<RunRecord> getLastSuccessfulRun() const;
    std::optional<RunRecord> getRun(RunId runId) const;
    std::vector<AuditEvent> getAuditEvents(RunId runId) const;
    std::vector<KeyTrackingEntry> getTrackedKeys(const std::optional<std::string>& system = std::nullopt) const;

    const std::string& path() const { return db_.path(); }

private:
    void initSchema();
    std::optional<RunRecord> fetchRun(const std::string& sql, std::optional<RunId> runId) const;

    Database db_;
    mutable std::mutex mutex_;
};
