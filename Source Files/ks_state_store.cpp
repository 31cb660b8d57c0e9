#include <stdexcept>

#include "ks_state_store.h"

namespace {

constexpr const char* kCreateRunsTable =
    "CREATE TABLE IF NOT EXISTS reconciliation_runs ("
    "    run_id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    run_timestamp TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP,"
    "    run_mode TEXT NOT NULL CHECK(run_mode IN ('full', 'incremental')),"
    "    execution_mode TEXT NOT NULL CHECK(execution_mode IN ('normal', 'dry-run', 'auto-approve')),"
    "    status TEXT NOT NULL CHECK(status IN ('running', 'completed', 'failed')),"
    "    config_snapshot TEXT,"
    "    stats_json TEXT,"
    "    error_message TEXT,"
    "    checkpoint_data TEXT,"
    "    completed_at TIMESTAMP"
    ");";

constexpr const char* kCreateRegistryTable =
    "CREATE TABLE IF NOT EXISTS master_key_registry ("
    "    master_key_id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    master_key TEXT NOT NULL UNIQUE,"
    "    normalized_key TEXT NOT NULL,"
    "    source_system TEXT NOT NULL,"
    "    source_key TEXT NOT NULL,"
    "    status TEXT NOT NULL CHECK(status IN ('proposed', 'active', 'deprecated')),"
    "    provisioning_strategy TEXT NOT NULL,"
    "    created_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP,"
    "    activated_at TIMESTAMP,"
    "    deprecated_at TIMESTAMP,"
    "    run_id INTEGER REFERENCES reconciliation_runs(run_id)"
    ");";

constexpr const char* kCreateTrackingTable =
    "CREATE TABLE IF NOT EXISTS key_tracking ("
    "    tracking_id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    system_name TEXT NOT NULL,"
    "    key_value TEXT NOT NULL,"
    "    normalized_key TEXT NOT NULL,"
    "    first_seen_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP,"
    "    last_seen_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP,"
    "    run_id INTEGER REFERENCES reconciliation_runs(run_id),"
    "    UNIQUE(system_name, normalized_key)"
    ");";

constexpr const char* kCreateAuditTable =
    "CREATE TABLE IF NOT EXISTS audit_log ("
    "    audit_id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    timestamp TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP,"
    "    run_id INTEGER REFERENCES reconciliation_runs(run_id),"
    "    event_type TEXT NOT NULL,"
    "    event_details TEXT,"
    "    system_name TEXT,"
    "    key_value TEXT,"
    "    action_taken TEXT,"
    "    result TEXT"
    ");";

constexpr const char* kCreateIndexes =
    "CREATE INDEX IF NOT EXISTS idx_runs_timestamp ON reconciliation_runs(run_timestamp DESC);"
    "CREATE INDEX IF NOT EXISTS idx_master_key_status ON master_key_registry(status, created_at DESC);"
    "CREATE INDEX IF NOT EXISTS idx_key_tracking_lookup ON key_tracking(system_name, normalized_key);"
    "CREATE INDEX IF NOT EXISTS idx_audit_log_run ON audit_log(run_id, timestamp DESC);";

constexpr const char* kRunColumns =
    "SELECT run_id, run_timestamp, run_mode, execution_mode, status, config_snapshot, stats_json,"
    " error_message, checkpoint_data, completed_at FROM reconciliation_runs ";

void bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.length()), SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) bindText(stmt, index, *value);
    else sqlite3_bind_null(stmt, index);
}

void bindOptionalId(sqlite3_stmt* stmt, int index, const std::optional<RunId>& value) {
    if (value) sqlite3_bind_int64(stmt, index, *value);
    else sqlite3_bind_null(stmt, index);
}

std::string columnText(sqlite3_stmt* stmt, int index) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
    return text ? std::string(text) : std::string();
}

std::optional<std::string> columnOptionalText(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) return std::nullopt;
    return columnText(stmt, index);
}

std::optional<RunId> columnOptionalId(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(stmt, index);
}

// Stored JSON that no longer parses is returned as null
ordered_json columnJson(sqlite3_stmt* stmt, int index) {
    const auto text = columnOptionalText(stmt, index);
    if (!text) return nullptr;
    ordered_json value = ordered_json::parse(*text, nullptr, false);
    return value.is_discarded() ? ordered_json(nullptr) : value;
}

RunRecord readRun(sqlite3_stmt* stmt) {
    RunRecord run;
    run.runId = sqlite3_column_int64(stmt, 0);
    run.runTimestamp = columnText(stmt, 1);
    run.mode = parseRunMode(columnText(stmt, 2)).value_or(RunMode::Full);
    run.executionMode = parseExecutionMode(columnText(stmt, 3)).value_or(ExecutionMode::Normal);
    run.status = parseRunStatus(columnText(stmt, 4)).value_or(RunStatus::Running);
    run.configSnapshot = columnJson(stmt, 5);
    run.stats = columnJson(stmt, 6);
    run.errorMessage = columnOptionalText(stmt, 7);
    run.checkpointData = columnJson(stmt, 8);
    run.completedAt = columnOptionalText(stmt, 9);
    return run;
}

}

StateStore::StateStore(const std::string& databasePath) : db_(databasePath) {
    initSchema();
}

void StateStore::initSchema() {
    std::lock_guard<std::mutex> lock(mutex_);
    db_.execute("BEGIN;");
    try {
        db_.execute(kCreateRunsTable);
        db_.execute(kCreateRegistryTable);
        db_.execute(kCreateTrackingTable);
        db_.execute(kCreateAuditTable);
        db_.execute(kCreateIndexes);
        db_.execute("COMMIT;");
    }
    catch (const std::exception&) {
        db_.execute("ROLLBACK;");
        throw;
    }
}

RunId StateStore::startRun(RunMode mode, ExecutionMode executionMode, const ordered_json& configSnapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(
        "INSERT INTO reconciliation_runs (run_mode, execution_mode, status, config_snapshot) "
        "VALUES (?, ?, 'running', ?);");
    bindText(stmt.get(), 1, toString(mode));
    bindText(stmt.get(), 2, toString(executionMode));
    bindText(stmt.get(), 3, configSnapshot.dump());
    db_.stepDone(stmt.get());
    return db_.lastInsertId();
}

void StateStore::completeRun(RunId runId, const ordered_json& stats, const std::optional<std::string>& errorMessage) {
    std::lock_guard<std::mutex> lock(mutex_);
    const RunStatus status = errorMessage ? RunStatus::Failed : RunStatus::Completed;

    auto stmt = db_.prepare(
        "UPDATE reconciliation_runs "
        "SET status = ?, stats_json = ?, error_message = ?, completed_at = CURRENT_TIMESTAMP "
        "WHERE run_id = ? AND status = 'running';");
    bindText(stmt.get(), 1, toString(status));
    bindText(stmt.get(), 2, stats.dump());
    bindOptionalText(stmt.get(), 3, errorMessage);
    sqlite3_bind_int64(stmt.get(), 4, runId);
    db_.stepDone(stmt.get());

    if (db_.changes() == 0) {
        throw std::runtime_error("Run " + std::to_string(runId) + " is unknown or no longer running");
    }
}

void StateStore::saveCheckpoint(RunId runId, const ordered_json& checkpointData) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("UPDATE reconciliation_runs SET checkpoint_data = ? WHERE run_id = ?;");
    bindText(stmt.get(), 1, checkpointData.dump());
    sqlite3_bind_int64(stmt.get(), 2, runId);
    db_.stepDone(stmt.get());
}

void StateStore::trackKey(RunId runId, const TrackedKey& key) {
    trackKeys(runId, { key });
}

std::size_t StateStore::trackKeys(RunId runId, const std::vector<TrackedKey>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (keys.empty()) return 0;

    db_.execute("BEGIN;");
    try {
        auto stmt = db_.prepare(
            "INSERT INTO key_tracking (system_name, key_value, normalized_key, run_id) VALUES (?, ?, ?, ?) "
            "ON CONFLICT(system_name, normalized_key) "
            "DO UPDATE SET last_seen_at = CURRENT_TIMESTAMP, run_id = excluded.run_id;");

        for (const auto& key : keys) {
            sqlite3_reset(stmt.get());
            sqlite3_clear_bindings(stmt.get());
            bindText(stmt.get(), 1, key.system);
            bindText(stmt.get(), 2, key.keyValue);
            bindText(stmt.get(), 3, key.normalizedKey);
            sqlite3_bind_int64(stmt.get(), 4, runId);
            db_.stepDone(stmt.get());
        }

        db_.execute("COMMIT;");
    }
    catch (const std::exception&) {
        db_.execute("ROLLBACK;");
        throw;
    }

    return keys.size();
}

std::int64_t StateStore::logEvent(const AuditEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(
        "INSERT INTO audit_log (run_id, event_type, event_details, system_name, key_value, action_taken, result) "
        "VALUES (?, ?, ?, ?, ?, ?, ?);");
    bindOptionalId(stmt.get(), 1, event.runId);
    bindText(stmt.get(), 2, event.eventType);
    bindText(stmt.get(), 3, event.details);
    bindOptionalText(stmt.get(), 4, event.system);
    bindOptionalText(stmt.get(), 5, event.key);
    bindOptionalText(stmt.get(), 6, event.action);
    bindOptionalText(stmt.get(), 7, event.result);
    db_.stepDone(stmt.get());
    return db_.lastInsertId();
}

std::int64_t StateStore::logEvent(RunId runId, const std::string& eventType, const std::string& details,
                                  const std::optional<std::string>& result) {
    AuditEvent event;
    event.runId = runId;
    event.eventType = eventType;
    event.details = details;
    event.result = result;
    return logEvent(event);
}

std::int64_t StateStore::proposeMasterKey(RunId runId, const std::string& masterKey, const std::string& normalizedKey,
                                          const std::string& sourceSystem, const std::string& sourceKey,
                                          const std::string& strategy) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(
        "INSERT INTO master_key_registry (master_key, normalized_key, source_system, source_key, status, provisioning_strategy, run_id) "
        "VALUES (?, ?, ?, ?, 'proposed', ?, ?);");
    bindText(stmt.get(), 1, masterKey);
    bindText(stmt.get(), 2, normalizedKey);
    bindText(stmt.get(), 3, sourceSystem);
    bindText(stmt.get(), 4, sourceKey);
    bindText(stmt.get(), 5, strategy);
    sqlite3_bind_int64(stmt.get(), 6, runId);
    db_.stepDone(stmt.get());
    return db_.lastInsertId();
}

int StateStore::activateMasterKeys(RunId runId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(
        "UPDATE master_key_registry SET status = 'active', activated_at = CURRENT_TIMESTAMP "
        "WHERE run_id = ? AND status = 'proposed';");
    sqlite3_bind_int64(stmt.get(), 1, runId);
    db_.stepDone(stmt.get());
    return db_.changes();
}

std::vector<MasterKeyRecord> StateStore::getMasterKeys(std::optional<MasterKeyStatus> status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql =
        "SELECT master_key_id, master_key, normalized_key, source_system, source_key, status, provisioning_strategy,"
        " run_id, created_at, activated_at, deprecated_at FROM master_key_registry";
    if (status) sql += " WHERE status = ?";
    sql += " ORDER BY created_at DESC, master_key_id DESC;";

    auto stmt = db_.prepare(sql);
    if (status) bindText(stmt.get(), 1, toString(*status));

    std::vector<MasterKeyRecord> records;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        MasterKeyRecord record;
        record.masterKeyId = sqlite3_column_int64(stmt.get(), 0);
        record.masterKey = columnText(stmt.get(), 1);
        record.normalizedKey = columnText(stmt.get(), 2);
        record.sourceSystem = columnText(stmt.get(), 3);
        record.sourceKey = columnText(stmt.get(), 4);
        record.status = parseMasterKeyStatus(columnText(stmt.get(), 5)).value_or(MasterKeyStatus::Proposed);
        record.strategy = columnText(stmt.get(), 6);
        record.runId = columnOptionalId(stmt.get(), 7);
        record.createdAt = columnText(stmt.get(), 8);
        record.activatedAt = columnOptionalText(stmt.get(), 9);
        record.deprecatedAt = columnOptionalText(stmt.get(), 10);
        records.push_back(std::move(record));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("SQLite step failed: " + db_.errorMessage());
    }
    return records;
}

std::optional<RunRecord> StateStore::fetchRun(const std::string& sql, std::optional<RunId> runId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(sql);
    if (runId) sqlite3_bind_int64(stmt.get(), 1, *runId);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return readRun(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("SQLite step failed: " + db_.errorMessage());
    }
    return std::nullopt;
}

std::optional<RunRecord> StateStore::getLastSuccessfulRun() const {
    return fetchRun(std::string(kRunColumns) +
                    "WHERE status = 'completed' ORDER BY completed_at DESC, run_id DESC LIMIT 1;", std::nullopt);
}

std::optional<RunRecord> StateStore::getRun(RunId runId) const {
    return fetchRun(std::string(kRunColumns) + "WHERE run_id = ?;", runId);
}

std::vector<AuditEvent> StateStore::getAuditEvents(RunId runId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare(
        "SELECT audit_id, run_id, timestamp, event_type, event_details, system_name, key_value, action_taken, result "
        "FROM audit_log WHERE run_id = ? ORDER BY audit_id;");
    sqlite3_bind_int64(stmt.get(), 1, runId);

    std::vector<AuditEvent> events;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        AuditEvent event;
        event.auditId = sqlite3_column_int64(stmt.get(), 0);
        event.runId = columnOptionalId(stmt.get(), 1);
        event.timestamp = columnText(stmt.get(), 2);
        event.eventType = columnText(stmt.get(), 3);
        event.details = columnText(stmt.get(), 4);
        event.system = columnOptionalText(stmt.get(), 5);
        event.key = columnOptionalText(stmt.get(), 6);
        event.action = columnOptionalText(stmt.get(), 7);
        event.result = columnOptionalText(stmt.get(), 8);
        events.push_back(std::move(event));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("SQLite step failed: " + db_.errorMessage());
    }
    return events;
}

std::vector<KeyTrackingEntry> StateStore::getTrackedKeys(const std::optional<std::string>& system) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql =
        "SELECT system_name, key_value, normalized_key, first_seen_at, last_seen_at, run_id FROM key_tracking";
    if (system) sql += " WHERE system_name = ?";
    sql += " ORDER BY system_name, normalized_key;";

    auto stmt = db_.prepare(sql);
    if (system) bindText(stmt.get(), 1, *system);

    std::vector<KeyTrackingEntry> entries;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        KeyTrackingEntry entry;
        entry.system = columnText(stmt.get(), 0);
        entry.keyValue = columnText(stmt.get(), 1);
        entry.normalizedKey = columnText(stmt.get(), 2);
        entry.firstSeenAt = columnText(stmt.get(), 3);
        entry.lastSeenAt = columnText(stmt.get(), 4);
        entry.runId = columnOptionalId(stmt.get(), 5);
        entries.push_back(std::move(entry));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("SQLite step failed: " + db_.errorMessage());
    }
    return entries;
}
