#include <set>
#include <stdexcept>

#include "ks_logger.h"
#include "ks_provisioner.h"

MasterKeyProvisioner::MasterKeyProvisioner(StateStore& store, const ProvisioningConfig& config, std::ofstream& logFile)
    : store_(store), config_(config), logFile_(logFile) {
}

std::string MasterKeyProvisioner::effectiveStrategy() const {
    if (config_.strategy == "namespaced") return "namespaced";
    return "mirror";
}

std::string MasterKeyProvisioner::generateMasterKey(const std::string& sourceSystem, const std::string& normalizedKey) const {
    if (effectiveStrategy() == "namespaced") {
        return config_.namespacePrefix + "-" + sourceSystem + "-" + normalizedKey;
    }
    return normalizedKey;
}

std::vector<ProposedMasterKey> MasterKeyProvisioner::propose(RunId runId, const OutOfAuthorityKeys& outOfAuthority) {
    std::vector<ProposedMasterKey> proposed;
    if (outOfAuthority.empty()) return proposed;

    if (config_.strategy != "mirror" && config_.strategy != "namespaced") {
        logMessage("WARNING - unknown strategy '" + config_.strategy + "', using mirror strategy", logFile_);
    }
    const std::string strategy = effectiveStrategy();

    // Normalized keys and master keys already claimed anywhere in the registry, not only by this run
    std::set<std::string> claimedNormalized;
    std::set<std::string> claimedMaster;
    for (const auto& record : store_.getMasterKeys()) {
        if (record.status == MasterKeyStatus::Proposed || record.status == MasterKeyStatus::Active) {
            claimedNormalized.insert(record.normalizedKey);
            claimedMaster.insert(record.masterKey);
        }
    }

    for (const auto& [normalizedKey, sources] : outOfAuthority) {
        if (sources.empty()) continue;

        const auto& [sourceSystem, sourceKey] = sources.front();
        const std::string masterKey = generateMasterKey(sourceSystem, normalizedKey);

        if (claimedNormalized.count(normalizedKey) || claimedMaster.count(masterKey)) {
            logMessage("Master key already exists for '" + normalizedKey + "', skipping", logFile_);
            ++stats_.keysSkipped;
            continue;
        }

        std::int64_t masterKeyId = 0;
        try {
            masterKeyId = store_.proposeMasterKey(runId, masterKey, normalizedKey, sourceSystem, sourceKey, strategy);
        }
        catch (const std::runtime_error& e) {
            logMessage("ERROR - failed to propose master key for '" + normalizedKey + "': " + e.what(), logFile_);
            ++stats_.keysSkipped;
            continue;
        }

        ProposedMasterKey key;
        key.masterKeyId = masterKeyId;
        key.masterKey = masterKey;
        key.sourceSystem = sourceSystem;
        key.sourceKey = sourceKey;
        key.normalizedKey = normalizedKey;
        for (const auto& source : sources) {
            key.affectedSystems.push_back(source.first);
        }
        proposed.push_back(std::move(key));

        claimedNormalized.insert(normalizedKey);
        claimedMaster.insert(masterKey);
        ++stats_.keysProposed;
        ++stats_.strategyUsed[strategy];
        logMessage("Proposed master key: '" + masterKey + "' for normalized key '" + normalizedKey + "'", logFile_);
    }

    return proposed;
}

int MasterKeyProvisioner::activate(RunId runId, std::optional<bool> autoApprove) {
    if (!autoApprove.value_or(config_.autoApprove)) {
        logMessage("Auto-approve is disabled, keys remain in proposed state", logFile_);
        return 0;
    }

    const int activated = store_.activateMasterKeys(runId);
    stats_.keysActivated += static_cast<std::size_t>(activated);
    logMessage("Activated " + std::to_string(activated) + " master keys from run " + std::to_string(runId), logFile_);
    return activated;
}

ordered_json MasterKeyProvisioner::provisioningSummary(RunId runId) const {
    std::size_t totalProposed = 0;
    std::size_t totalActivated = 0;
    for (const auto& record : store_.getMasterKeys()) {
        if (record.runId != runId) continue;
        if (record.status == MasterKeyStatus::Proposed) ++totalProposed;
        else if (record.status == MasterKeyStatus::Active) ++totalActivated;
    }

    return {
        {"run_id", runId},
        {"total_proposed", totalProposed},
        {"total_activated", totalActivated},
        {"strategy", effectiveStrategy()},
        {"auto_approve", config_.autoApprove},
        {"stats", statisticsToJson()}
    };
}

ordered_json MasterKeyProvisioner::statisticsToJson() const {
    ordered_json strategyUsed = ordered_json::object();
    for (const auto& [strategy, count] : stats_.strategyUsed) {
        strategyUsed[strategy] = count;
    }

    return {
        {"keys_proposed", stats_.keysProposed},
        {"keys_activated", stats_.keysActivated},
        {"keys_skipped", stats_.keysSkipped},
        {"strategy_used", strategyUsed}
    };
}
