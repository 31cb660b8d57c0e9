#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ks_config.h"
#include "ks_state_store.h"

// (system, raw key) pairs that produced an out-of-authority normalized key
using SourceKeys = std::vector<std::pair<std::string, std::string>>;

// normalized key -> where it was seen
using OutOfAuthorityKeys = std::map<std::string, SourceKeys>;

struct ProposedMasterKey {
    std::int64_t masterKeyId = 0;
    std::string masterKey;
    std::string sourceSystem;
    std::string sourceKey;
    std::string normalizedKey;
    std::vector<std::string> affectedSystems;
    MasterKeyStatus status = MasterKeyStatus::Proposed;
};

struct ProvisioningStatistics {
    std::size_t keysProposed = 0;
    std::size_t keysActivated = 0;
    std::size_t keysSkipped = 0;
    std::map<std::string, std::size_t> strategyUsed;
};

class MasterKeyProvisioner {
public:
    MasterKeyProvisioner(StateStore& store, const ProvisioningConfig& config, std::ofstream& logFile);

    // Strategy actually applied, unknown strategies fall back to mirror
    std::string effectiveStrategy() const;

    // Derive the master key for a normalized key seen first in sourceSystem
    std::string generateMasterKey(const std::string& sourceSystem, const std::string& normalizedKey) const;

    // Propose master keys for every out-of-authority key not yet proposed or active in the registry
    std::vector<ProposedMasterKey> propose(RunId runId, const OutOfAuthorityKeys& outOfAuthority);

    // Activate the proposed keys of a run when auto-approve applies, returns the number activated.
    // Without an explicit value the configured auto_approve setting is used.
    int activate(RunId runId, std::optional<bool> autoApprove = std::nullopt);

    // Proposed/active counts of a run plus the running statistics
    ordered_json provisioningSummary(RunId runId) const;

    const ProvisioningStatistics& statistics() const { return stats_; }
    ordered_json statisticsToJson() const;
    void resetStatistics() { stats_ = ProvisioningStatistics{}; }

private:
    StateStore& store_;
    ProvisioningConfig config_;
    std::ofstream& logFile_;
    ProvisioningStatistics stats_;
};
