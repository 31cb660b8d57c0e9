#include "ks_constants.h"
#include "ks_discrepancies.h"

std::vector<Discrepancy> DiscrepancyReport::items() const {
    std::vector<Discrepancy> discrepancies;

    for (const auto& [normalizedKey, sources] : outOfAuthority) {
        discrepancies.emplace_back(OutOfAuthority{ normalizedKey, sources });
    }
    for (const auto& [system, keys] : propagationGaps) {
        for (const auto& normalizedKey : keys) {
            discrepancies.emplace_back(PropagationGap{ system, normalizedKey });
        }
    }
    for (const auto& [system, groups] : duplicateKeys) {
        for (const auto& [normalizedKey, rawKeys] : groups) {
            discrepancies.emplace_back(DuplicateGroup{ system, normalizedKey, rawKeys });
        }
    }

    return discrepancies;
}

// Function to classify the discrepancies of a comparison
DiscrepancyReport analyzeDiscrepancies(const ComparisonResult& comparison) {
    DiscrepancyReport report;
    const std::string authority(AUTHORITY_SYSTEM);

    // Out-of-authority keys with every (system, raw key) that produced them
    for (const auto& normalizedKey : comparison.keysMissingInA) {
        SourceKeys sources;
        for (const auto& [system, keys] : comparison.systemKeys) {
            if (system == authority) continue;
            const auto it = keys.find(normalizedKey);
            if (it == keys.end()) continue;
            for (const auto& rawKey : it->second) {
                sources.emplace_back(system, rawKey);
            }
        }
        if (!sources.empty()) {
            report.outOfAuthority.emplace(normalizedKey, std::move(sources));
        }
    }

    for (const auto& [system, missingKeys] : comparison.systemGaps) {
        if (!missingKeys.empty()) {
            report.propagationGaps.emplace(system, missingKeys);
        }
    }

    report.duplicateKeys = comparison.duplicates;

    auto& summary = report.summary;
    summary.totalOutOfAuthority = report.outOfAuthority.size();
    for (const auto& [system, keys] : report.propagationGaps) {
        summary.totalPropagationGaps += keys.size();
        summary.affectedSystems.insert(system);
    }
    for (const auto& [system, groups] : report.duplicateKeys) {
        summary.totalDuplicateGroups += groups.size();
        summary.affectedSystems.insert(system);
    }

    return report;
}

// Function to serialize a discrepancy summary
ordered_json discrepancySummaryToJson(const DiscrepancySummary& summary) {
    return {
        {"total_out_of_authority", summary.totalOutOfAuthority},
        {"total_propagation_gaps", summary.totalPropagationGaps},
        {"total_duplicate_groups", summary.totalDuplicateGroups},
        {"affected_systems", summary.affectedSystems}
    };
}
