#pragma once
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "ks_comparator.h"
#include "ks_provisioner.h"

// Normalized key present in a dependent system but absent from the authority
struct OutOfAuthority {
    std::string normalizedKey;
    SourceKeys sources;

    bool operator==(const OutOfAuthority& other) const = default;
};

// Normalized key of the authority that a dependent system lacks
struct PropagationGap {
    std::string system;
    std::string normalizedKey;

    bool operator==(const PropagationGap& other) const = default;
};

// Several raw keys of one system that normalize to the same key
struct DuplicateGroup {
    std::string system;
    std::string normalizedKey;
    std::set<std::string> rawKeys;

    bool operator==(const DuplicateGroup& other) const = default;
};

using Discrepancy = std::variant<OutOfAuthority, PropagationGap, DuplicateGroup>;

struct DiscrepancySummary {
    std::size_t totalOutOfAuthority = 0;
    std::size_t totalPropagationGaps = 0;
    std::size_t totalDuplicateGroups = 0;
    std::set<std::string> affectedSystems;
};

// Discrepancies of one comparison, grouped by kind
struct DiscrepancyReport {
    OutOfAuthorityKeys outOfAuthority;
    std::map<std::string, KeySet> propagationGaps;              // systems with at least one gap
    std::map<std::string, NormalizedKeyGroup> duplicateKeys;
    DiscrepancySummary summary;

    // Every discrepancy as a tagged value, out-of-authority first, then gaps, then duplicates
    std::vector<Discrepancy> items() const;
};

// Function to classify the discrepancies of a comparison
DiscrepancyReport analyzeDiscrepancies(const ComparisonResult& comparison);

// Function to serialize a discrepancy summary
ordered_json discrepancySummaryToJson(const DiscrepancySummary& summary);
