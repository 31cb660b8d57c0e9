#pragma once
#include <cstddef>
#include <exception>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "ks_config.h"
#include "ks_error_handler.h"
#include "ks_normalizer.h"

using KeySet = std::set<std::string>;

// normalized key -> distinct raw values that normalize to it
using NormalizedKeyGroup = std::map<std::string, std::set<std::string>>;

// Outcome of loading one system, produced by a single worker
struct SystemLoadResult {
    std::string system;
    bool loaded = false;                // false when the key file was skipped as missing
    NormalizedKeyGroup keys;
    std::size_t keysProcessed = 0;
    std::vector<ErrorRecord> errors;
    std::exception_ptr failure;
};

struct ComparisonStatistics {
    std::size_t totalUniqueKeys = 0;
    std::size_t keysInA = 0;
    std::size_t keysOnlyInA = 0;
    std::size_t keysMissingInA = 0;
    std::size_t keysInAllSystems = 0;
    double matchPercentage = 0.0;
    std::size_t totalKeysProcessed = 0;
    std::vector<std::string> systemsCompared;
    std::map<std::string, std::size_t> systemCounts;
    std::map<std::string, std::size_t> duplicateGroups;
};

// Snapshot of one cross-system comparison
struct ComparisonResult {
    bool hasAuthority = false;
    std::map<std::string, NormalizedKeyGroup> systemKeys;
    std::map<std::string, NormalizedKeyGroup> duplicates;   // only groups with more than one raw value
    KeySet allKeys;
    KeySet keysOnlyInA;
    KeySet keysMissingInA;
    KeySet keysInAllSystems;
    std::map<std::string, KeySet> systemGaps;               // dependent system -> keys of A it lacks
    ComparisonStatistics statistics;
    std::vector<ErrorRecord> processingErrors;
};

// Function to collect the groups of a system that hold more than one raw value
NormalizedKeyGroup findDuplicateGroups(const NormalizedKeyGroup& keys);

// Function to compute the set algebra over already normalized systems
ComparisonResult computeComparison(std::map<std::string, NormalizedKeyGroup> systemKeys);

// Function to serialize comparison statistics
ordered_json comparisonStatisticsToJson(const ComparisonStatistics& statistics);

// Function to build the metric/value summary table of a comparison
std::vector<std::pair<std::string, std::string>> buildComparisonSummary(const ComparisonResult& result);

class SystemComparator {
public:
    SystemComparator(const KeyNormalizer& normalizer, ErrorHandler& errorHandler,
                     const ProcessingConfig& processing, std::ofstream& logFile);

    // Load, normalize and compare every system; the authority must be named "A"
    ComparisonResult compareAll(const std::map<std::string, std::string>& systemFiles);

    // Normalize one batch of raw keys
    NormalizedKeyGroup normalizeSystemKeys(const std::vector<std::string>& rawKeys) const;

    // Load one system's file and normalize it in batches
    SystemLoadResult loadAndNormalizeSystem(const std::string& systemName, const std::string& filePath);

private:
    const KeyNormalizer& normalizer_;
    ErrorHandler& errorHandler_;
    ProcessingConfig processing_;
    std::ofstream& logFile_;
};
