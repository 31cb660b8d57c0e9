#include <algorithm>
#include <atomic>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <thread>

#include "ks_comparator.h"
#include "ks_constants.h"
#include "ks_file_processor.h"
#include "ks_logger.h"

namespace {

    KeySet keysOf(const NormalizedKeyGroup& group) {
        KeySet keys;
        for (const auto& [normalizedKey, rawKeys] : group) {
            keys.insert(keys.end(), normalizedKey);
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

    std::string formatPercentage(double value) {
        std::ostringstream out;
        out << std::fixed << std::setprecision(1) << value << "%";
        return out.str();
    }
}

// Function to collect the groups of a system that hold more than one raw value
NormalizedKeyGroup findDuplicateGroups(const NormalizedKeyGroup& keys) {
    NormalizedKeyGroup duplicates;
    for (const auto& [normalizedKey, rawKeys] : keys) {
        if (rawKeys.size() > 1) {
            duplicates.emplace(normalizedKey, rawKeys);
        }
    }
    return duplicates;
}

// Function to compute the set algebra over already normalized systems
ComparisonResult computeComparison(std::map<std::string, NormalizedKeyGroup> systemKeys) {
    ComparisonResult result;
    const std::string authority(AUTHORITY_SYSTEM);

    // Only A and the dependent systems B..E take part in the comparison
    for (auto it = systemKeys.begin(); it != systemKeys.end();) {
        if (isKnownSystem(it->first)) ++it;
        else it = systemKeys.erase(it);
    }

    for (const auto& [system, keys] : systemKeys) {
        result.statistics.systemCounts[system] = keys.size();
        result.statistics.systemsCompared.push_back(system);

        auto duplicates = findDuplicateGroups(keys);
        if (!duplicates.empty()) {
            result.statistics.duplicateGroups[system] = duplicates.size();
            result.duplicates.emplace(system, std::move(duplicates));
        }
    }

    const auto authorityIt = systemKeys.find(authority);
    result.hasAuthority = authorityIt != systemKeys.end();
    if (!result.hasAuthority) {
        result.systemKeys = std::move(systemKeys);
        return result;
    }

    const KeySet authorityKeys = keysOf(authorityIt->second);
    KeySet dependentUnion;
    KeySet inAll = authorityKeys;

    for (const auto& [system, keys] : systemKeys) {
        const KeySet systemSet = keysOf(keys);
        result.allKeys.insert(systemSet.begin(), systemSet.end());
        if (system == authority) continue;

        dependentUnion.insert(systemSet.begin(), systemSet.end());
        inAll = intersection(inAll, systemSet);
        result.systemGaps[system] = difference(authorityKeys, systemSet);
    }

    result.keysOnlyInA = difference(authorityKeys, dependentUnion);
    result.keysMissingInA = difference(dependentUnion, authorityKeys);
    result.keysInAllSystems = std::move(inAll);

    auto& statistics = result.statistics;
    statistics.totalUniqueKeys = result.allKeys.size();
    statistics.keysInA = authorityKeys.size();
    statistics.keysOnlyInA = result.keysOnlyInA.size();
    statistics.keysMissingInA = result.keysMissingInA.size();
    statistics.keysInAllSystems = result.keysInAllSystems.size();
    statistics.matchPercentage = statistics.totalUniqueKeys > 0
        ? static_cast<double>(statistics.keysInAllSystems) / static_cast<double>(statistics.totalUniqueKeys) * 100.0
        : 0.0;

    result.systemKeys = std::move(systemKeys);
    return result;
}

// Function to serialize comparison statistics
ordered_json comparisonStatisticsToJson(const ComparisonStatistics& statistics) {
    ordered_json systemCounts = ordered_json::object();
    for (const auto& [system, count] : statistics.systemCounts) {
        systemCounts[system] = count;
    }

    ordered_json duplicates = ordered_json::object();
    for (const auto& [system, count] : statistics.duplicateGroups) {
        duplicates[system] = count;
    }

    return {
        {"total_unique_keys", statistics.totalUniqueKeys},
        {"keys_in_a", statistics.keysInA},
        {"keys_only_in_a", statistics.keysOnlyInA},
        {"keys_missing_in_a", statistics.keysMissingInA},
        {"keys_in_all_systems", statistics.keysInAllSystems},
        {"match_percentage", statistics.matchPercentage},
        {"total_keys_processed", statistics.totalKeysProcessed},
        {"systems_compared", statistics.systemsCompared},
        {"system_counts", systemCounts},
        {"duplicate_groups", duplicates}
    };
}

// Function to build the metric/value summary table of a comparison
std::vector<std::pair<std::string, std::string>> buildComparisonSummary(const ComparisonResult& result) {
    const auto& statistics = result.statistics;
    std::vector<std::pair<std::string, std::string>> summary = {
        { "Total Unique Keys", std::to_string(statistics.totalUniqueKeys) },
        { "Keys in System A", std::to_string(statistics.keysInA) },
        { "Keys Only in A (Propagation Gaps)", std::to_string(statistics.keysOnlyInA) },
        { "Keys Missing in A (Out of Authority)", std::to_string(statistics.keysMissingInA) },
        { "Keys in All Systems", std::to_string(statistics.keysInAllSystems) },
        { "Overall Match Rate", formatPercentage(statistics.matchPercentage) }
    };

    for (const auto& [system, count] : statistics.systemCounts) {
        summary.emplace_back("Keys in System " + system, std::to_string(count));
    }
    return summary;
}

SystemComparator::SystemComparator(const KeyNormalizer& normalizer, ErrorHandler& errorHandler,
                                   const ProcessingConfig& processing, std::ofstream& logFile)
    : normalizer_(normalizer), errorHandler_(errorHandler), processing_(processing), logFile_(logFile) {
    if (processing_.batchSize == 0) processing_.batchSize = 1;
    if (processing_.maxWorkers == 0) processing_.maxWorkers = 1;
}

NormalizedKeyGroup SystemComparator::normalizeSystemKeys(const std::vector<std::string>& rawKeys) const {
    NormalizedKeyGroup group;
    for (const auto& rawKey : rawKeys) {
        group[normalizer_.normalize(rawKey)].insert(rawKey);
    }
    return group;
}

SystemLoadResult SystemComparator::loadAndNormalizeSystem(const std::string& systemName, const std::string& filePath) {
    SystemLoadResult result;
    result.system = systemName;

    KeyFileContents contents = errorHandler_.withRetry("load system " + systemName, [&]() {
        return loadKeyFile(filePath, systemName, errorHandler_);
    });
    result.errors = std::move(contents.errors);

    if (contents.fileFound) {
        logMessage("Loaded " + std::to_string(contents.records.size()) + " keys from " + filePath, logFile_);
    }

    // Batches bound the working set, merging makes the result independent of the batch size
    std::vector<RawKeyRecord> batch;
    batch.reserve(std::min(processing_.batchSize, contents.records.size()));
    auto flush = [this, &batch, &result, &filePath, &systemName]() {
        std::vector<std::string> rawKeys;
        rawKeys.reserve(batch.size());
        for (const auto& record : batch) {
            rawKeys.push_back(record.rawValue);
        }

        for (auto& [normalizedKey, group] : normalizeSystemKeys(rawKeys)) {
            if (normalizedKey.empty()) {
                // Nothing of the key survives normalization, report its rows as corrupt
                for (const auto& record : batch) {
                    if (group.count(record.rawValue)) {
                        result.errors.push_back(errorHandler_.evaluateCorruptRow(filePath, systemName, record.row,
                            "Key '" + record.rawValue + "' normalizes to an empty value"));
                    }
                }
                continue;
            }
            result.keys[normalizedKey].insert(group.begin(), group.end());
        }
        result.keysProcessed += batch.size();
        batch.clear();
    };

    for (auto& record : contents.records) {
        batch.push_back(std::move(record));
        if (batch.size() >= processing_.batchSize) flush();
    }
    if (!batch.empty()) flush();

    const auto duplicates = findDuplicateGroups(result.keys);
    if (!duplicates.empty()) {
        logMessage("Found " + std::to_string(duplicates.size()) + " duplicate groups in system " + systemName, logFile_);
    }

    result.loaded = contents.fileFound;
    return result;
}

ComparisonResult SystemComparator::compareAll(const std::map<std::string, std::string>& systemFiles) {
    std::vector<std::pair<std::string, std::string>> systems;
    for (const auto& [system, filePath] : systemFiles) {
        if (isKnownSystem(system)) {
            systems.emplace_back(system, filePath);
        }
        else {
            logMessage("WARNING - system " + system + " is not A or a dependent system B..E, skipping", logFile_);
        }
    }
    std::vector<SystemLoadResult> loadResults(systems.size());

    // Each worker claims the next system and writes only its own slot
    std::atomic<std::size_t> nextSystem{ 0 };
    auto worker = [&]() {
        for (std::size_t i = nextSystem.fetch_add(1); i < systems.size(); i = nextSystem.fetch_add(1)) {
            try {
                loadResults[i] = loadAndNormalizeSystem(systems[i].first, systems[i].second);
            }
            catch (...) {
                loadResults[i].system = systems[i].first;
                loadResults[i].failure = std::current_exception();
            }
        }
    };

    const std::size_t workerCount = processing_.parallel ? std::min(processing_.maxWorkers, systems.size()) : 1;
    if (workerCount <= 1) {
        worker();
    }
    else {
        std::vector<std::thread> workers;
        workers.reserve(workerCount);
        for (std::size_t i = 0; i < workerCount; ++i) {
            workers.emplace_back(worker);
        }
        for (auto& thread : workers) {
            thread.join();
        }
    }

    // Merge worker results in system order
    std::map<std::string, NormalizedKeyGroup> systemKeys;
    std::vector<ErrorRecord> processingErrors;
    std::vector<std::string> availableSystems;
    std::vector<std::string> requiredSystems;
    std::exception_ptr policyFailure;
    std::size_t totalKeysProcessed = 0;

    for (std::size_t i = 0; i < systems.size(); ++i) {
        auto& loadResult = loadResults[i];
        requiredSystems.push_back(systems[i].first);
        processingErrors.insert(processingErrors.end(), loadResult.errors.begin(), loadResult.errors.end());

        if (loadResult.failure) {
            try {
                std::rethrow_exception(loadResult.failure);
            }
            catch (const ReconciliationError& e) {
                logMessage("ERROR - processing system " + systems[i].first + " failed: " + e.what(), logFile_);
                if (!policyFailure) policyFailure = loadResult.failure;
            }
            catch (const std::exception& e) {
                logMessage("ERROR - processing system " + systems[i].first + " failed: " + e.what(), logFile_);
                processingErrors.push_back(ErrorRecord{ "load_failure", systems[i].second, systems[i].first, 0, e.what(), "skip" });
            }
            continue;
        }

        // A skipped authority file leaves nothing to compare against
        if (!loadResult.loaded && loadResult.system == AUTHORITY_SYSTEM) continue;

        totalKeysProcessed += loadResult.keysProcessed;
        if (loadResult.loaded) availableSystems.push_back(systems[i].first);
        systemKeys.emplace(loadResult.system, std::move(loadResult.keys));
    }

    errorHandler_.record(processingErrors);
    if (policyFailure) {
        std::rethrow_exception(policyFailure);
    }
    errorHandler_.checkErrorCeiling();

    ComparisonResult result = computeComparison(std::move(systemKeys));
    result.statistics.totalKeysProcessed = totalKeysProcessed;
    result.processingErrors = std::move(processingErrors);

    if (!result.hasAuthority) {
        logMessage("ERROR - system " + std::string(AUTHORITY_SYSTEM) + " data not found - cannot perform comparison", logFile_);
        return result;
    }

    if (!errorHandler_.handlePartialSystemAvailability(availableSystems, requiredSystems)) {
        throw SystemUnavailableError("Required dependent systems are unavailable and partial processing is disabled");
    }

    logMessage("Comparison complete: " + formatPercentage(result.statistics.matchPercentage) + " match rate", logFile_);
    return result;
}
