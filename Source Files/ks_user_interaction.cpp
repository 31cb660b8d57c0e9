#include <algorithm>
#include <filesystem>
#include <sstream>
#include <string>

#include "ks_logger.h"
#include "ks_user_interaction.h"

namespace {

    std::string joinKeys(const KeySet& keys) {
        std::string joined;
        for (const auto& key : keys) {
            if (!joined.empty()) joined += ", ";
            joined += key;
        }
        return joined;
    }
}

// Function to build the system -> key file map from the configured sources
std::map<std::string, std::string> resolveSystemFiles(const AppConfig& config, const ProgramOptions& options, std::ofstream& logFile) {
    std::map<std::string, std::string> systemFiles;

    for (const auto& [system, path] : config.sources) {
        if (path.empty()) {
            logMessage("WARNING - no key file configured for system " + system, logFile);
            continue;
        }
        if (!std::filesystem::exists(path) && !options.silentMode) {
            logMessage("WARNING - key file not found for system " + system + ": " + path, logFile);
        }
        systemFiles.emplace(system, path);
    }

    if (!options.silentMode) {
        logMessage("Systems to reconcile: " + std::to_string(systemFiles.size()), logFile);
    }
    return systemFiles;
}

// Function to print the console summary of a finished run
void printRunReport(const ReconciliationResult& result, const ProgramOptions& options, std::ofstream& logFile) {
    const auto summaryRows = buildComparisonSummary(result.comparison);
    std::size_t width = 0;
    for (const auto& row : summaryRows) {
        width = std::max(width, row.first.size());
    }

    std::ostringstream table;
    table << "\nRun " << result.runId << " (" << toString(result.mode) << ", " << toString(result.executionMode) << ")\n";
    for (const auto& [metric, value] : summaryRows) {
        table << "  " << metric << std::string(width - metric.size() + 2, ' ') << value << "\n";
    }
    logMessage(table.str(), logFile);

    if (result.executionMode == ExecutionMode::DryRun) {
        logMessage("Dry run - no master keys activated, detailed report skipped", logFile);
        return;
    }

    const auto& summary = result.discrepancies.summary;
    logMessage("Out-of-authority keys: " + std::to_string(summary.totalOutOfAuthority) +
               "\nPropagation gaps: " + std::to_string(summary.totalPropagationGaps) +
               "\nDuplicate groups: " + std::to_string(summary.totalDuplicateGroups) +
               "\nMaster keys proposed: " + std::to_string(result.proposedKeys.size()) +
               "\nMaster keys activated: " + std::to_string(result.keysActivated), logFile);

    if (result.incrementalChanges) {
        const auto& changes = *result.incrementalChanges;
        logMessage("Changes since run " + std::to_string(changes.previousRunId.value_or(0)) + ": " +
                   std::to_string(changes.newKeys.size()) + " new, " +
                   std::to_string(changes.removedKeys.size()) + " removed, " +
                   std::to_string(changes.newlySynchronized.size()) + " newly synchronized, " +
                   std::to_string(changes.newlyDiverged.size()) + " newly diverged", logFile);
    }

    if (!result.comparison.processingErrors.empty() && !options.silentMode) {
        logMessage("WARNING - " + std::to_string(result.comparison.processingErrors.size()) +
                   " processing errors were recorded, see the log for details", logFile);
    }

    if (!options.verbose) return;

    for (const auto& item : result.discrepancies.items()) {
        if (const auto* outOfAuthority = std::get_if<OutOfAuthority>(&item)) {
            std::string sources;
            for (const auto& [system, rawKey] : outOfAuthority->sources) {
                if (!sources.empty()) sources += ", ";
                sources += system + ":" + rawKey;
            }
            logMessage("  out of authority: " + outOfAuthority->normalizedKey + " (" + sources + ")", logFile);
        }
        else if (const auto* gap = std::get_if<PropagationGap>(&item)) {
            logMessage("  missing in " + gap->system + ": " + gap->normalizedKey, logFile);
        }
        else if (const auto* duplicate = std::get_if<DuplicateGroup>(&item)) {
            logMessage("  duplicate in " + duplicate->system + ": " + duplicate->normalizedKey + " <- " +
                       joinKeys(duplicate->rawKeys), logFile);
        }
    }

    for (const auto& key : result.proposedKeys) {
        logMessage("  proposed " + key.masterKey + " from " + key.sourceSystem + ":" + key.sourceKey, logFile);
    }

    for (const auto& error : result.comparison.processingErrors) {
        logMessage("  " + error.type + " [" + error.system + "] " + error.file +
                   (error.row > 0 ? " row " + std::to_string(error.row) : "") + ": " + error.message, logFile);
    }
}
