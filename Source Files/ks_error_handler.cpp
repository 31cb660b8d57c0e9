#include <algorithm>

#include "ks_constants.h"
#include "ks_error_handler.h"
#include "ks_logger.h"

ErrorHandler::ErrorHandler(const ErrorHandlingConfig& config, std::ofstream& logFile)
    : config_(config), logFile_(logFile) {
}

// Function to decide how a missing key file is treated
ErrorRecord ErrorHandler::evaluateMissingFile(const std::string& filePath, const std::string& systemName) const {
    if (config_.onMissingFile == MissingFilePolicy::Fail) {
        throw SystemUnavailableError("Required file missing for system " + systemName + ": " + filePath);
    }

    logMessage("WARNING - file not found for system " + systemName + ": " + filePath + " - skipping", logFile_);
    return ErrorRecord{ "missing_file", filePath, systemName, 0, "File not found", toString(config_.onMissingFile) };
}

// Function to decide how a corrupt row is treated
ErrorRecord ErrorHandler::evaluateCorruptRow(const std::string& filePath, const std::string& systemName,
                                             int rowNumber, const std::string& message) const {
    const std::string location = filePath + " row " + std::to_string(rowNumber);

    if (config_.onCorruptData == CorruptDataPolicy::Fail) {
        throw DataValidationError("Corrupt data in " + location + ": " + message);
    }
    if (config_.onCorruptData == CorruptDataPolicy::Log) {
        logMessage("WARNING - corrupt data in " + location + ": " + message, logFile_);
    }

    return ErrorRecord{ "corrupt_data", filePath, systemName, rowNumber, message, toString(config_.onCorruptData) };
}

void ErrorHandler::record(const ErrorRecord& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back(error);
}

void ErrorHandler::record(const std::vector<ErrorRecord>& errors) {
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.insert(errors_.end(), errors.begin(), errors.end());
}

bool ErrorHandler::canContinue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_.size() < config_.maxErrorsBeforeFail;
}

void ErrorHandler::checkErrorCeiling() const {
    if (!canContinue()) {
        throw DataValidationError("Error ceiling reached: " + std::to_string(errorCount()) +
                                  " errors (limit " + std::to_string(config_.maxErrorsBeforeFail) + ")");
    }
}

// Function to decide whether processing may go on with the systems that loaded
bool ErrorHandler::handlePartialSystemAvailability(const std::vector<std::string>& availableSystems,
                                                   const std::vector<std::string>& requiredSystems) const {
    const auto isAvailable = [&availableSystems](const std::string& system) {
        return std::find(availableSystems.begin(), availableSystems.end(), system) != availableSystems.end();
    };

    if (!isAvailable(std::string(AUTHORITY_SYSTEM))) {
        logMessage("ERROR - system " + std::string(AUTHORITY_SYSTEM) + " is required but not available", logFile_);
        return false;
    }

    std::string missing;
    for (const auto& system : requiredSystems) {
        if (!isAvailable(system)) {
            if (!missing.empty()) missing += ", ";
            missing += system;
        }
    }
    if (missing.empty()) {
        return true;
    }

    logMessage("WARNING - missing systems: " + missing, logFile_);
    if (config_.enablePartialProcessing) {
        logMessage("Continuing with partial system availability", logFile_);
        return true;
    }

    logMessage("ERROR - partial processing disabled - all systems required", logFile_);
    return false;
}

// Function to find the latest valid checkpoint stage
CheckpointRecovery ErrorHandler::recoverFromCheckpoint(const ordered_json& checkpointData) const {
    if (!checkpointData.is_object() || checkpointData.empty()) {
        logMessage("ERROR - checkpoint recovery failed: no checkpoint data available", logFile_);
        throw CheckpointRecoveryError("No checkpoint data available");
    }

    // Stages are stored in completion order, so the last valid one wins
    std::vector<std::string> stages;
    for (const auto& [stage, summary] : checkpointData.items()) {
        stages.push_back(stage);
    }

    for (auto it = stages.rbegin(); it != stages.rend(); ++it) {
        const auto& checkpoint = checkpointData[*it];
        if (checkpoint.is_object() && checkpoint.contains("timestamp") && checkpoint.contains("data_summary")) {
            logMessage("Recovering from checkpoint: " + *it, logFile_);
            return CheckpointRecovery{ *it, checkpoint };
        }
    }

    logMessage("ERROR - checkpoint recovery failed: no valid checkpoint found", logFile_);
    throw CheckpointRecoveryError("No valid checkpoint found");
}

ordered_json ErrorHandler::errorSummary() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ordered_json byType = ordered_json::object();
    for (const auto& error : errors_) {
        byType[error.type] = byType.value(error.type, 0) + 1;
    }

    ordered_json attempts = ordered_json::object();
    for (const auto& [operation, count] : recoveryAttempts_) {
        attempts[operation] = count;
    }

    return {
        {"total_errors", errors_.size()},
        {"errors_by_type", byType},
        {"recovery_attempts", attempts},
        {"can_continue", errors_.size() < config_.maxErrorsBeforeFail}
    };
}

std::vector<ErrorRecord> ErrorHandler::errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

std::size_t ErrorHandler::errorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_.size();
}

void ErrorHandler::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.clear();
    recoveryAttempts_.clear();
}

void ErrorHandler::logRetryAttempt(const std::string& operationName, int attempt, int maxAttempts) {
    logMessage("Retrying " + operationName + " (attempt " + std::to_string(attempt) + "/" +
               std::to_string(maxAttempts) + ")", logFile_);
}

void ErrorHandler::noteFailedAttempt(const std::string& operationName, int attempt, int maxAttempts, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++recoveryAttempts_[operationName];
    }

    if (attempt < maxAttempts) {
        logMessage("WARNING - attempt " + std::to_string(attempt) + "/" + std::to_string(maxAttempts) +
                   " failed for " + operationName + ": " + message, logFile_);
        return;
    }

    logMessage("ERROR - all " + std::to_string(maxAttempts) + " attempts failed for " + operationName + ": " + message, logFile_);
    record(ErrorRecord{ "operation_failure", "", "", 0, operationName + ": " + message, "retry" });
}
