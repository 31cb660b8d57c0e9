#pragma once
#include <chrono>
#include <fstream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ks_config.h"
#include "ks_types.h"

// Base class for every failure raised by the reconciliation pipeline
class ReconciliationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unusable input data under the fail policy, or too many accumulated errors
class DataValidationError : public ReconciliationError {
public:
    using ReconciliationError::ReconciliationError;
};

// A required system could not be loaded
class SystemUnavailableError : public ReconciliationError {
public:
    using ReconciliationError::ReconciliationError;
};

// No usable checkpoint to recover from
class CheckpointRecoveryError : public ReconciliationError {
public:
    using ReconciliationError::ReconciliationError;
};

// One entry of the error log
struct ErrorRecord {
    std::string type;       // missing_file | corrupt_data | load_failure | operation_failure
    std::string file;
    std::string system;
    int row = 0;            // 0 when the error is not tied to a row
    std::string message;
    std::string action;     // policy applied
};

// Latest valid checkpoint stage
struct CheckpointRecovery {
    std::string stage;
    ordered_json data;
};

class ErrorHandler {
public:
    ErrorHandler(const ErrorHandlingConfig& config, std::ofstream& logFile);

    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    // Decide how a missing key file is treated, throws SystemUnavailableError under the fail policy.
    // The returned record is not stored; callers merge it with record().
    ErrorRecord evaluateMissingFile(const std::string& filePath, const std::string& systemName) const;

    // Decide how a corrupt row is treated, throws DataValidationError under the fail policy
    ErrorRecord evaluateCorruptRow(const std::string& filePath, const std::string& systemName,
                                   int rowNumber, const std::string& message) const;

    // Append errors to the log
    void record(const ErrorRecord& error);
    void record(const std::vector<ErrorRecord>& errors);

    // True while the number of logged errors stays below the configured ceiling
    bool canContinue() const;

    // Throw DataValidationError once the error ceiling is reached
    void checkErrorCeiling() const;

    // Decide whether processing may go on with the systems that loaded
    bool handlePartialSystemAvailability(const std::vector<std::string>& availableSystems,
                                         const std::vector<std::string>& requiredSystems) const;

    // Run an operation up to retryAttempts times with a fixed delay between attempts.
    // ReconciliationError is never retried.
    template <typename Operation>
    auto withRetry(const std::string& operationName, Operation&& operation) -> decltype(operation()) {
        const int maxAttempts = config_.retryAttempts > 0 ? config_.retryAttempts : 1;
        for (int attempt = 1;; ++attempt) {
            try {
                if (attempt > 1) {
                    logRetryAttempt(operationName, attempt, maxAttempts);
                }
                return operation();
            }
            catch (const ReconciliationError&) {
                throw;
            }
            catch (const std::exception& e) {
                noteFailedAttempt(operationName, attempt, maxAttempts, e.what());
                if (attempt >= maxAttempts) {
                    throw;
                }
                std::this_thread::sleep_for(std::chrono::duration<double>(config_.retryDelaySeconds));
            }
        }
    }

    // Find the latest valid checkpoint stage, throws CheckpointRecoveryError when none exists
    CheckpointRecovery recoverFromCheckpoint(const ordered_json& checkpointData) const;

    // Totals by type, recovery attempts and whether processing can continue
    ordered_json errorSummary() const;

    std::vector<ErrorRecord> errors() const;
    std::size_t errorCount() const;
    void clear();

    const ErrorHandlingConfig& config() const { return config_; }

private:
    void logRetryAttempt(const std::string& operationName, int attempt, int maxAttempts);
    void noteFailedAttempt(const std::string& operationName, int attempt, int maxAttempts, const std::string& message);

    ErrorHandlingConfig config_;
    std::ofstream& logFile_;

    mutable std::mutex mutex_;
    std::vector<ErrorRecord> errors_;
    std::map<std::string, int> recoveryAttempts_;
};
