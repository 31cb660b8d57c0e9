#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "ks_comparator.h"
#include "ks_config.h"
#include "ks_constants.h"
#include "ks_error_handler.h"
#include "ks_logger.h"
#include "ks_normalizer.h"
#include "ks_options.h"
#include "ks_provisioner.h"
#include "ks_reconciler.h"
#include "ks_state_store.h"
#include "ks_user_interaction.h"

// Main function
int main(int argc, char* argv[]) {
    // Parse command line arguments
    ProgramOptions options;
    try {
        options = parseArguments(argc, argv);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "ERROR - " << e.what() << "\nUse --help to list the available options.\n";
        return EXIT_FAILURE;
    }

    // Display program information
    if (!options.silentMode) {
        std::cout << PROGRAM_NAME << "\n" << PROGRAM_VERSION << "\n\n";
    }

    // Configuration is read before the log file it names is opened
    std::ofstream logFile;
    AppConfig config = loadConfig(options.configPath, logFile);
    if (options.mode) {
        config.processing.mode = *options.mode;
    }
    if (config.verbose) {
        options.verbose = true;
    }

    // Log file initialisation
    logClear(config.logFile);
    logFile.open(config.logFile, std::ios::app);
    if (!logFile.is_open()) {
        logErrorAndExit("ERROR - failed to open log file '" + config.logFile + "'!\n", logFile);
    }

    try {
        ErrorHandler errorHandler(config.errorHandling, logFile);

        auto store = errorHandler.withRetry("open state store", [&config]() {
            return std::make_unique<StateStore>(config.databasePath);
        });
        if (!options.silentMode) {
            logMessage("Database opened successfully: " + store->path(), logFile);
        }

        KeyNormalizer normalizer(config.normalize);
        SystemComparator comparator(normalizer, errorHandler, config.processing, logFile);
        MasterKeyProvisioner provisioner(*store, config.provisioning, logFile);
        ReconciliationOrchestrator orchestrator(*store, normalizer, comparator, provisioner, errorHandler,
                                                configToJson(config), logFile, options.silentMode);

        const auto systemFiles = resolveSystemFiles(config, options, logFile);
        const ExecutionMode executionMode = executionModeOf(options, config.provisioning.autoApprove);

        ReconciliationResult result = orchestrator.runReconciliation(config.processing.mode, executionMode, systemFiles);
        printRunReport(result, options, logFile);

        if (options.verbose) {
            logMessage("Run summary:\n" + orchestrator.runSummary().dump(2), logFile);
        }
    }
    catch (const ReconciliationError& e) {
        logMessage("ERROR - reconciliation failed: " + std::string(e.what()), logFile);
        return EXIT_FAILURE;
    }
    catch (const std::exception& e) {
        logMessage("ERROR - " + std::string(e.what()), logFile);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
