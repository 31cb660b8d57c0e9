#include <filesystem>

#include "ks_config.h"
#include "ks_constants.h"
#include "ks_logger.h"

namespace {

    // Read a boolean field, keeping the current value when absent or mistyped
    void readBool(const ordered_json& section, const char* name, bool& target, const std::string& sectionName, std::ofstream& logFile) {
        if (!section.contains(name)) return;
        if (section[name].is_boolean()) {
            target = section[name].get<bool>();
        }
        else {
            logMessage("WARNING - invalid '" + sectionName + "." + name + "' value, using default " + (target ? "true" : "false"), logFile);
        }
    }

    // Read a positive count, keeping the current value when absent or invalid
    void readCount(const ordered_json& section, const char* name, std::size_t& target, const std::string& sectionName, std::ofstream& logFile) {
        if (!section.contains(name)) return;
        if (section[name].is_number_integer() && section[name].get<long long>() > 0) {
            target = static_cast<std::size_t>(section[name].get<long long>());
        }
        else {
            logMessage("WARNING - invalid '" + sectionName + "." + name + "' value, using default " + std::to_string(target), logFile);
        }
    }

    // Read a string field, keeping the current value when absent or mistyped
    void readString(const ordered_json& section, const char* name, std::string& target, const std::string& sectionName, std::ofstream& logFile) {
        if (!section.contains(name)) return;
        if (section[name].is_string()) {
            target = section[name].get<std::string>();
        }
        else {
            logMessage("WARNING - invalid '" + sectionName + "." + name + "' value, using default '" + target + "'", logFile);
        }
    }

    // Fetch a nested object section, empty object when missing
    ordered_json sectionOf(const ordered_json& document, const char* name) {
        if (document.contains(name) && document[name].is_object()) {
            return document[name];
        }
        return ordered_json::object();
    }

    void parseNormalize(const ordered_json& section, NormalizeConfig& normalize, std::ofstream& logFile) {
        readBool(section, "trim_whitespace", normalize.trimWhitespace, "normalize", logFile);
        readBool(section, "uppercase", normalize.uppercase, "normalize", logFile);
        readBool(section, "strip_non_alnum", normalize.stripNonAlnum, "normalize", logFile);

        if (section.contains("collapse_delims")) {
            const auto& value = section["collapse_delims"];
            if (value.is_null() || (value.is_boolean() && !value.get<bool>())) {
                normalize.collapseDelims.reset();
            }
            else if (value.is_string() && value.get<std::string>().empty()) {
                normalize.collapseDelims.reset();
            }
            else if (value.is_string()) {
                const std::string delimiter = value.get<std::string>();
                if (delimiter.size() > 1) {
                    logMessage("WARNING - 'normalize.collapse_delims' must be a single character, using '" +
                               delimiter.substr(0, 1) + "'", logFile);
                }
                normalize.collapseDelims = delimiter[0];
            }
            else {
                logMessage("WARNING - invalid 'normalize.collapse_delims' value, using default '-'", logFile);
            }
        }

        if (section.contains("left_pad_numbers")) {
            if (section["left_pad_numbers"].is_boolean()) {
                normalize.leftPadNumbers = section["left_pad_numbers"].get<bool>();
            }
            else {
                logMessage("WARNING - invalid 'normalize.left_pad_numbers' value, padding stays enabled", logFile);
            }
        }

        std::size_t padLength = static_cast<std::size_t>(normalize.padLength);
        readCount(section, "pad_length", padLength, "normalize", logFile);
        normalize.padLength = static_cast<int>(padLength);
    }

    void parseProvisioning(const ordered_json& section, ProvisioningConfig& provisioning, std::ofstream& logFile) {
        readString(section, "strategy", provisioning.strategy, "provisioning", logFile);
        if (provisioning.strategy != "mirror" && provisioning.strategy != "namespaced") {
            logMessage("WARNING - invalid provisioning strategy '" + provisioning.strategy + "', using 'mirror'", logFile);
            provisioning.strategy = "mirror";
        }
        readBool(section, "auto_approve", provisioning.autoApprove, "provisioning", logFile);
        readString(section, "namespace_prefix", provisioning.namespacePrefix, "provisioning", logFile);
    }

    void parseProcessing(const ordered_json& section, ProcessingConfig& processing, std::ofstream& logFile) {
        if (section.contains("mode")) {
            const auto mode = section["mode"].is_string() ? parseRunMode(section["mode"].get<std::string>()) : std::nullopt;
            if (mode) {
                processing.mode = *mode;
            }
            else {
                logMessage("WARNING - invalid processing mode, using 'full'", logFile);
                processing.mode = RunMode::Full;
            }
        }
        readCount(section, "batch_size", processing.batchSize, "processing", logFile);
        readBool(section, "parallel", processing.parallel, "processing", logFile);
        readCount(section, "max_workers", processing.maxWorkers, "processing", logFile);
    }

    void parseErrorHandling(const ordered_json& section, ErrorHandlingConfig& errorHandling, std::ofstream& logFile) {
        if (section.contains("on_missing_file")) {
            const auto policy = section["on_missing_file"].is_string()
                ? parseMissingFilePolicy(section["on_missing_file"].get<std::string>()) : std::nullopt;
            if (policy) errorHandling.onMissingFile = *policy;
            else logMessage("WARNING - invalid 'error_handling.on_missing_file' value, using 'skip'", logFile);
        }
        if (section.contains("on_corrupt_data")) {
            const auto policy = section["on_corrupt_data"].is_string()
                ? parseCorruptDataPolicy(section["on_corrupt_data"].get<std::string>()) : std::nullopt;
            if (policy) errorHandling.onCorruptData = *policy;
            else logMessage("WARNING - invalid 'error_handling.on_corrupt_data' value, using 'log'", logFile);
        }

        std::size_t attempts = static_cast<std::size_t>(errorHandling.retryAttempts);
        readCount(section, "retry_attempts", attempts, "error_handling", logFile);
        errorHandling.retryAttempts = static_cast<int>(attempts);

        if (section.contains("retry_delay_seconds")) {
            if (section["retry_delay_seconds"].is_number() && section["retry_delay_seconds"].get<double>() >= 0.0) {
                errorHandling.retryDelaySeconds = section["retry_delay_seconds"].get<double>();
            }
            else {
                logMessage("WARNING - invalid 'error_handling.retry_delay_seconds' value, using default", logFile);
            }
        }

        readCount(section, "max_errors_before_fail", errorHandling.maxErrorsBeforeFail, "error_handling", logFile);
        readBool(section, "enable_partial_processing", errorHandling.enablePartialProcessing, "error_handling", logFile);
    }
}

// Function to build the configuration used when no file is supplied
AppConfig defaultAppConfig() {
    AppConfig config;

    // The configuration file path always names padding explicitly
    config.normalize.leftPadNumbers = true;

    config.sources.emplace(std::string(AUTHORITY_SYSTEM),
                           (std::filesystem::path(DEFAULT_INPUT_DIR) / (std::string(AUTHORITY_SYSTEM) + ".csv")).string());
    for (const auto system : DEPENDENT_SYSTEMS) {
        config.sources.emplace(std::string(system),
                               (std::filesystem::path(DEFAULT_INPUT_DIR) / (std::string(system) + ".csv")).string());
    }

    config.databasePath = DEFAULT_DATABASE_PATH;
    config.logFile = DEFAULT_LOG_PATH;
    return config;
}

// Function to parse configuration from an already decoded JSON document
AppConfig parseConfig(const ordered_json& document, std::ofstream& logFile) {
    AppConfig config = defaultAppConfig();
    if (!document.is_object()) {
        logMessage("WARNING - configuration root is not an object, using defaults", logFile);
        return config;
    }

    parseNormalize(sectionOf(document, "normalize"), config.normalize, logFile);
    parseProvisioning(sectionOf(document, "provisioning"), config.provisioning, logFile);
    parseProcessing(sectionOf(document, "processing"), config.processing, logFile);
    parseErrorHandling(sectionOf(document, "error_handling"), config.errorHandling, logFile);

    // Sources replace the defaults as a whole
    const ordered_json sources = sectionOf(document, "sources");
    if (!sources.empty()) {
        config.sources.clear();
        for (const auto& [system, source] : sources.items()) {
            if (!isKnownSystem(system)) {
                logMessage("WARNING - unknown system '" + system + "' in sources, skipping", logFile);
                continue;
            }
            if (source.is_object() && source.contains("path") && source["path"].is_string()) {
                const std::string type = source.value("type", std::string("csv"));
                if (type != "csv") {
                    logMessage("WARNING - unsupported source type '" + type + "' for system " + system + ", skipping", logFile);
                    continue;
                }
                config.sources[system] = source["path"].get<std::string>();
            }
            else if (source.is_string()) {
                config.sources[system] = source.get<std::string>();
            }
            else {
                logMessage("WARNING - source entry for system " + system + " has no path, skipping", logFile);
            }
        }
    }

    readString(sectionOf(document, "database"), "path", config.databasePath, "database", logFile);

    const ordered_json logging = sectionOf(document, "logging");
    readString(logging, "file", config.logFile, "logging", logFile);
    readBool(logging, "verbose", config.verbose, "logging", logFile);

    return config;
}

// Function to load configuration from a JSON file, falling back to defaults on any problem
AppConfig loadConfig(const std::string& configPath, std::ofstream& logFile) {
    if (!std::filesystem::exists(configPath)) {
        logMessage("Config file " + configPath + " not found, using defaults", logFile);
        return defaultAppConfig();
    }

    std::ifstream configFile(configPath, std::ios::binary);
    if (!configFile.is_open()) {
        logMessage("ERROR - failed to open config file: " + configPath + ", using defaults", logFile);
        return defaultAppConfig();
    }

    ordered_json document;
    try {
        configFile >> document;
    }
    catch (const std::exception& e) {
        logMessage("ERROR - failed to parse config (" + configPath + "): " + e.what() + ", using defaults", logFile);
        return defaultAppConfig();
    }

    logMessage("Loaded configuration from " + configPath, logFile);
    return parseConfig(document, logFile);
}

// Function to serialize the configuration for run snapshots
ordered_json configToJson(const AppConfig& config) {
    ordered_json snapshot;

    const auto& normalize = config.normalize;
    snapshot["normalize"] = {
        {"trim_whitespace", normalize.trimWhitespace},
        {"uppercase", normalize.uppercase},
        {"collapse_delims", normalize.collapseDelims ? ordered_json(std::string(1, *normalize.collapseDelims)) : ordered_json(nullptr)},
        {"strip_non_alnum", normalize.stripNonAlnum},
        {"left_pad_numbers", normalize.leftPadNumbers ? ordered_json(*normalize.leftPadNumbers) : ordered_json(nullptr)},
        {"pad_length", normalize.padLength}
    };

    snapshot["provisioning"] = {
        {"strategy", config.provisioning.strategy},
        {"auto_approve", config.provisioning.autoApprove},
        {"namespace_prefix", config.provisioning.namespacePrefix}
    };

    snapshot["processing"] = {
        {"mode", toString(config.processing.mode)},
        {"batch_size", config.processing.batchSize},
        {"parallel", config.processing.parallel},
        {"max_workers", config.processing.maxWorkers}
    };

    snapshot["error_handling"] = {
        {"on_missing_file", toString(config.errorHandling.onMissingFile)},
        {"on_corrupt_data", toString(config.errorHandling.onCorruptData)},
        {"retry_attempts", config.errorHandling.retryAttempts},
        {"retry_delay_seconds", config.errorHandling.retryDelaySeconds},
        {"max_errors_before_fail", config.errorHandling.maxErrorsBeforeFail},
        {"enable_partial_processing", config.errorHandling.enablePartialProcessing}
    };

    ordered_json sources = ordered_json::object();
    for (const auto& [system, path] : config.sources) {
        sources[system] = { {"type", "csv"}, {"path", path} };
    }
    snapshot["sources"] = sources;
    snapshot["database"] = { {"path", config.databasePath} };
    snapshot["logging"] = { {"file", config.logFile}, {"verbose", config.verbose} };

    return snapshot;
}

std::string toString(MissingFilePolicy policy) {
    return policy == MissingFilePolicy::Fail ? "fail" : "skip";
}

std::string toString(CorruptDataPolicy policy) {
    switch (policy) {
    case CorruptDataPolicy::Skip: return "skip";
    case CorruptDataPolicy::Fail: return "fail";
    default:                      return "log";
    }
}

std::optional<MissingFilePolicy> parseMissingFilePolicy(const std::string& value) {
    if (value == "skip") return MissingFilePolicy::Skip;
    if (value == "fail") return MissingFilePolicy::Fail;
    return std::nullopt;
}

std::optional<CorruptDataPolicy> parseCorruptDataPolicy(const std::string& value) {
    if (value == "log") return CorruptDataPolicy::Log;
    if (value == "skip") return CorruptDataPolicy::Skip;
    if (value == "fail") return CorruptDataPolicy::Fail;
    return std::nullopt;
}
