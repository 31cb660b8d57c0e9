#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ks_error_handler.h"

// One line of a system's key file
struct RawKeyRecord {
    std::string system;
    std::string rawValue;
    std::map<std::string, std::string> metadata;   // every other column by header name
    int row = 0;                                    // 1-based line number, the header is row 1
};

// Everything read from one key file
struct KeyFileContents {
    bool fileFound = false;
    std::size_t totalRows = 0;
    std::vector<RawKeyRecord> records;
    std::vector<ErrorRecord> errors;               // missing file and corrupt rows, not yet merged
};

// Function to split one CSV line into fields, nullopt when a quoted field is not closed
std::optional<std::vector<std::string>> parseCsvLine(const std::string& line);

// Function to read a system's key file, applying the missing-file and corrupt-row policies
KeyFileContents loadKeyFile(const std::filesystem::path& filePath, const std::string& systemName,
                            const ErrorHandler& errorHandler);
