#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "ks_file_processor.h"

// Function to split one CSV line into fields
std::optional<std::vector<std::string>> parseCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (inQuotes) {
            if (c == '"') {
                // A doubled quote is an escaped quote
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                }
                else {
                    inQuotes = false;
                }
            }
            else {
                field += c;
            }
        }
        else if (c == '"') {
            inQuotes = true;
        }
        else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        }
        else {
            field += c;
        }
    }

    if (inQuotes) {
        return std::nullopt;
    }

    fields.push_back(std::move(field));
    return fields;
}

// Function to read a system's key file
KeyFileContents loadKeyFile(const std::filesystem::path& filePath, const std::string& systemName,
                            const ErrorHandler& errorHandler) {
    KeyFileContents contents;
    const std::string pathString = filePath.string();

    if (!std::filesystem::exists(filePath)) {
        contents.errors.push_back(errorHandler.evaluateMissingFile(pathString, systemName));
        return contents;
    }

    std::ifstream inputFile(filePath, std::ios::binary);
    if (!inputFile.is_open()) {
        throw std::runtime_error("failed to open key file: " + pathString);
    }
    contents.fileFound = true;

    // getline leaves the carriage return of CRLF lines in place
    auto readLine = [&inputFile](std::string& line) -> bool {
        if (!std::getline(inputFile, line)) return false;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    };

    std::string line;
    if (!readLine(line)) {
        if (inputFile.bad()) {
            throw std::runtime_error("failed to read key file: " + pathString);
        }
        return contents;
    }
    if (line.rfind("\xEF\xBB\xBF", 0) == 0) {
        line.erase(0, 3);
    }

    const auto header = parseCsvLine(line);
    const auto keyColumn = header
        ? std::find(header->begin(), header->end(), "key")
        : std::vector<std::string>::const_iterator();
    if (!header || keyColumn == header->end()) {
        contents.errors.push_back(errorHandler.evaluateCorruptRow(pathString, systemName, 1, "Missing 'key' column"));
        return contents;
    }
    const std::size_t keyIndex = static_cast<std::size_t>(keyColumn - header->begin());

    int rowNumber = 1;
    while (readLine(line)) {
        ++rowNumber;
        if (line.empty()) continue;
        ++contents.totalRows;

        const auto fields = parseCsvLine(line);
        if (!fields) {
            contents.errors.push_back(errorHandler.evaluateCorruptRow(pathString, systemName, rowNumber, "Unterminated quoted field"));
            continue;
        }
        if (fields->size() != header->size()) {
            contents.errors.push_back(errorHandler.evaluateCorruptRow(pathString, systemName, rowNumber,
                "Expected " + std::to_string(header->size()) + " fields, found " + std::to_string(fields->size())));
            continue;
        }
        if ((*fields)[keyIndex].empty()) {
            contents.errors.push_back(errorHandler.evaluateCorruptRow(pathString, systemName, rowNumber, "Empty key field"));
            continue;
        }

        RawKeyRecord record{ systemName, (*fields)[keyIndex], {}, rowNumber };
        for (std::size_t i = 0; i < header->size(); ++i) {
            if (i != keyIndex) {
                record.metadata[(*header)[i]] = (*fields)[i];
            }
        }
        contents.records.push_back(std::move(record));
    }

    if (inputFile.bad()) {
        throw std::runtime_error("failed to read key file: " + pathString);
    }

    return contents;
}
