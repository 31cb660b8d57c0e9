#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "ks_config.h"

// Scratch directory removed with everything in it on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path writeFile(const std::string& name, const std::string& content) const;

    // Key file with a key column and a status column
    std::filesystem::path writeKeyFile(const std::string& name, const std::vector<std::string>& keys) const;

private:
    std::filesystem::path path_;
};

// Error handling settings that never sleep between retries
ErrorHandlingConfig fastErrorHandling();
