#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "ks_config.h"
#include "ks_types.h"

// Normalization steps, in the order they are applied
enum class Transformation {
    Trim,
    Uppercase,
    CollapseDelims,
    StripNonAlnum,
    PadNumbers
};

constexpr std::size_t TRANSFORMATION_COUNT = 5;

std::string toString(Transformation transformation);

// Deterministic key normalizer. normalize() may be called from several threads;
// the statistics counters are atomic.
class KeyNormalizer {
public:
    // Default rules, numeric padding enabled
    KeyNormalizer();

    // Explicit rules, numeric padding only when config.leftPadNumbers is set to true
    explicit KeyNormalizer(const NormalizeConfig& config);

    KeyNormalizer(const KeyNormalizer&) = delete;
    KeyNormalizer& operator=(const KeyNormalizer&) = delete;

    // Apply the configured rules to one key, empty input yields empty output
    std::string normalize(const std::string& rawKey) const;

    std::vector<std::string> normalizeBatch(const std::vector<std::string>& rawKeys) const;

    // Map each raw key to its normalized form
    std::map<std::string, std::string> normalizeWithMapping(const std::vector<std::string>& rawKeys) const;

    std::size_t totalNormalized() const { return totalNormalized_.load(); }
    std::size_t transformationCount(Transformation transformation) const;

    // Counters and active configuration as JSON
    ordered_json statistics() const;

    void resetStatistics();

    const NormalizeConfig& config() const { return config_; }
    bool paddingEnabled() const { return padNumbers_; }

private:
    NormalizeConfig config_;
    bool padNumbers_;

    mutable std::atomic<std::size_t> totalNormalized_{ 0 };
    mutable std::array<std::atomic<std::size_t>, TRANSFORMATION_COUNT> transformations_{};
};
