#include <cctype>

#include "ks_normalizer.h"

namespace {

    bool isSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    bool isAlnum(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    }

    bool isDigit(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    bool isWordChar(char c) {
        return isAlnum(c) || c == '_';
    }

    bool isCollapsible(char c) {
        return isSpace(c) || c == '_' || c == '-';
    }

    std::string trim(const std::string& key) {
        std::size_t begin = 0;
        std::size_t end = key.size();
        while (begin < end && isSpace(key[begin])) ++begin;
        while (end > begin && isSpace(key[end - 1])) --end;
        return key.substr(begin, end - begin);
    }

    std::string toUpper(std::string key) {
        for (auto& c : key) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return key;
    }

    // Replace every run of whitespace, underscores and hyphens with one delimiter
    std::string collapseDelimiters(const std::string& key, char delimiter) {
        std::string result;
        result.reserve(key.size());
        for (std::size_t i = 0; i < key.size();) {
            if (isCollapsible(key[i])) {
                while (i < key.size() && isCollapsible(key[i])) ++i;
                result += delimiter;
            }
            else {
                result += key[i++];
            }
        }
        return result;
    }

    // Keep alphanumerics and the delimiter; delimiters joined by a removal merge when collapsing
    std::string stripNonAlnum(const std::string& key, char delimiter, bool mergeDelimiters) {
        std::string result;
        result.reserve(key.size());
        for (const char c : key) {
            if (isAlnum(c)) {
                result += c;
            }
            else if (c == delimiter) {
                if (mergeDelimiters && !result.empty() && result.back() == delimiter) continue;
                result += c;
            }
        }
        return result;
    }

    // Zero-pad digit runs that form a whole token
    std::string padNumbers(const std::string& key, std::size_t padLength) {
        std::string result;
        result.reserve(key.size() + padLength);
        for (std::size_t i = 0; i < key.size();) {
            if (!isDigit(key[i])) {
                result += key[i++];
                continue;
            }

            std::size_t end = i;
            while (end < key.size() && isDigit(key[end])) ++end;

            const std::size_t runLength = end - i;
            const bool standalone = (i == 0 || !isWordChar(key[i - 1])) &&
                                    (end == key.size() || !isWordChar(key[end]));
            if (standalone && runLength < padLength) {
                result.append(padLength - runLength, '0');
            }
            result.append(key, i, runLength);
            i = end;
        }
        return result;
    }
}

std::string toString(Transformation transformation) {
    switch (transformation) {
    case Transformation::Trim:           return "trim";
    case Transformation::Uppercase:      return "uppercase";
    case Transformation::CollapseDelims: return "collapse_delims";
    case Transformation::StripNonAlnum:  return "strip_non_alnum";
    default:                             return "pad_numbers";
    }
}

KeyNormalizer::KeyNormalizer() : padNumbers_(true) {
    config_.leftPadNumbers = true;
}

KeyNormalizer::KeyNormalizer(const NormalizeConfig& config)
    : config_(config), padNumbers_(config.leftPadNumbers.value_or(false)) {
}

std::string KeyNormalizer::normalize(const std::string& rawKey) const {
    if (rawKey.empty()) {
        return std::string();
    }

    std::array<bool, TRANSFORMATION_COUNT> applied{};
    std::string key = rawKey;

    const auto step = [&key, &applied](Transformation transformation, std::string next) {
        if (next != key) {
            applied[static_cast<std::size_t>(transformation)] = true;
            key = std::move(next);
        }
    };

    if (config_.trimWhitespace) {
        step(Transformation::Trim, trim(key));
    }

    if (config_.uppercase) {
        step(Transformation::Uppercase, toUpper(key));
    }

    if (config_.collapseDelims) {
        step(Transformation::CollapseDelims, collapseDelimiters(key, *config_.collapseDelims));
    }

    if (config_.stripNonAlnum) {
        const char delimiter = config_.collapseDelims.value_or('-');
        step(Transformation::StripNonAlnum, stripNonAlnum(key, delimiter, config_.collapseDelims.has_value()));
    }

    if (padNumbers_ && config_.padLength > 0) {
        step(Transformation::PadNumbers, padNumbers(key, static_cast<std::size_t>(config_.padLength)));
    }

    totalNormalized_.fetch_add(1, std::memory_order_relaxed);
    for (std::size_t i = 0; i < TRANSFORMATION_COUNT; ++i) {
        if (applied[i]) {
            transformations_[i].fetch_add(1, std::memory_order_relaxed);
        }
    }

    return key;
}

std::vector<std::string> KeyNormalizer::normalizeBatch(const std::vector<std::string>& rawKeys) const {
    std::vector<std::string> normalized;
    normalized.reserve(rawKeys.size());
    for (const auto& rawKey : rawKeys) {
        normalized.push_back(normalize(rawKey));
    }
    return normalized;
}

std::map<std::string, std::string> KeyNormalizer::normalizeWithMapping(const std::vector<std::string>& rawKeys) const {
    std::map<std::string, std::string> mapping;
    for (const auto& rawKey : rawKeys) {
        mapping[rawKey] = normalize(rawKey);
    }
    return mapping;
}

std::size_t KeyNormalizer::transformationCount(Transformation transformation) const {
    return transformations_[static_cast<std::size_t>(transformation)].load();
}

ordered_json KeyNormalizer::statistics() const {
    ordered_json transformations = ordered_json::object();
    for (std::size_t i = 0; i < TRANSFORMATION_COUNT; ++i) {
        const std::size_t count = transformations_[i].load();
        if (count > 0) {
            transformations[toString(static_cast<Transformation>(i))] = count;
        }
    }

    return {
        {"total_normalized", totalNormalized_.load()},
        {"transformations", transformations},
        {"configuration", {
            {"trim_whitespace", config_.trimWhitespace},
            {"uppercase", config_.uppercase},
            {"collapse_delims", config_.collapseDelims ? ordered_json(std::string(1, *config_.collapseDelims)) : ordered_json(nullptr)},
            {"strip_non_alnum", config_.stripNonAlnum},
            {"left_pad_numbers", padNumbers_},
            {"pad_length", config_.padLength}
        }}
    };
}

void KeyNormalizer::resetStatistics() {
    totalNormalized_.store(0);
    for (auto& counter : transformations_) {
        counter.store(0);
    }
}
