#include "scrobble/text_normalizer.h"

#include "logging/logger.h"

#include <cctype>

namespace scrobble {

std::vector<std::string> defaultCleanupPatterns() {
    return {
        R"(\s*\[Explicit\])", R"(\s*\[Clean\])", R"(\s*\(Explicit\))",
        R"(\s*\(Clean\))",    R"(\s*- Explicit)", R"(\s*- Clean)",
    };
}

std::string trimWhitespace(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

TextNormalizer::TextNormalizer(const CleanupConfig& config) : enabled_(config.enabled) {
    if (!enabled_) {
        return;
    }

    patterns_.reserve(config.patterns.size());
    for (const auto& pattern : config.patterns) {
        try {
            patterns_.emplace_back(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            LOG_WARN("Cleanup: skipping invalid pattern '{}': {}", pattern, e.what());
        }
    }
    LOG_DEBUG("Cleanup: {} of {} patterns active", patterns_.size(), config.patterns.size());
}

std::string TextNormalizer::normalize(const std::string& text) const {
    if (!enabled_) {
        return text;
    }

    // Each pass only removes characters, so the loop reaches a fixed point
    std::string current = trimWhitespace(text);
    while (true) {
        std::string next = current;
        for (const auto& re : patterns_) {
            next = std::regex_replace(next, re, "");
        }
        next = trimWhitespace(next);
        if (next == current) {
            return next;
        }
        current = std::move(next);
    }
}

std::optional<std::string> TextNormalizer::normalizeOptional(
    const std::optional<std::string>& text) const {
    if (!text) {
        return std::nullopt;
    }
    return normalize(*text);
}

}  // namespace scrobble
