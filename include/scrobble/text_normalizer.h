/**
 * @file text_normalizer.h
 * @brief Removes configured noise patterns ("[Explicit]", "(Clean)", ...) from metadata
 */

#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace scrobble {

/**
 * @brief Built-in cleanup patterns (ECMAScript syntax)
 */
std::vector<std::string> defaultCleanupPatterns();

struct CleanupConfig {
    bool enabled = true;
    std::vector<std::string> patterns = defaultCleanupPatterns();
};

/**
 * @brief Compiled, immutable pattern set.
 *
 * Patterns that fail to compile are logged and skipped. Normalization
 * repeats the removal pass until the text is stable, so
 * normalize(normalize(x)) == normalize(x) for any pattern set.
 */
class TextNormalizer {
   public:
    TextNormalizer() = default;
    explicit TextNormalizer(const CleanupConfig& config);

    std::string normalize(const std::string& text) const;
    std::optional<std::string> normalizeOptional(const std::optional<std::string>& text) const;

    bool enabled() const {
        return enabled_;
    }
    size_t patternCount() const {
        return patterns_.size();
    }

   private:
    bool enabled_ = false;
    std::vector<std::regex> patterns_;
};

/**
 * @brief Trim leading and trailing whitespace
 */
std::string trimWhitespace(const std::string& text);

}  // namespace scrobble
