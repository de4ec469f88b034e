#pragma once

#include "core/types.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace urlscope {

/**
 * @brief One row of the classification table
 *
 * Rules are evaluated in table order; the first rule that accepts the text
 * decides the kind.
 */
struct ClassificationRule {
    enum class Mode {
        SEARCH,         // pattern found anywhere in the text
        FULL_MATCH,     // pattern matches the whole text
        PRINTABLE_TEXT  // non-empty, no control characters (pattern unused)
    };

    IdentifierKind kind = IdentifierKind::GENERIC;
    std::string name;
    Mode mode = Mode::SEARCH;
    std::regex pattern;
    size_t min_digits = 0;      // 0 = no digit-count constraint
    size_t max_digits = 0;
};

/**
 * @brief Classifies decoded text as Email / Phone / Generic
 *
 * Input must already be valid UTF-8. Thread-safe after construction.
 */
class IdentifierClassifier {
public:
    IdentifierClassifier();
    explicit IdentifierClassifier(std::vector<ClassificationRule> rules);

    /**
     * @return Kind of the first matching rule, std::nullopt if none matched
     */
    [[nodiscard]] std::optional<IdentifierKind> classify(std::string_view text) const;

    /**
     * @brief Email (search), Phone (7-15 digits, digit/punctuation only), Generic
     */
    [[nodiscard]] static std::vector<ClassificationRule> default_rules();

    [[nodiscard]] static bool is_printable(std::string_view text);

    [[nodiscard]] const std::vector<ClassificationRule>& rules() const { return rules_; }

private:
    [[nodiscard]] static bool rule_accepts(const ClassificationRule& rule, const std::string& text);

    std::vector<ClassificationRule> rules_;
};

} // namespace urlscope
