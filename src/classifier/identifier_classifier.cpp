#include "classifier/identifier_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace urlscope {

IdentifierClassifier::IdentifierClassifier()
    : rules_(default_rules()) {}

IdentifierClassifier::IdentifierClassifier(std::vector<ClassificationRule> rules)
    : rules_(std::move(rules)) {}

std::vector<ClassificationRule> IdentifierClassifier::default_rules() {
    std::vector<ClassificationRule> rules;

    ClassificationRule email;
    email.kind = IdentifierKind::EMAIL;
    email.name = "email";
    email.mode = ClassificationRule::Mode::SEARCH;
    email.pattern = std::regex(R"([a-zA-Z0-9_.+-]+@[a-zA-Z0-9-]+\.[a-zA-Z0-9.-]+)");
    rules.push_back(std::move(email));

    // Digits with common separators only, e.g. "+1 (555) 123-4567"
    ClassificationRule phone;
    phone.kind = IdentifierKind::PHONE;
    phone.name = "phone";
    phone.mode = ClassificationRule::Mode::FULL_MATCH;
    phone.pattern = std::regex(R"(\+?[0-9][0-9 ().-]*[0-9])");
    phone.min_digits = 7;
    phone.max_digits = 15;
    rules.push_back(std::move(phone));

    ClassificationRule generic;
    generic.kind = IdentifierKind::GENERIC;
    generic.name = "generic";
    generic.mode = ClassificationRule::Mode::PRINTABLE_TEXT;
    rules.push_back(std::move(generic));

    return rules;
}

bool IdentifierClassifier::is_printable(std::string_view text) {
    if (text.empty()) return false;
    bool has_visible = false;
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7F) return false;
        if (c != ' ') has_visible = true;
    }
    return has_visible;
}

bool IdentifierClassifier::rule_accepts(const ClassificationRule& rule, const std::string& text) {
    switch (rule.mode) {
        case ClassificationRule::Mode::PRINTABLE_TEXT:
            return is_printable(text);
        case ClassificationRule::Mode::SEARCH:
            if (!std::regex_search(text, rule.pattern)) return false;
            break;
        case ClassificationRule::Mode::FULL_MATCH:
            if (!std::regex_match(text, rule.pattern)) return false;
            break;
    }

    if (rule.min_digits > 0 || rule.max_digits > 0) {
        const auto digits = static_cast<size_t>(std::count_if(text.begin(), text.end(),
            [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }));
        if (digits < rule.min_digits) return false;
        if (rule.max_digits > 0 && digits > rule.max_digits) return false;
    }
    return true;
}

std::optional<IdentifierKind> IdentifierClassifier::classify(std::string_view text) const {
    const std::string s(text);
    for (const auto& rule : rules_) {
        if (rule_accepts(rule, s)) {
            return rule.kind;
        }
    }
    return std::nullopt;
}

} // namespace urlscope
