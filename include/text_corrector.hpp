#pragma once

#include "config.hpp"
#include <string>
#include <vector>
#include <regex>

namespace talkpaste {

// A compiled correction rule. Patterns are always case-insensitive.
struct CorrectionRule {
    std::string pattern;
    std::string replacement;    // ECMAScript format ($1, $&, $$)
    std::regex regex;
};

class TextCorrector {
public:
    TextCorrector() = default;
    explicit TextCorrector(std::vector<CorrectionRule> rules);

    // Compile rule specs; malformed patterns are skipped with a warning
    static std::vector<CorrectionRule> compile_rules(const std::vector<CorrectionRuleSpec>& specs);

    // Translate a re.sub-style replacement into std::regex format: \N and
    // \g<N> become $NN, \n \t \r become control characters, $ stays literal
    static std::string normalize_replacement(const std::string& replacement);

    // Apply every rule in order to the running result, then trim
    std::string apply(const std::string& text) const;

    static std::string trim(const std::string& text);

    size_t rule_count() const { return rules_.size(); }

private:
    std::vector<CorrectionRule> rules_;
};

} // namespace talkpaste
