#include "text_corrector.hpp"
#include <iostream>
#include <cctype>
#include <utility>

namespace talkpaste {

TextCorrector::TextCorrector(std::vector<CorrectionRule> rules)
    : rules_(std::move(rules)) {}

std::vector<CorrectionRule> TextCorrector::compile_rules(const std::vector<CorrectionRuleSpec>& specs) {
    std::vector<CorrectionRule> rules;
    rules.reserve(specs.size());

    for (size_t i = 0; i < specs.size(); ++i) {
        const auto& spec = specs[i];
        if (spec.pattern.empty()) {
            std::cerr << "Warning: correction rule " << i << " has an empty pattern, skipped" << std::endl;
            continue;
        }

        CorrectionRule rule;
        rule.pattern = spec.pattern;
        rule.replacement = normalize_replacement(spec.replacement);
        try {
            rule.regex = std::regex(spec.pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            std::cerr << "Warning: correction rule " << i << " (\"" << spec.pattern
                      << "\") is not a valid pattern, skipped: " << e.what() << std::endl;
            continue;
        }
        rules.push_back(std::move(rule));
    }

    return rules;
}

std::string TextCorrector::normalize_replacement(const std::string& replacement) {
    std::string out;
    out.reserve(replacement.size() + 8);

    // Group references are always emitted as two digits ($01) so a literal
    // digit that follows cannot extend the group number
    auto emit_group = [&out](int group) {
        if (group == 0) {
            out += "$&";
            return;
        }
        out += '$';
        out += static_cast<char>('0' + group / 10);
        out += static_cast<char>('0' + group % 10);
    };

    for (size_t i = 0; i < replacement.size(); ++i) {
        char c = replacement[i];

        // Dollar signs are literal in rule replacements
        if (c == '$') {
            out += "$$";
            continue;
        }

        if (c != '\\' || i + 1 >= replacement.size()) {
            out += c;
            continue;
        }

        char next = replacement[i + 1];
        if (std::isdigit(static_cast<unsigned char>(next))) {
            // \1 -> $01, \12 -> $12
            int group = next - '0';
            ++i;
            if (i + 1 < replacement.size() && std::isdigit(static_cast<unsigned char>(replacement[i + 1]))) {
                group = group * 10 + (replacement[i + 1] - '0');
                ++i;
            }
            emit_group(group);
        } else if (next == 'g' && i + 2 < replacement.size() && replacement[i + 2] == '<') {
            // \g<12> -> $12
            size_t close = replacement.find('>', i + 3);
            std::string group = close == std::string::npos ? "" : replacement.substr(i + 3, close - i - 3);
            bool numeric = !group.empty() && group.size() <= 2;
            for (char g : group) {
                if (!std::isdigit(static_cast<unsigned char>(g))) numeric = false;
            }
            if (numeric) {
                emit_group(std::stoi(group));
                i = close;
            } else {
                out += c;
            }
        } else if (next == 'n') {
            out += '\n';
            ++i;
        } else if (next == 't') {
            out += '\t';
            ++i;
        } else if (next == 'r') {
            out += '\r';
            ++i;
        } else if (next == '\\') {
            out += '\\';
            ++i;
        } else {
            out += c;
        }
    }

    return out;
}

std::string TextCorrector::apply(const std::string& text) const {
    // Order matters: each rule sees the output of the previous one
    std::string result = text;
    for (const auto& rule : rules_) {
        result = std::regex_replace(result, rule.regex, rule.replacement);
    }
    return trim(result);
}

std::string TextCorrector::trim(const std::string& text) {
    if (text.empty()) return text;

    size_t start = 0;
    size_t end = text.size();

    // Find first non-whitespace
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }

    // Find last non-whitespace
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }

    if (start >= end) return "";

    return text.substr(start, end - start);
}

} // namespace talkpaste
