#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace talkpaste {

// Longest prefix of text that fits in max_bytes without splitting a UTF-8 sequence
std::string truncate_utf8(const std::string& text, size_t max_bytes);

// User vocabulary used to bias recognition toward known words
struct VocabularyConfig {
    std::vector<std::string> proper_nouns;     // Names, places, products
    std::vector<std::string> technical_terms;  // Technical/domain terms
    std::vector<std::string> common_phrases;   // Frequently used phrases

    bool empty() const {
        return proper_nouns.empty() && technical_terms.empty() && common_phrases.empty();
    }
};

class VocabularyLoader {
public:
    // Load vocabulary from a text file; a missing file yields an empty config
    static VocabularyConfig load_from_file(const std::string& path);

    // Build the vocabulary prompt: base prompt followed by the vocabulary,
    // bounded to max_bytes without splitting a UTF-8 character
    static std::string build_prompt(const VocabularyConfig& vocab,
                                    const std::string& base_prompt,
                                    size_t max_bytes);

private:
    static std::string truncate_to_bytes(const std::string& text, size_t max_bytes);
};

} // namespace talkpaste
