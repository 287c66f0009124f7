#include "vocabulary.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace talkpaste {

VocabularyConfig VocabularyLoader::load_from_file(const std::string& path) {
    VocabularyConfig vocab;

    if (path.empty()) return vocab;

    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Vocabulary file not found: " << path << std::endl;
        return vocab;
    }

    enum class Section { None, ProperNouns, TechnicalTerms, CommonPhrases };
    Section current_section = Section::None;

    std::string line;
    while (std::getline(file, line)) {
        // Trim whitespace
        size_t start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        size_t end = line.find_last_not_of(" \t\r\n");
        line = line.substr(start, end - start + 1);

        // Comments may carry section headers
        if (line[0] == '#') {
            std::string lower = line;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            if (lower.find("proper noun") != std::string::npos ||
                lower.find("names") != std::string::npos) {
                current_section = Section::ProperNouns;
            } else if (lower.find("technical") != std::string::npos ||
                       lower.find("term") != std::string::npos) {
                current_section = Section::TechnicalTerms;
            } else if (lower.find("phrase") != std::string::npos) {
                current_section = Section::CommonPhrases;
            }
            continue;
        }

        switch (current_section) {
            case Section::TechnicalTerms:
                vocab.technical_terms.push_back(line);
                break;
            case Section::CommonPhrases:
                vocab.common_phrases.push_back(line);
                break;
            case Section::ProperNouns:
            case Section::None:
                // Default to proper nouns if no section specified
                vocab.proper_nouns.push_back(line);
                break;
        }
    }

    std::cout << "Loaded vocabulary: " << vocab.proper_nouns.size() << " proper nouns, "
              << vocab.technical_terms.size() << " technical terms, "
              << vocab.common_phrases.size() << " phrases" << std::endl;

    return vocab;
}

std::string truncate_utf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;

    // Back up over continuation bytes to the start of the cut character
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

std::string VocabularyLoader::truncate_to_bytes(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }

    // Prefer ending on a separator so no word is cut in half
    std::string truncated = truncate_utf8(text, max_bytes);
    size_t last_sep = truncated.find_last_of(" ,;");
    if (last_sep != std::string::npos && last_sep > 0) {
        truncated = truncated.substr(0, last_sep);
    }
    return truncated;
}

std::string VocabularyLoader::build_prompt(const VocabularyConfig& vocab,
                                           const std::string& base_prompt,
                                           size_t max_bytes) {
    std::ostringstream prompt;
    prompt << base_prompt;

    auto append_list = [&prompt](const std::vector<std::string>& items, const char* separator) {
        if (items.empty()) return;
        if (prompt.tellp() > 0) prompt << " ";
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) prompt << separator;
            prompt << items[i];
        }
        prompt << ".";
    };

    append_list(vocab.proper_nouns, ", ");
    append_list(vocab.technical_terms, ", ");
    append_list(vocab.common_phrases, "; ");

    return truncate_to_bytes(prompt.str(), max_bytes);
}

} // namespace talkpaste
