#include "config.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <cstdlib>
#include <cctype>

namespace talkpaste {

namespace {

using json = nlohmann::json;

std::string trim_copy(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

} // namespace

std::vector<std::string> ConfigLoader::search_paths() {
    std::vector<std::string> paths;
    paths.push_back("config.json");

    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    if (xdg && *xdg) {
        paths.push_back(std::string(xdg) + "/talkpaste/config.json");
    } else if (home) {
        paths.push_back(std::string(home) + "/.config/talkpaste/config.json");
    }
    return paths;
}

bool ConfigLoader::load(const std::string& path, Config& config, std::string& error) {
    std::string found;
    if (!path.empty()) {
        if (!std::filesystem::exists(path)) {
            error = "config file not found: " + path;
            return false;
        }
        found = path;
    } else {
        for (const auto& candidate : search_paths()) {
            if (std::filesystem::exists(candidate)) {
                found = candidate;
                break;
            }
        }
    }

    if (found.empty()) {
        // No config file - defaults are fine
        return true;
    }

    std::ifstream file(found);
    if (!file.is_open()) {
        error = "cannot open config file: " + found;
        return false;
    }

    std::stringstream ss;
    ss << file.rdbuf();
    if (!parse(ss.str(), config, error)) {
        error = found + ": " + error;
        return false;
    }

    config.source_path = found;
    std::cout << "Loaded config: " << found << std::endl;
    return true;
}

bool ConfigLoader::parse(const std::string& json_text, Config& config, std::string& error) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        error = e.what();
        return false;
    }

    if (!root.is_object()) {
        error = "top-level value must be an object";
        return false;
    }

    try {
        if (root.contains("api")) {
            const json& api = root.at("api");
            config.api_key = api.value("openai_api_key", config.api_key);
            config.base_url = api.value("base_url", config.base_url);
            config.model = api.value("model", config.model);
            config.language = api.value("language", config.language);
            config.temperature = api.value("temperature", config.temperature);
            config.response_format = api.value("response_format", config.response_format);
            config.connect_timeout_sec = api.value("connect_timeout_sec", config.connect_timeout_sec);
            config.timeout_sec = api.value("timeout_sec", config.timeout_sec);
        }

        if (root.contains("recording")) {
            const json& rec = root.at("recording");
            config.sample_rate = rec.value("sample_rate", config.sample_rate);
            config.channels = rec.value("channels", config.channels);
            config.frames_per_buffer = rec.value("frames_per_buffer", config.frames_per_buffer);
            config.min_duration_sec = rec.value("min_duration_sec", config.min_duration_sec);
            config.warmup_ms = rec.value("warmup_ms", config.warmup_ms);
            config.beep = rec.value("beep", config.beep);
        }

        if (root.contains("prompt")) {
            const json& prompt = root.at("prompt");
            config.prompt = prompt.value("text", config.prompt);
            config.vocabulary_file = prompt.value("vocabulary_file", config.vocabulary_file);
        }

        if (root.contains("hotkey")) {
            config.record_key = to_lower(root.at("hotkey").value("record_key", config.record_key));
        }

        if (root.contains("output")) {
            const json& out = root.at("output");
            config.auto_paste = out.value("auto_paste", config.auto_paste);
            config.paste_delay_ms = out.value("paste_delay_ms", config.paste_delay_ms);
            config.status_clear_sec = out.value("status_clear_sec", config.status_clear_sec);
        }

        if (root.contains("post_process") && root.at("post_process").contains("regex_rules")) {
            const json& rules = root.at("post_process").at("regex_rules");
            if (!rules.is_array()) {
                error = "post_process.regex_rules must be an array";
                return false;
            }
            config.correction_rules.clear();
            for (size_t i = 0; i < rules.size(); ++i) {
                const json& rule = rules[i];
                // A bad entry costs only that rule, like a bad pattern does
                if (!rule.is_object() || !rule.contains("pattern") || !rule["pattern"].is_string() ||
                    (rule.contains("replacement") && !rule["replacement"].is_string())) {
                    std::cerr << "Warning: correction rule " << i
                              << " needs string \"pattern\" and \"replacement\", skipped" << std::endl;
                    continue;
                }
                CorrectionRuleSpec spec;
                spec.pattern = rule["pattern"].get<std::string>();
                spec.replacement = rule.value("replacement", "");
                config.correction_rules.push_back(spec);
            }
        }
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }

    if (config.channels != 1) {
        error = "only mono recording is supported";
        return false;
    }
    if (config.sample_rate <= 0 || config.min_duration_sec < 0.0) {
        error = "invalid recording settings";
        return false;
    }

    return true;
}

int ConfigLoader::load_env_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return -1;

    int count = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim_copy(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim_copy(line.substr(0, eq));
        std::string value = trim_copy(line.substr(eq + 1));
        if (key.empty()) continue;

        // Existing environment wins
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++count;
        }
    }
    return count;
}

void ConfigLoader::apply_environment(Config& config) {
    std::vector<std::string> env_files;
    if (!config.source_path.empty()) {
        std::filesystem::path dir = std::filesystem::path(config.source_path).parent_path();
        env_files.push_back((dir / ".env.local").string());
        env_files.push_back((dir / "env.local").string());
    }
    env_files.push_back(".env.local");
    env_files.push_back("env.local");

    for (const auto& env_file : env_files) {
        if (load_env_file(env_file) >= 0) {
            std::cout << "Loaded environment file: " << env_file << std::endl;
            break;
        }
    }

    const char* key = std::getenv("OPENAI_API_KEY");
    if (key && *key) {
        config.api_key = key;
    }
}

} // namespace talkpaste
