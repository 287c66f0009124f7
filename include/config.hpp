#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace talkpaste {

// One correction rule as written in the config file (compiled by TextCorrector)
struct CorrectionRuleSpec {
    std::string pattern;
    std::string replacement;
};

struct Config {
    // Transcription endpoint (OpenAI-compatible)
    std::string api_key;
    std::string base_url = "https://api.openai.com/v1";
    std::string model = "whisper-1";
    std::string language = "zh";
    float temperature = 0.0f;
    std::string response_format = "json";
    long connect_timeout_sec = 10;
    long timeout_sec = 30;

    // Audio settings
    int sample_rate = 16000;        // Provider expects 16kHz
    int channels = 1;               // Mono
    int frames_per_buffer = 512;
    double min_duration_sec = 0.5;  // Shorter recordings are dropped
    int warmup_ms = 250;            // Buffered audio before the ready cue
    bool beep = true;

    // Vocabulary prompt: base text plus optional vocabulary file
    std::string prompt = "請使用繁體中文。包含：n8n, Zeabur。";
    std::string vocabulary_file;

    // Hotkey (evdev key name or numeric code)
    std::string record_key = "f9";

    // Behavior
    bool auto_paste = true;
    int paste_delay_ms = 50;
    int status_clear_sec = 3;

    // Post-processing, applied in order
    std::vector<CorrectionRuleSpec> correction_rules = {
        {"N8n|N 8 n", "n8n"}
    };

    // Path the config was loaded from (empty if defaults)
    std::string source_path;
};

class ConfigLoader {
public:
    // Load config from an explicit path, or search the default locations when empty.
    // A missing file yields defaults; a malformed file returns false with error set.
    static bool load(const std::string& path, Config& config, std::string& error);

    // Parse config JSON text over the defaults already in config
    static bool parse(const std::string& json_text, Config& config, std::string& error);

    // Read KEY=VALUE lines into the environment without overriding existing variables
    static int load_env_file(const std::string& path);

    // Apply .env.local / env.local files and the OPENAI_API_KEY override
    static void apply_environment(Config& config);

    // Candidate config file paths in search order
    static std::vector<std::string> search_paths();
};

} // namespace talkpaste
