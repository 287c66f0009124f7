#include "app.hpp"
#include "config.hpp"
#include "curl_transport.hpp"
#include "shell_pipe.hpp"
#include <iostream>
#include <csignal>
#include <cstring>

static talkpaste::App* g_app = nullptr;

void signal_handler(int signum) {
    (void)signum;
    if (g_app) {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config FILE   Config file (default: ./config.json, ~/.config/talkpaste/config.json)\n"
              << "  -k, --key NAME      Hotkey: f1..f12, right_alt, right_ctrl, pause, KEY_* or evdev code (default: f9)\n"
              << "  -l, --language LANG Language hint (default: zh)\n"
              << "  -m, --model NAME    Transcription model (default: whisper-1)\n"
              << "  --no-paste          Don't auto-paste, just copy to clipboard\n"
              << "  --check-key         Verify the API key and exit\n"
              << "  -h, --help          Show this help\n"
              << "\nHotkey:\n"
              << "  Hold the configured key to record, release to transcribe and paste.\n"
              << "  Start speaking after the beep. Ctrl+Shift+Q quits.\n"
              << "\nCredentials:\n"
              << "  OPENAI_API_KEY from the environment, .env.local, or api.openai_api_key in config.json\n"
              << std::endl;
}

static int check_key(const talkpaste::Config& config) {
    auto transcriber = talkpaste::make_transcriber(config, std::make_shared<talkpaste::CurlTransport>());
    talkpaste::TranscriptionResult result = transcriber->verify_credentials();
    if (result.success()) {
        std::cout << "API key is valid (" << config.base_url << ")" << std::endl;
        return 0;
    }
    std::cerr << "API key check failed: " << talkpaste::transcription_error_name(result.error);
    if (!result.detail.empty()) {
        std::cerr << " (" << result.detail << ")";
    }
    std::cerr << std::endl;
    return 1;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string key_override;
    std::string language_override;
    std::string model_override;
    bool no_paste = false;
    bool verify_only = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if ((strcmp(argv[i], "-k") == 0 || strcmp(argv[i], "--key") == 0) && i + 1 < argc) {
            key_override = argv[++i];
        }
        else if ((strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--language") == 0) && i + 1 < argc) {
            language_override = argv[++i];
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model") == 0) && i + 1 < argc) {
            model_override = argv[++i];
        }
        else if (strcmp(argv[i], "--no-paste") == 0) {
            no_paste = true;
        }
        else if (strcmp(argv[i], "--check-key") == 0) {
            verify_only = true;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    talkpaste::Config config;
    std::string error;
    if (!talkpaste::ConfigLoader::load(config_path, config, error)) {
        std::cerr << "Invalid configuration: " << error << std::endl;
        return 1;
    }
    talkpaste::ConfigLoader::apply_environment(config);

    // Command line wins over the config file
    if (!key_override.empty()) config.record_key = key_override;
    if (!language_override.empty()) config.language = language_override;
    if (!model_override.empty()) config.model = model_override;
    if (no_paste) config.auto_paste = false;

    if (verify_only) {
        return check_key(config);
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    // xclip may be missing; the xsel fallback must still run
    talkpaste::ignore_broken_pipe();

    talkpaste::App app;
    g_app = &app;

    std::cout << "talkpaste - push-to-talk dictation\n" << std::endl;
    std::cout << "Endpoint: " << config.base_url << std::endl;
    std::cout << "Model: " << config.model << std::endl;
    std::cout << "Language: " << config.language << std::endl;
    std::cout << "Hotkey: " << config.record_key << std::endl;
    std::cout << "Auto-paste: " << (config.auto_paste ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    if (!app.initialize(config)) {
        std::cerr << "Failed to initialize application" << std::endl;
        g_app = nullptr;
        return 1;
    }

    int result = app.run();

    g_app = nullptr;
    return result;
}
