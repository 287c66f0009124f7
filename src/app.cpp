#include "app.hpp"
#include "curl_transport.hpp"
#include "vocabulary.hpp"
#include <iostream>
#include <thread>
#include <chrono>

namespace talkpaste {

std::unique_ptr<Transcriber> make_transcriber(const Config& config,
                                              std::shared_ptr<HttpTransport> transport) {
    auto transcriber = std::make_unique<Transcriber>(std::move(transport), config.base_url);
    transcriber->set_api_key(config.api_key);
    transcriber->set_timeouts(config.connect_timeout_sec, config.timeout_sec);

    RecognitionParams params;
    params.model = config.model;
    params.language = config.language;
    params.temperature = config.temperature;
    params.response_format = config.response_format;

    // Base prompt plus the user vocabulary, bounded for the provider
    VocabularyConfig vocab;
    if (!config.vocabulary_file.empty()) {
        vocab = VocabularyLoader::load_from_file(config.vocabulary_file);
    }
    params.prompt = VocabularyLoader::build_prompt(vocab, config.prompt, MAX_PROMPT_BYTES);

    transcriber->set_params(params);
    return transcriber;
}

App::App() = default;

App::~App() {
    shutdown();
}

bool App::initialize(const Config& config) {
    config_ = config;

    instance_lock_ = std::make_unique<InstanceLock>(InstanceLock::default_path("talkpaste"));
    if (!instance_lock_->acquire()) {
        std::cerr << "Another instance is already running (lock: " << instance_lock_->path() << ")" << std::endl;
        return false;
    }

    if (config_.api_key.empty()) {
        std::cerr << "No API key: set OPENAI_API_KEY in .env.local or api.openai_api_key in config.json" << std::endl;
        return false;
    }

    // Initialize audio capture
    audio_ = std::make_unique<PortAudioCapture>(
        config_.sample_rate,
        config_.frames_per_buffer,
        config_.min_duration_sec,
        config_.warmup_ms
    );
    if (!audio_->initialize()) {
        std::cerr << "Failed to initialize audio capture" << std::endl;
        return false;
    }
    std::cout << "Audio capture initialized" << std::endl;

    // Ready cue: played once warm-up audio has actually arrived
    if (config_.beep) {
        cue_ = std::make_unique<CuePlayer>(1000, 200, config_.sample_rate);
        if (cue_->initialize()) {
            CuePlayer* cue = cue_.get();
            audio_->set_ready_callback([cue]() { cue->play(); });
        } else {
            std::cerr << "Cue tone disabled" << std::endl;
            cue_.reset();
        }
    }

    transport_ = std::make_shared<CurlTransport>();
    transcriber_ = make_transcriber(config_, transport_);
    std::cout << "Transcriber initialized (model: " << config_.model
              << ", language: " << config_.language << ")" << std::endl;

    corrector_ = std::make_unique<TextCorrector>(TextCorrector::compile_rules(config_.correction_rules));
    std::cout << "Loaded " << corrector_->rule_count() << " correction rule(s)" << std::endl;

    delivery_ = std::make_unique<ClipboardDelivery>(config_.auto_paste, config_.paste_delay_ms);
    notifier_ = std::make_unique<TrayNotifier>(std::chrono::seconds(config_.status_clear_sec));

    controller_ = std::make_unique<SessionController>(
        *audio_, *transcriber_, *corrector_, *delivery_, *notifier_);

    // Initialize hotkey manager
    uint32_t keycode = 0;
    if (!HotkeyManager::resolve_key(config_.record_key, keycode)) {
        std::cerr << "Unknown hotkey: " << config_.record_key << std::endl;
        return false;
    }
    hotkey_ = std::make_unique<HotkeyManager>();
    hotkey_->set_hotkey(keycode);
    SessionController* controller = controller_.get();
    hotkey_->set_callback([controller](bool pressed) { controller->on_hotkey(pressed); });
    hotkey_->set_quit_callback([this]() { quit(); });
    std::cout << "Hotkey manager initialized" << std::endl;

    return true;
}

void App::shutdown() {
    should_quit_.store(true);

    // Stop event intake first, then let an in-flight session finish
    if (hotkey_) {
        hotkey_->stop();
        hotkey_.reset();
    }

    controller_.reset();
    notifier_.reset();
    delivery_.reset();
    corrector_.reset();
    transcriber_.reset();
    transport_.reset();

    if (audio_) {
        audio_->shutdown();
        audio_.reset();
    }

    if (cue_) {
        cue_->shutdown();
        cue_.reset();
    }

    instance_lock_.reset();
}

int App::run() {
    if (!hotkey_->start()) {
        std::cerr << "Failed to start hotkey listener" << std::endl;
        return 1;
    }

    std::cout << "\n=== talkpaste ready ===" << std::endl;
    std::cout << "Hold " << config_.record_key << " to record (start speaking after the beep), "
              << "release to transcribe and paste." << std::endl;
    std::cout << "Press Ctrl+Shift+Q or Ctrl+C to quit.\n" << std::endl;

    while (!should_quit_.load() && hotkey_->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    return should_quit_.load() ? 0 : 1;
}

SessionState App::state() const {
    return controller_ ? controller_->state() : SessionState::Idle;
}

} // namespace talkpaste
