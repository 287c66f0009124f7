#pragma once

#include "config.hpp"
#include "portaudio_capture.hpp"
#include "cue_player.hpp"
#include "transcriber.hpp"
#include "text_corrector.hpp"
#include "hotkey_manager.hpp"
#include "delivery.hpp"
#include "notifier.hpp"
#include "session_controller.hpp"
#include "instance_lock.hpp"

#include <memory>
#include <atomic>

namespace talkpaste {

class App {
public:
    App();
    ~App();

    // Initialize all components
    bool initialize(const Config& config);
    void shutdown();

    // Run the application (blocking)
    int run();

    // Stop the application
    void quit() { should_quit_.store(true); }

    SessionState state() const;

private:
    Config config_;

    std::unique_ptr<InstanceLock> instance_lock_;
    std::unique_ptr<PortAudioCapture> audio_;
    std::unique_ptr<CuePlayer> cue_;
    std::shared_ptr<HttpTransport> transport_;
    std::unique_ptr<Transcriber> transcriber_;
    std::unique_ptr<TextCorrector> corrector_;
    std::unique_ptr<DeliveryGateway> delivery_;
    std::unique_ptr<TrayNotifier> notifier_;
    std::unique_ptr<SessionController> controller_;
    std::unique_ptr<HotkeyManager> hotkey_;

    std::atomic<bool> should_quit_{false};
};

// Build a Transcriber for the config (used by the app and by --check-key)
std::unique_ptr<Transcriber> make_transcriber(const Config& config,
                                              std::shared_ptr<HttpTransport> transport);

} // namespace talkpaste
