// Tests for the push-to-talk session state machine

#include "session_controller.hpp"
#include "wav_encoder.hpp"
#include "fakes.hpp"
#include <iostream>
#include <cassert>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>

using namespace talkpaste;
using namespace talkpaste::testing;

static const std::chrono::milliseconds kWait(5000);

// Full pipeline with fake edges
struct Harness {
    FakeCapture capture;
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    Transcriber transcriber{transport, "https://api.example.com/v1"};
    TextCorrector corrector{TextCorrector::compile_rules(Config().correction_rules)};
    RecordingDelivery delivery;
    RecordingNotifier notifier;
    SessionController controller{capture, transcriber, corrector, delivery, notifier};

    Harness() {
        transcriber.set_api_key("sk-test");
    }

    // Hold the key for `seconds` of audio
    void press_for(double seconds) {
        controller.key_down();
        capture.feed(seconds);
        controller.key_up();
    }
};

// Every session: Recording first, at most one Transcribing, exactly one terminal event last
static void check_sequences(const std::vector<StatusEvent>& events) {
    std::map<uint64_t, std::vector<SessionStatus>> by_session;
    uint64_t last_id = 0;
    for (const auto& e : events) {
        if (by_session.find(e.session_id) == by_session.end()) {
            // Sessions start in increasing id order
            assert(e.session_id > last_id);
            last_id = e.session_id;
        }
        by_session[e.session_id].push_back(e.status);
    }

    for (const auto& entry : by_session) {
        const auto& seq = entry.second;
        assert(!seq.empty());
        assert(seq.front() == SessionStatus::Recording);
        assert(is_terminal(seq.back()));
        int terminals = 0;
        for (size_t i = 0; i < seq.size(); ++i) {
            if (is_terminal(seq[i])) ++terminals;
            if (seq[i] == SessionStatus::Transcribing) assert(i == 1);
        }
        assert(terminals == 1);
        assert(seq.size() <= 3);
    }
}

void test_dictation_delivered() {
    std::cout << "Testing a 3 second dictation is corrected and delivered..." << std::endl;

    Harness h;
    h.transport->respond(200, R"({"text": "n 8 n 測試"})");

    assert(h.controller.state() == SessionState::Idle);
    assert(h.controller.key_down());
    assert(h.controller.state() == SessionState::Recording);
    h.capture.feed(3.0);
    assert(h.controller.key_up());

    assert(h.controller.wait_idle(kWait));
    assert(h.controller.state() == SessionState::Idle);

    auto delivered = h.delivery.delivered();
    assert(delivered.size() == 1);
    assert(delivered[0] == "n8n 測試");

    std::vector<SessionStatus> expected = {
        SessionStatus::Recording, SessionStatus::Transcribing, SessionStatus::Delivered};
    assert(h.notifier.statuses() == expected);
    assert(h.notifier.events().back().message == "n8n 測試");

    // Exactly one upload, carrying the whole recording
    assert(h.transport->calls() == 1);
    HttpRequest request = h.transport->last_request();
    const std::string& file = request.fields[0].value;
    std::vector<uint8_t> payload(file.begin(), file.end());
    WavInfo info;
    std::string error;
    assert(decode_wav(payload, info, error));
    assert(info.samples.size() == 48000);

    std::cout << "  PASS" << std::endl;
}

void test_short_press_ignored() {
    std::cout << "Testing a short press makes no request..." << std::endl;

    Harness h;
    h.controller.key_down();
    h.capture.feed(0.2);
    assert(h.controller.key_up());

    // Back to Idle synchronously
    assert(h.controller.state() == SessionState::Idle);
    assert(h.transport->calls() == 0);
    assert(h.delivery.delivered().empty());

    std::vector<SessionStatus> expected = {SessionStatus::Recording, SessionStatus::TooShort};
    assert(h.notifier.statuses() == expected);

    std::cout << "  PASS" << std::endl;
}

void test_auth_failure() {
    std::cout << "Testing 401 reports an auth failure and pastes nothing..." << std::endl;

    Harness h;
    h.transport->respond(401, R"({"error": {"message": "Incorrect API key provided"}})");
    h.press_for(2.0);
    assert(h.controller.wait_idle(kWait));

    assert(h.delivery.delivered().empty());
    auto events = h.notifier.events();
    assert(events.size() == 3);
    assert(events[2].status == SessionStatus::Failed);
    assert(events[2].error == SessionError::AuthFailure);

    std::cout << "  PASS" << std::endl;
}

void test_empty_transcript() {
    std::cout << "Testing an empty transcript is not delivered..." << std::endl;

    Harness h;
    h.transport->respond(200, R"({"text": ""})");
    h.press_for(1.0);
    assert(h.controller.wait_idle(kWait));

    assert(h.delivery.delivered().empty());
    assert(h.notifier.statuses().back() == SessionStatus::Empty);

    // Corrections that leave only whitespace count as empty too
    h.transport->respond(200, R"({"text": "   "})");
    h.press_for(1.0);
    assert(h.controller.wait_idle(kWait));
    assert(h.delivery.delivered().empty());
    assert(h.notifier.statuses().back() == SessionStatus::Empty);

    std::cout << "  PASS" << std::endl;
}

void test_error_kinds_forwarded() {
    std::cout << "Testing transcription failures map to session errors..." << std::endl;

    Harness h;

    h.transport->respond(429, "");
    h.press_for(1.0);
    assert(h.controller.wait_idle(kWait));
    assert(h.notifier.events().back().error == SessionError::RateLimited);

    h.transport->respond(500, "");
    h.press_for(1.0);
    assert(h.controller.wait_idle(kWait));
    assert(h.notifier.events().back().error == SessionError::ServerError);

    h.transport->fail(TransportError::Timeout, "timed out");
    h.press_for(1.0);
    assert(h.controller.wait_idle(kWait));
    assert(h.notifier.events().back().error == SessionError::NetworkTimeout);

    h.transport->respond(413, "");
    h.press_for(1.0);
    assert(h.controller.wait_idle(kWait));
    assert(h.notifier.events().back().error == SessionError::PayloadTooLarge);

    assert(h.delivery.delivered().empty());
    check_sequences(h.notifier.events());

    std::cout << "  PASS" << std::endl;
}

void test_delivery_failure() {
    std::cout << "Testing a failed paste is reported..." << std::endl;

    Harness h;
    h.transport->respond(200, R"({"text": "hello"})");
    h.delivery.succeed = false;
    h.press_for(1.0);
    assert(h.controller.wait_idle(kWait));

    auto events = h.notifier.events();
    assert(events.back().status == SessionStatus::Failed);
    assert(events.back().error == SessionError::DeliveryFailed);
    assert(h.controller.state() == SessionState::Idle);

    std::cout << "  PASS" << std::endl;
}

void test_device_unavailable() {
    std::cout << "Testing an unavailable microphone..." << std::endl;

    Harness h;
    h.capture.device_available = false;
    assert(!h.controller.key_down());
    assert(h.controller.state() == SessionState::Idle);
    assert(!h.controller.key_up());

    auto events = h.notifier.events();
    assert(events.size() == 2);
    assert(events[0].status == SessionStatus::Recording);
    assert(events[1].status == SessionStatus::Failed);
    assert(events[1].error == SessionError::DeviceUnavailable);
    assert(h.transport->calls() == 0);

    // The next press works once the device is back
    h.capture.device_available = true;
    h.transport->respond(200, R"({"text": "back"})");
    h.press_for(1.0);
    assert(h.controller.wait_idle(kWait));
    assert(h.delivery.delivered().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_reentrant_presses_ignored() {
    std::cout << "Testing presses during an active session are ignored..." << std::endl;

    Harness h;
    h.transport->respond(200, R"({"text": "first"})");
    h.transport->hold();

    assert(h.controller.key_down());
    assert(!h.controller.key_down());   // auto-repeat
    h.capture.feed(1.0);
    assert(h.controller.key_up());
    assert(!h.controller.key_up());

    assert(h.transport->wait_for_request(kWait));
    assert(h.controller.state() == SessionState::Transcribing);

    // Press and release while the upload is in flight
    assert(!h.controller.key_down());
    assert(!h.controller.key_up());
    assert(h.controller.state() == SessionState::Transcribing);
    assert(h.notifier.statuses().size() == 2);
    assert(h.capture.opens == 1);

    h.transport->release();
    assert(h.controller.wait_idle(kWait));

    assert(h.transport->calls() == 1);
    assert(h.delivery.delivered().size() == 1);
    assert(h.notifier.violations() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_random_event_sequences() {
    std::cout << "Testing random hotkey sequences keep one active session..." << std::endl;

    Harness h;
    h.transport->respond(200, R"({"text": "N8n ok"})");

    std::mt19937 rng(20261019);
    std::uniform_int_distribution<int> op(0, 3);
    std::uniform_int_distribution<int> tenths(1, 10);

    for (int i = 0; i < 600; ++i) {
        switch (op(rng)) {
            case 0:
                h.controller.key_down();
                break;
            case 1:
                h.controller.key_up();
                break;
            case 2:
                h.capture.feed(tenths(rng) / 10.0);
                break;
            case 3:
                h.controller.wait_idle(std::chrono::milliseconds(1));
                break;
        }
        assert(h.notifier.violations() == 0);
        if (h.controller.state() == SessionState::Recording) {
            assert(h.notifier.active_session() == h.controller.session().id);
        }
    }

    h.controller.key_up();
    assert(h.controller.wait_idle(kWait));
    assert(h.notifier.violations() == 0);
    assert(h.notifier.active_session() == 0);

    auto events = h.notifier.events();
    check_sequences(events);

    // Every delivered session pasted the corrected text exactly once
    size_t delivered_events = 0;
    for (const auto& e : events) {
        if (e.status == SessionStatus::Delivered) ++delivered_events;
    }
    auto delivered = h.delivery.delivered();
    assert(delivered.size() == delivered_events);
    for (const auto& text : delivered) {
        assert(text == "n8n ok");
    }
    assert(h.transport->calls() == delivered_events);

    std::cout << "  PASS" << std::endl;
}

class ThrowingTranscriber : public Transcriber {
public:
    explicit ThrowingTranscriber(std::shared_ptr<HttpTransport> transport)
        : Transcriber(std::move(transport), "https://api.example.com/v1") {}

    TranscriptionResult transcribe(std::vector<uint8_t>) override {
        throw std::runtime_error("out of memory building request");
    }
};

void test_worker_exception_reported() {
    std::cout << "Testing an exception in the worker ends the session..." << std::endl;

    FakeCapture capture;
    ThrowingTranscriber transcriber(std::make_shared<FakeTransport>());
    TextCorrector corrector;
    RecordingDelivery delivery;
    RecordingNotifier notifier;
    SessionController controller(capture, transcriber, corrector, delivery, notifier);

    controller.key_down();
    capture.feed(1.0);
    controller.key_up();
    assert(controller.wait_idle(kWait));

    auto events = notifier.events();
    assert(events.back().status == SessionStatus::Failed);
    assert(events.back().error == SessionError::ServerError);
    assert(delivery.delivered().empty());

    std::cout << "  PASS" << std::endl;
}

void test_shutdown_while_recording() {
    std::cout << "Testing shutdown during a recording sends nothing..." << std::endl;

    FakeCapture capture;
    auto transport = std::make_shared<FakeTransport>();
    Transcriber transcriber(transport, "https://api.example.com/v1");
    transcriber.set_api_key("sk-test");
    TextCorrector corrector;
    RecordingDelivery delivery;
    RecordingNotifier notifier;

    {
        SessionController controller(capture, transcriber, corrector, delivery, notifier);
        controller.key_down();
        capture.feed(2.0);
    }

    assert(!capture.is_recording());
    assert(capture.closes == 1);
    assert(transport->calls() == 0);
    assert(delivery.delivered().empty());

    std::cout << "  PASS" << std::endl;
}

void test_hotkey_callback() {
    std::cout << "Testing hotkey callback drives the controller..." << std::endl;

    Harness h;
    h.transport->respond(200, R"({"text": "via hotkey"})");
    h.controller.on_hotkey(true);
    assert(h.controller.state() == SessionState::Recording);
    assert(h.controller.session().id == 1);
    h.capture.feed(1.0);
    h.controller.on_hotkey(false);
    assert(h.controller.wait_idle(kWait));
    assert(h.delivery.delivered().size() == 1);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Session Controller Test Suite ===" << std::endl << std::endl;

    test_dictation_delivered();
    test_short_press_ignored();
    test_auth_failure();
    test_empty_transcript();
    test_error_kinds_forwarded();
    test_delivery_failure();
    test_device_unavailable();
    test_reentrant_presses_ignored();
    test_random_event_sequences();
    test_worker_exception_reported();
    test_shutdown_while_recording();
    test_hotkey_callback();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
