// Tests for the tray notifier and its self-clearing status message

#include "notifier.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace talkpaste;

static StatusEvent make_event(uint64_t id, SessionStatus status,
                              SessionError error = SessionError::None,
                              const std::string& message = "") {
    StatusEvent event;
    event.session_id = id;
    event.status = status;
    event.error = error;
    event.message = message;
    return event;
}

struct LineLog {
    std::mutex mutex;
    std::vector<std::string> lines;

    TrayNotifier::Sink sink() {
        return [this](const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex);
            lines.push_back(line);
        };
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return lines;
    }
};

void test_indicator_follows_session() {
    std::cout << "Testing indicator follows the session..." << std::endl;

    LineLog log;
    TrayNotifier tray(std::chrono::seconds(10), log.sink());
    assert(tray.indicator() == "Ready");

    tray.notify(make_event(1, SessionStatus::Recording));
    assert(tray.indicator() == "Recording...");

    tray.notify(make_event(1, SessionStatus::Transcribing));
    assert(tray.indicator() == "Transcribing...");
    assert(tray.message().empty());

    tray.notify(make_event(1, SessionStatus::Delivered, SessionError::None, "n8n 測試"));
    assert(tray.indicator() == "Ready");
    assert(tray.message() == "Pasted: n8n 測試");

    auto lines = log.snapshot();
    assert(lines.size() == 3);
    assert(lines[2] == "Ready - Pasted: n8n 測試");

    std::cout << "  PASS" << std::endl;
}

void test_terminal_messages() {
    std::cout << "Testing terminal status messages..." << std::endl;

    LineLog log;
    TrayNotifier tray(std::chrono::seconds(10), log.sink());

    tray.notify(make_event(1, SessionStatus::TooShort));
    assert(tray.message() == "Recording too short, ignored");

    tray.notify(make_event(2, SessionStatus::Empty));
    assert(tray.message() == "Nothing recognized");

    tray.notify(make_event(3, SessionStatus::Failed, SessionError::AuthFailure, "HTTP 401"));
    assert(tray.indicator() == "Ready");
    assert(tray.message() == "Error: invalid API key (HTTP 401)");

    tray.notify(make_event(4, SessionStatus::Failed, SessionError::DeviceUnavailable));
    assert(tray.message() == "Error: no audio input device");

    std::cout << "  PASS" << std::endl;
}

void test_message_clears_itself() {
    std::cout << "Testing status message clears after the delay..." << std::endl;

    LineLog log;
    TrayNotifier tray(std::chrono::milliseconds(50), log.sink());
    tray.notify(make_event(1, SessionStatus::Empty));
    assert(!tray.message().empty());

    for (int i = 0; i < 100 && !tray.message().empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(tray.message().empty());
    assert(tray.indicator() == "Ready");
    assert(log.snapshot().back() == "Ready");

    std::cout << "  PASS" << std::endl;
}

void test_new_session_cancels_clear() {
    std::cout << "Testing a new session supersedes a pending clear..." << std::endl;

    LineLog log;
    TrayNotifier tray(std::chrono::milliseconds(100), log.sink());
    tray.notify(make_event(1, SessionStatus::Delivered, SessionError::None, "first"));
    tray.notify(make_event(2, SessionStatus::Recording));

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    assert(tray.indicator() == "Recording...");
    assert(tray.message() == "Hold the key and speak");

    std::cout << "  PASS" << std::endl;
}

void test_deferred_task() {
    std::cout << "Testing deferred task cancel and reschedule..." << std::endl;

    DeferredTask task;
    std::atomic<int> first{0};
    std::atomic<int> second{0};

    task.schedule(std::chrono::milliseconds(50), [&first]() { ++first; });
    assert(task.pending());
    task.cancel();
    assert(!task.pending());

    task.schedule(std::chrono::milliseconds(50), [&first]() { ++first; });
    task.schedule(std::chrono::milliseconds(50), [&second]() { ++second; });

    for (int i = 0; i < 100 && second.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(first.load() == 0);
    assert(second.load() == 1);
    assert(!task.pending());

    std::cout << "  PASS" << std::endl;
}

void test_status_names() {
    std::cout << "Testing status and error names..." << std::endl;

    assert(is_terminal(SessionStatus::Delivered));
    assert(is_terminal(SessionStatus::Failed));
    assert(!is_terminal(SessionStatus::Recording));
    assert(!is_terminal(SessionStatus::Transcribing));
    assert(std::string(session_status_name(SessionStatus::TooShort)) == "too short");
    assert(std::string(session_error_name(SessionError::RateLimited)) == "rate limited, try again later");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Notifier Test Suite ===" << std::endl << std::endl;

    test_indicator_follows_session();
    test_terminal_messages();
    test_message_clears_itself();
    test_new_session_cancels_clear();
    test_deferred_task();
    test_status_names();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
