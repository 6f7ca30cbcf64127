#pragma once
#include "event.hpp"
#include "reminder_store.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <functional>
#include <thread>

namespace zenbot {

using EventSink = std::function<void(Event)>;

// Background poller that turns due reminders into REMINDER_DUE events.
class ReminderRunner {
public:
    ReminderRunner(ReminderStore& store, EventSink on_due, int poll_seconds)
        : store_(store), on_due_(std::move(on_due)), poll_seconds_(poll_seconds) {}

    ~ReminderRunner() { stop(); }

    ReminderRunner(const ReminderRunner&) = delete;
    ReminderRunner& operator=(const ReminderRunner&) = delete;

    void start();
    void stop();
    bool running() const { return running_; }

    // One scan: marks each due reminder completed and emits it. Returns the
    // number of events emitted.
    int poll_once(std::time_t now = std::time(nullptr));

private:
    ReminderStore& store_;
    EventSink on_due_;
    int poll_seconds_;
    std::atomic<bool> running_{false};
    std::thread thread_;

    void run_loop();
};

} // namespace zenbot
