#pragma once
#include "event.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace zenbot {

// Unbounded FIFO shared by producer threads and the single consumer loop.
class EventQueue {
public:
    void enqueue(Event event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    bool has_pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !events_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    std::optional<Event> take_one() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.empty()) return std::nullopt;
        Event e = std::move(events_.front());
        events_.pop_front();
        return e;
    }

    // Block until an event is available or the timeout elapses.
    bool wait_for(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return !events_.empty(); });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::deque<Event> events_;
};

} // namespace zenbot
