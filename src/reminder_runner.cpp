#include "reminder_runner.hpp"
#include "datetime_utils.hpp"
#include "log.hpp"

namespace zenbot {

void ReminderRunner::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&ReminderRunner::run_loop, this);
    ZENBOT_LOG_DEBUG("reminder", "poller started, every " + std::to_string(poll_seconds_) + "s");
}

void ReminderRunner::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
}

int ReminderRunner::poll_once(std::time_t now) {
    int emitted = 0;
    for (auto& r : store_.list_active(false)) {
        auto due = parse_iso_datetime(r.when);
        if (!due) {
            ZENBOT_LOG_WARN("reminder", "unparsable time '" + r.when + "' for reminder " + r.id);
            continue;
        }
        if (*due > now) continue;
        if (!store_.mark_completed(r.id)) continue;

        nlohmann::json payload = {
            {"id", r.id},
            {"task", r.task},
            {"when", r.when},
            {"notes", r.notes ? nlohmann::json(*r.notes) : nlohmann::json(nullptr)}
        };
        ZENBOT_LOG_INFO("reminder", "due: " + r.task);
        on_due_(Event::reminder_due(std::move(payload)));
        emitted++;
    }
    return emitted;
}

void ReminderRunner::run_loop() {
    while (running_) {
        try {
            poll_once();
        } catch (const std::exception& e) {
            ZENBOT_LOG_ERROR("reminder", std::string("poll failed: ") + e.what());
        }
        for (int i = 0; i < poll_seconds_ * 10 && running_; i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}

} // namespace zenbot
