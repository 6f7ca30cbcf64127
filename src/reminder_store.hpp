#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zenbot {

struct Reminder {
    std::string id;
    std::string created_at;   // UTC ISO-8601
    std::string task;
    std::string when;         // ISO-8601 with offset
    std::optional<std::string> notes;
    bool completed = false;

    nlohmann::json to_json() const;
};

// SQLite-backed reminder table. Each call opens its own connection so the
// poller thread and the agent thread never share a handle.
class ReminderStore {
public:
    explicit ReminderStore(std::string db_path);

    ReminderStore(const ReminderStore&) = delete;
    ReminderStore& operator=(const ReminderStore&) = delete;

    // Throws std::invalid_argument on empty task/when and std::runtime_error
    // on storage failure.
    Reminder add(const std::string& task, const std::string& when,
                 const std::optional<std::string>& notes = std::nullopt);

    std::optional<Reminder> get_by_id(const std::string& id);

    // Newest first.
    std::vector<Reminder> list_active(bool include_completed = false);

    bool mark_completed(const std::string& id);
    bool remove(const std::string& id);

    const std::string& path() const { return db_path_; }

private:
    std::string db_path_;
    void init_db();
};

} // namespace zenbot
