#include "builtin_tools.hpp"
#include "../datetime_utils.hpp"
#include "../log.hpp"

namespace zenbot {

void register_list_reminders_tool(Toolbox& box, std::shared_ptr<ReminderStore> store) {
    ToolDef def;
    def.name = "list_reminders";
    def.description = "Tool to list all active reminders when the user asks what reminders they have.";
    def.user_message = "Fetching your reminders...";
    def.parameters = {
        {"type", "object"},
        {"properties", nlohmann::json::object()}
    };

    def.func = [store](const nlohmann::json&) -> nlohmann::json {
        auto reminders = store->list_active(false);
        if (reminders.empty()) {
            return {
                {"success", true},
                {"count", 0},
                {"message", "You don't have any active reminders."},
                {"reminders", nlohmann::json::array()}
            };
        }

        nlohmann::json items = nlohmann::json::array();
        std::string lines;
        int n = 0;
        for (auto& r : reminders) {
            n++;
            std::string when_human = format_reminder_when(r.when);
            items.push_back({
                {"number", n},
                {"task", r.task},
                {"when", r.when},
                {"when_human", when_human},
                {"id", r.id},
                {"created_at", r.created_at},
                {"notes", r.notes ? nlohmann::json(*r.notes) : nlohmann::json(nullptr)}
            });
            if (!lines.empty()) lines += "\n";
            lines += std::to_string(n) + ". **" + r.task + "** \xE2\x80\x93 " + when_human;
        }
        ZENBOT_LOG_DEBUG("tool", "list_reminders: " + std::to_string(n) + " active");

        return {
            {"success", true},
            {"count", n},
            {"reminders", items},
            {"summary", "You have " + std::to_string(n) + " reminder(s):\n\n" + lines}
        };
    };

    box.register_tool(std::move(def));
}

} // namespace zenbot
