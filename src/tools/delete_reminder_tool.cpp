#include "builtin_tools.hpp"
#include "structured_output.hpp"
#include "../datetime_utils.hpp"
#include "../log.hpp"
#include "../utils.hpp"

namespace zenbot {

static const char* const kMatchPrompt =
    "You match a user's deletion request to a specific reminder. "
    "Analyze the user's request and the list of available reminders, "
    "then return the exact ID of the reminder they want to delete. "
    "Return ONLY JSON matching the schema with reminder_id, confidence, and optional reason.";

static const char* const kDeletedPrompt =
    "Generate a short confirmation message for a deleted reminder. "
    "Return ONLY JSON matching the schema with confirmation_message.";

static nlohmann::json match_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"reminder_id", {{"type", "string"}, {"minLength", 1},
                             {"description", "The exact ID of the reminder that matches the request."}}},
            {"confidence", {{"type", "string"},
                            {"description", "Confidence of the match: 'high', 'medium', or 'low'."}}},
            {"reason", {{"type", nlohmann::json::array({"string", "null"})}}}
        }},
        {"required", nlohmann::json::array({"reminder_id"})}
    };
}

static nlohmann::json confirmation_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"confirmation_message", {{"type", "string"}, {"minLength", 1}}}
        }},
        {"required", nlohmann::json::array({"confirmation_message"})}
    };
}

// Drops reminders whose time has already passed. Failures are logged only.
static void cleanup_past_reminders(ReminderStore& store) {
    try {
        int removed = 0;
        for (auto& r : store.list_active(false)) {
            if (is_datetime_past(r.when) && store.remove(r.id)) removed++;
        }
        if (removed) ZENBOT_LOG_INFO("tool", "delete_reminder: cleaned up " + std::to_string(removed) + " past reminder(s)");
    } catch (const std::exception& e) {
        ZENBOT_LOG_WARN("tool", std::string("delete_reminder: cleanup failed: ") + e.what());
    }
}

void register_delete_reminder_tool(Toolbox& box, std::shared_ptr<ReminderStore> store,
                                   ChatBackend& backend, const LlmConfig& llm) {
    ToolDef def;
    def.name = "delete_reminder";
    def.description = "Tool to delete an existing reminder when the user asks to remove or cancel one. "
                      "Examples: 'Delete my water reminder', 'Cancel reminder number 2'";
    def.user_message = "Deleting your reminder...";
    def.parameters = {
        {"type", "object"},
        {"properties", {
            {"request", {
                {"type", "string"},
                {"minLength", 1},
                {"description", "The user's deletion request describing which reminder to delete. "
                                "Can reference the task, time, or position in the list."}
            }}
        }},
        {"required", nlohmann::json::array({"request"})}
    };

    ChatBackend* chat = &backend;
    def.func = [store, chat, llm](const nlohmann::json& args) -> nlohmann::json {
        std::string request = args["request"].get<std::string>();

        auto reminders = store->list_active(false);
        if (reminders.empty()) {
            return {{"error", "You don't have any active reminders to delete."}};
        }

        std::string context = "Available reminders:\n";
        int n = 0;
        for (auto& r : reminders) {
            context += std::to_string(++n) + ". ID: " + r.id + ", Task: " + r.task + ", When: " + r.when;
            if (r.notes) context += ", Notes: " + *r.notes;
            context += "\n";
        }

        auto match = chat_structured(*chat, llm,
                                     {Message::system(kMatchPrompt),
                                      Message::user(context + "\nUser request: " + request)},
                                     match_schema());
        if (!match) {
            ZENBOT_LOG_WARN("tool", "delete_reminder: no match");
            return {{"error", "Could not identify which reminder you want to delete. Please be more specific."}};
        }

        std::string id = trim((*match)["reminder_id"].get<std::string>());
        std::optional<Reminder> target;
        if (!id.empty()) target = store->get_by_id(id);
        if (!target) {
            ZENBOT_LOG_WARN("tool", "delete_reminder: matched id not found: " + id);
            return {{"error", "The matched reminder could not be found in the database."}};
        }

        try {
            if (!store->remove(target->id)) {
                return {{"error", "Failed to delete the reminder from the database."}};
            }
        } catch (const std::exception& e) {
            ZENBOT_LOG_ERROR("tool", std::string("delete_reminder: delete failed: ") + e.what());
            return {{"error", std::string("Could not delete reminder due to error: ") + e.what()}};
        }

        cleanup_past_reminders(*store);

        std::string confirmation = "Reminder deleted: " + target->task + " (" + target->when + ").";
        try {
            auto reply = chat_structured(*chat, llm,
                                         {Message::system(kDeletedPrompt),
                                          Message::user("Deleted reminder - Task: " + target->task +
                                                        ", When: " + target->when)},
                                         confirmation_schema());
            if (reply) {
                std::string text = trim((*reply)["confirmation_message"].get<std::string>());
                if (!text.empty()) confirmation = text;
            }
        } catch (const std::exception& e) {
            ZENBOT_LOG_WARN("tool", std::string("delete_reminder: confirmation fallback: ") + e.what());
        }

        return {
            {"success", true},
            {"confirmation", confirmation},
            {"deleted_reminder", {
                {"task", target->task},
                {"when", target->when},
                {"id", target->id}
            }}
        };
    };

    box.register_tool(std::move(def));
}

} // namespace zenbot
