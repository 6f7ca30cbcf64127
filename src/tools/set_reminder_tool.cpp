#include "builtin_tools.hpp"
#include "structured_output.hpp"
#include "../datetime_utils.hpp"
#include "../log.hpp"
#include "../utils.hpp"

namespace zenbot {

static const char* const kExtractPrompt =
    "You extract reminder request data. Return ONLY JSON that matches the provided schema. "
    "Do not include markdown, explanations, or extra keys. "
    "Extract the task, time, and intended_date exactly as the user specified. "
    "Do NOT perform any date calculations or conversions. "
    "Do NOT convert time to 24-hour format. "
    "CRITICAL: If the user does NOT explicitly mention a date/day (like 'tomorrow', 'friday', "
    "'next monday'), you MUST set intended_date to 'today'. Do NOT assume 'tomorrow'. "
    "Default to 'today' if unsure.";

static const char* const kConfirmPrompt =
    "You write one short, friendly confirmation for a reminder that was just set. "
    "Use the provided task, date, and time exactly as given. "
    "Do not change or infer a different date or time. "
    "If you mention relative timing (today/tomorrow), it must match the provided current date/time. "
    "Return ONLY JSON that matches the schema with confirmation_message.";

static nlohmann::json reminder_request_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"task", {{"type", "string"}, {"minLength", 1},
                      {"description", "The reminder task in plain language, such as 'take out the trash'."}}},
            {"time", {{"type", "string"}, {"minLength", 1},
                      {"description", "The reminder time exactly as written, e.g. '9:15', '3:45 PM', '14:30'."}}},
            {"intended_date", {{"type", "string"}, {"minLength", 1},
                               {"description", "'today', 'tomorrow' or a weekday name. Default to 'today'."}}},
            {"notes", {{"type", nlohmann::json::array({"string", "null"})},
                       {"description", "Optional extra note text relevant to the reminder."}}}
        }},
        {"required", nlohmann::json::array({"task", "time", "intended_date"})}
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

static std::string two_digits(int v) {
    return (v < 10 ? "0" : "") + std::to_string(v);
}

void register_set_reminder_tool(Toolbox& box, std::shared_ptr<ReminderStore> store,
                                ChatBackend& backend, const LlmConfig& llm) {
    ToolDef def;
    def.name = "set_reminder";
    def.description = "Tool to set or create a reminder for a task when user asks for a reminder to be "
                      "created. Examples: 'Remind me to drink water at 14:45', "
                      "'Remind me to do my homework tomorrow at 19:15'";
    def.user_message = "Setting your reminder...";
    def.parameters = {
        {"type", "object"},
        {"properties", {
            {"request", {
                {"type", "string"},
                {"minLength", 1},
                {"description", "The user's reminder request preserved exactly as stated, including "
                                "both the task and the timing."}
            }}
        }},
        {"required", nlohmann::json::array({"request"})}
    };

    ChatBackend* chat = &backend;
    def.func = [store, chat, llm](const nlohmann::json& args) -> nlohmann::json {
        std::string request = args["request"].get<std::string>();

        auto extracted = chat_structured(*chat, llm,
                                    {Message::system(kExtractPrompt), Message::user(request)},
                                    reminder_request_schema());
        if (!extracted) {
            ZENBOT_LOG_WARN("tool", "set_reminder: extraction failed");
            return {{"error", "Could not extract reminder details. Please specify: what to remind you about, "
                              "what time, and when (today, tomorrow, or a weekday)."}};
        }

        std::string task = trim((*extracted)["task"].get<std::string>());
        std::string time_text = (*extracted)["time"].get<std::string>();
        std::string date_text = (*extracted)["intended_date"].get<std::string>();
        std::optional<std::string> notes;
        if (extracted->contains("notes") && (*extracted)["notes"].is_string()) {
            notes = (*extracted)["notes"].get<std::string>();
        }

        auto hm = parse_time_string(time_text);
        if (!hm) {
            ZENBOT_LOG_WARN("tool", "set_reminder: cannot parse time '" + time_text + "'");
            return {{"error", "Could not parse time '" + time_text +
                              "'. Please use a format like '9:15', '9:15 AM', or '14:30'."}};
        }
        auto date = resolve_date_expression(date_text);
        if (!date) {
            ZENBOT_LOG_WARN("tool", "set_reminder: cannot resolve date '" + date_text + "'");
            return {{"error", "Could not interpret date '" + date_text +
                              "'. Use 'today', 'tomorrow', or a weekday name."}};
        }

        std::string due_iso = combine_date_and_time(*date, hm->first, hm->second);

        Reminder record;
        try {
            record = store->add(task, due_iso, notes);
        } catch (const std::exception& e) {
            ZENBOT_LOG_ERROR("tool", std::string("set_reminder: save failed: ") + e.what());
            return {{"error", std::string("Could not save reminder due to storage error: ") + e.what()}};
        }

        std::string date_dmy = format_date_dmy(*date);
        std::string hhmm = two_digits(hm->first) + ":" + two_digits(hm->second);
        std::string confirmation = "Reminder set: " + record.task + " on " + date_dmy + " at " + hhmm + ".";
        try {
            std::string details = "Current local date/time: " + prompt_time_context() + "\n" +
                                  "Task: " + record.task + "\n" +
                                  "Date: " + date_dmy + "\n" +
                                  "Time: " + hhmm;
            auto reply = chat_structured(*chat, llm,
                                         {Message::system(kConfirmPrompt), Message::user(details)},
                                         confirmation_schema());
            if (reply) {
                std::string text = trim((*reply)["confirmation_message"].get<std::string>());
                if (!text.empty()) confirmation = text;
            }
        } catch (const std::exception& e) {
            ZENBOT_LOG_WARN("tool", std::string("set_reminder: confirmation fallback: ") + e.what());
        }

        return {
            {"success", true},
            {"confirmation", confirmation},
            {"reminder_id", record.id},
            {"task", record.task},
            {"when", record.when}
        };
    };

    box.register_tool(std::move(def));
}

} // namespace zenbot
