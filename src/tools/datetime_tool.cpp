#include "builtin_tools.hpp"
#include "../datetime_utils.hpp"
#include <chrono>

namespace zenbot {

void register_datetime_tool(Toolbox& box) {
    ToolDef def;
    def.name = "datetime";
    def.description = "Get the current local date and time. Use this whenever the user asks "
                      "what day or time it is, or when an answer depends on today's date.";
    def.user_message = "Checking current date and time...";
    def.parameters = {
        {"type", "object"},
        {"properties", nlohmann::json::object()}
    };

    def.func = [](const nlohmann::json&) -> nlohmann::json {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        double timestamp = std::chrono::duration<double>(now.time_since_epoch()).count();
        return {
            {"iso", local_iso_timestamp(t)},
            {"date", format_local(t, "%Y-%m-%d")},
            {"time", format_local(t, "%H:%M:%S")},
            {"timestamp", timestamp},
            {"timezone", format_local(t, "%Z")}
        };
    };

    box.register_tool(std::move(def));
}

} // namespace zenbot
