#include "builtin_tools.hpp"

namespace zenbot {

void register_builtin_tools(Toolbox& box, std::shared_ptr<ReminderStore> store,
                            ChatBackend& backend, const LlmConfig& llm) {
    register_datetime_tool(box);
    register_set_reminder_tool(box, store, backend, llm);
    register_list_reminders_tool(box, store);
    register_delete_reminder_tool(box, store, backend, llm);
}

} // namespace zenbot
