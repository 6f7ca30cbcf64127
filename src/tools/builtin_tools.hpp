#pragma once
#include "../config.hpp"
#include "../provider.hpp"
#include "../reminder_store.hpp"
#include "../toolbox.hpp"
#include <memory>

namespace zenbot {

void register_datetime_tool(Toolbox& box);
void register_set_reminder_tool(Toolbox& box, std::shared_ptr<ReminderStore> store,
                                ChatBackend& backend, const LlmConfig& llm);
void register_list_reminders_tool(Toolbox& box, std::shared_ptr<ReminderStore> store);
void register_delete_reminder_tool(Toolbox& box, std::shared_ptr<ReminderStore> store,
                                   ChatBackend& backend, const LlmConfig& llm);

// All of the above, sharing one store.
void register_builtin_tools(Toolbox& box, std::shared_ptr<ReminderStore> store,
                            ChatBackend& backend, const LlmConfig& llm);

} // namespace zenbot
