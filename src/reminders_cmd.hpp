#pragma once
#include <string>
#include <vector>

namespace zenbot {

// zenbot reminders list [--all] | remove <id>   (each accepts --config PATH)
int cmd_reminders(const std::vector<std::string>& args);

} // namespace zenbot
