#include "reminders_cmd.hpp"
#include "config.hpp"
#include "datetime_utils.hpp"
#include "reminder_store.hpp"
#include "utils.hpp"
#include <iostream>

namespace zenbot {

int cmd_reminders(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: zenbot reminders <list|remove> [options]\n";
        return 1;
    }

    std::string config_path = default_config_path();
    bool include_completed = false;
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_path = args[++i];
        } else if (args[i] == "--all") {
            include_completed = true;
        } else {
            positional.push_back(args[i]);
        }
    }
    if (positional.empty()) {
        std::cerr << "Usage: zenbot reminders <list|remove> [options]\n";
        return 1;
    }

    try {
        Config cfg = Config::load(config_path);
        ReminderStore store(cfg.database_path());
        const std::string& subcmd = positional[0];

        if (subcmd == "list") {
            auto reminders = store.list_active(include_completed);
            if (reminders.empty()) {
                std::cout << "No reminders.\n";
                return 0;
            }
            for (auto& r : reminders) {
                std::cout << r.id << "  " << format_reminder_when(r.when)
                          << "  " << r.task;
                if (r.notes) std::cout << "  (" << *r.notes << ")";
                if (r.completed) std::cout << "  [done]";
                std::cout << "\n";
            }
            return 0;
        }
        else if (subcmd == "remove") {
            if (positional.size() < 2) {
                std::cerr << "Usage: zenbot reminders remove <id>\n";
                return 1;
            }
            const std::string& id = positional[1];
            if (store.remove(id)) {
                std::cout << "Removed reminder: " << id << "\n";
                return 0;
            }
            std::cerr << "Reminder not found: " << id << "\n";
            return 1;
        }

        std::cerr << "Unknown reminders subcommand: " << subcmd << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace zenbot
