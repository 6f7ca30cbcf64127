#include <iostream>
#include <string>
#include <vector>
#include "chat_cmd.hpp"
#include "reminders_cmd.hpp"

static void print_usage() {
    std::cout << "Usage: zenbot [command] [options]\n\n"
              << "Commands:\n"
              << "  chat [-m MSG] [--model MODEL] [--config PATH] [--debug]\n"
              << "                              Interactive session (default), or one message with -m\n"
              << "  reminders list [--all]      Show stored reminders\n"
              << "  reminders remove <id>       Delete a reminder\n"
              << "  help                        Show this message\n";
}

static int run_chat(const std::vector<std::string>& args) {
    zenbot::ChatOptions opts;
    for (size_t i = 0; i < args.size(); i++) {
        if ((args[i] == "-m" || args[i] == "--message") && i + 1 < args.size()) {
            opts.message = args[++i];
        } else if (args[i] == "--model" && i + 1 < args.size()) {
            opts.model = args[++i];
        } else if (args[i] == "--config" && i + 1 < args.size()) {
            opts.config_path = args[++i];
        } else if (args[i] == "--debug") {
            opts.debug = true;
        } else {
            std::cerr << "Unknown option: " << args[i] << "\n";
            print_usage();
            return 1;
        }
    }
    return zenbot::cmd_chat(opts);
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (!args.empty() && (args[0] == "-h" || args[0] == "--help")) {
        print_usage();
        return 0;
    }
    if (args.empty() || args[0].rfind("-", 0) == 0) {
        return run_chat(args);
    }

    std::string cmd = args[0];
    args.erase(args.begin());

    if (cmd == "chat") {
        return run_chat(args);
    }
    else if (cmd == "reminders") {
        return zenbot::cmd_reminders(args);
    }
    else if (cmd == "help") {
        print_usage();
        return 0;
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
