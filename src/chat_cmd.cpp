#include "chat_cmd.hpp"
#include "agent.hpp"
#include "channels/terminal_channel.hpp"
#include "config.hpp"
#include "log.hpp"
#include "provider.hpp"
#include "reminder_runner.hpp"
#include "reminder_store.hpp"
#include "system_prompt.hpp"
#include "tools/builtin_tools.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>

namespace zenbot {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

static bool load_config(const ChatOptions& opts, Config& cfg) {
    try {
        cfg = Config::load(opts.config_path.empty() ? default_config_path() : opts.config_path);
        if (!opts.model.empty()) cfg.llm.model = opts.model;
        if (opts.debug) cfg.agent.debug = true;
        cfg.validate();
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return false;
    }
    return true;
}

int cmd_chat(const ChatOptions& opts) {
    Config cfg;
    if (!load_config(opts, cfg)) return 1;
    Logger::get().set_level(cfg.agent.debug ? LogLevel::debug : LogLevel::info);

    std::shared_ptr<ReminderStore> store;
    try {
        store = std::make_shared<ReminderStore>(cfg.database_path());
    } catch (const std::exception& e) {
        std::cerr << "Cannot open reminder database: " << e.what() << "\n";
        return 1;
    }

    OllamaProvider provider(cfg.llm.api_base);
    TerminalChannel terminal;
    Agent agent(cfg, provider, terminal,
                load_system_prompt(cfg.system_prompt_path(), cfg.default_system_prompt_path()));
    register_builtin_tools(agent.toolbox(), store, provider, cfg.llm);

    if (!opts.message.empty()) {
        agent.enqueue_event(Event::user_message(opts.message));
        agent.process_all_queued_events();
        return 0;
    }

    g_running = true;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ReminderRunner runner(*store, [&agent](Event e) { agent.enqueue_event(std::move(e)); },
                          cfg.agent.reminder_poll_seconds);
    runner.start();

    ChannelHooks hooks;
    hooks.enqueue = [&agent](Event e) { agent.enqueue_event(std::move(e)); };
    hooks.is_busy = [&agent] { return agent.is_busy(); };
    hooks.request_stop = [] { g_running = false; };

    ZENBOT_LOG_INFO("zenbot", "Ready. Type a message, or 'exit' to quit.");
    terminal.start(std::move(hooks));

    while (g_running) {
        if (agent.has_queued_events()) {
            agent.process_all_queued_events();
        } else {
            agent.queue().wait_for(std::chrono::milliseconds(50));
        }
    }

    ZENBOT_LOG_DEBUG("zenbot", "shutting down");
    terminal.stop();
    runner.stop();
    agent.process_all_queued_events();
    ZENBOT_LOG_DEBUG("zenbot", "done");
    return 0;
}

} // namespace zenbot
