#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace zenbot {

struct LlmConfig {
    std::string model = "ministral-3:14b";
    bool stream = true;
    bool think = false;
    std::string api_base = "http://127.0.0.1:11434";
};

struct AgentConfig {
    int max_internal_steps = 8;
    int max_history_messages = 20;
    int reminder_poll_seconds = 30;
    bool debug = false;
};

struct Config {
    LlmConfig llm;
    AgentConfig agent;
    std::string home = "~/.zenbot";   // data root: database, system prompt files

    std::string home_path() const { return expand_path(home); }
    std::string database_path() const { return home_path() + "/data/zenbot.db"; }
    std::string system_prompt_path() const { return home_path() + "/system.md"; }
    std::string default_system_prompt_path() const { return home_path() + "/default_system.md"; }

    // Reads the file (defaults when it is missing), applies ZENBOT_* overrides
    // and validates. Throws on malformed JSON or invalid values.
    static Config load(const std::string& path);

    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);

    void apply_env_overrides();

    // Throws std::invalid_argument naming the offending setting.
    void validate() const;

    std::string summary() const;
};

// Accepts true/false, 1/0, yes/no (case-insensitive).
bool parse_bool(const std::string& text, const std::string& setting);

} // namespace zenbot
