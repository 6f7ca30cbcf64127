#include "config.hpp"
#include "log.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace zenbot {

bool parse_bool(const std::string& text, const std::string& setting) {
    std::string v = to_lower(trim(text));
    if (v == "true" || v == "1" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "no") return false;
    throw std::invalid_argument(setting + " must be a boolean (true/false/1/0/yes/no), got '" + text + "'");
}

static int parse_int(const std::string& text, const std::string& setting) {
    std::string v = trim(text);
    size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(v, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(setting + " must be an integer, got '" + text + "'");
    }
    if (used != v.size()) {
        throw std::invalid_argument(setting + " must be an integer, got '" + text + "'");
    }
    return out;
}

static const char* env_value(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["llm"] = {
        {"model", llm.model},
        {"stream", llm.stream},
        {"think", llm.think},
        {"api_base", llm.api_base}
    };
    j["agent"] = {
        {"max_internal_steps", agent.max_internal_steps},
        {"max_history_messages", agent.max_history_messages},
        {"reminder_poll_seconds", agent.reminder_poll_seconds},
        {"debug", agent.debug}
    };
    j["home"] = home;
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;
    if (!j.is_object()) {
        throw std::invalid_argument("config root must be a JSON object");
    }
    try {
        if (j.contains("llm")) {
            auto& l = j["llm"];
            c.llm.model = l.value("model", c.llm.model);
            c.llm.stream = l.value("stream", c.llm.stream);
            c.llm.think = l.value("think", c.llm.think);
            c.llm.api_base = l.value("api_base", c.llm.api_base);
        }
        if (j.contains("agent")) {
            auto& a = j["agent"];
            c.agent.max_internal_steps = a.value("max_internal_steps", c.agent.max_internal_steps);
            c.agent.max_history_messages = a.value("max_history_messages", c.agent.max_history_messages);
            c.agent.reminder_poll_seconds = a.value("reminder_poll_seconds", c.agent.reminder_poll_seconds);
            c.agent.debug = a.value("debug", c.agent.debug);
        }
        c.home = j.value("home", c.home);
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("config has a value of the wrong type: ") + e.what());
    }
    return c;
}

void Config::apply_env_overrides() {
    if (auto v = env_value("ZENBOT_MODEL")) llm.model = trim(v);
    if (auto v = env_value("ZENBOT_STREAM")) llm.stream = parse_bool(v, "ZENBOT_STREAM");
    if (auto v = env_value("ZENBOT_THINK")) llm.think = parse_bool(v, "ZENBOT_THINK");
    if (auto v = env_value("OLLAMA_BASE_URL")) llm.api_base = trim(v);
    if (auto v = env_value("ZENBOT_MAX_INTERNAL_STEPS"))
        agent.max_internal_steps = parse_int(v, "ZENBOT_MAX_INTERNAL_STEPS");
    if (auto v = env_value("ZENBOT_MAX_HISTORY_MESSAGES"))
        agent.max_history_messages = parse_int(v, "ZENBOT_MAX_HISTORY_MESSAGES");
    if (auto v = env_value("ZENBOT_REMINDER_POLL_SECONDS"))
        agent.reminder_poll_seconds = parse_int(v, "ZENBOT_REMINDER_POLL_SECONDS");
    if (auto v = env_value("ZENBOT_DEBUG")) agent.debug = parse_bool(v, "ZENBOT_DEBUG");
}

void Config::validate() const {
    if (trim(llm.model).empty()) {
        throw std::invalid_argument("llm.model must not be empty");
    }
    if (trim(llm.api_base).empty()) {
        throw std::invalid_argument("llm.api_base must not be empty");
    }
    if (agent.max_internal_steps <= 0) {
        throw std::invalid_argument("agent.max_internal_steps must be > 0");
    }
    if (agent.max_history_messages < 2) {
        throw std::invalid_argument("agent.max_history_messages must be >= 2");
    }
    if (agent.reminder_poll_seconds <= 0) {
        throw std::invalid_argument("agent.reminder_poll_seconds must be > 0");
    }
}

std::string Config::summary() const {
    return "model=" + llm.model +
           ", mode=" + (llm.stream ? "streaming" : "non-streaming") +
           ", debug=" + (agent.debug ? "true" : "false");
}

Config Config::load(const std::string& path) {
    Config c;
    std::ifstream f(path);
    if (f) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(f);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Failed to parse config " + path + ": " + e.what());
        }
        c = from_json(j);
    } else {
        ZENBOT_LOG_WARN("config", "no config file at " + path + ", using defaults");
    }
    c.apply_env_overrides();
    c.validate();
    ZENBOT_LOG_INFO("config", "Configuration loaded: " + c.summary());
    return c;
}

void Config::save(const std::string& path) const {
    fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    std::ofstream f(path);
    if (!f) {
        throw std::runtime_error("Cannot write config: " + path);
    }
    f << to_json().dump(2) << "\n";
}

} // namespace zenbot
