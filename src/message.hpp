#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zenbot {

enum class Role {
    system,
    user,
    assistant,
    tool
};

inline const char* role_name(Role r) {
    switch (r) {
        case Role::system:    return "system";
        case Role::user:      return "user";
        case Role::assistant: return "assistant";
        case Role::tool:      return "tool";
    }
    return "user";
}

inline Role role_from_name(const std::string& s) {
    if (s == "system") return Role::system;
    if (s == "assistant") return Role::assistant;
    if (s == "tool") return Role::tool;
    return Role::user;
}

struct ToolCall {
    std::string name;
    nlohmann::json arguments;   // as received: an object, or a JSON-encoded string
};

struct Message {
    Role role = Role::user;
    std::string content;
    std::string tool_name;              // for role=tool
    std::vector<ToolCall> tool_calls;   // for role=assistant with tool calls

    static Message system(std::string text) { return {Role::system, std::move(text), "", {}}; }
    static Message user(std::string text) { return {Role::user, std::move(text), "", {}}; }
    static Message assistant(std::string text) { return {Role::assistant, std::move(text), "", {}}; }
    static Message tool(std::string name, std::string text) {
        return {Role::tool, std::move(text), std::move(name), {}};
    }

    bool has_tool_calls() const { return !tool_calls.empty(); }

    // Ollama /api/chat wire form.
    nlohmann::json to_json() const {
        nlohmann::json j;
        j["role"] = role_name(role);
        j["content"] = content;
        if (!tool_name.empty()) j["tool_name"] = tool_name;
        if (!tool_calls.empty()) {
            auto& arr = j["tool_calls"];
            arr = nlohmann::json::array();
            for (auto& tc : tool_calls) {
                nlohmann::json args = tc.arguments;
                if (args.is_string()) {
                    args = nlohmann::json::parse(args.get<std::string>(), nullptr, false);
                }
                if (!args.is_object()) args = nlohmann::json::object();
                arr.push_back({{"function", {{"name", tc.name}, {"arguments", args}}}});
            }
        }
        return j;
    }

    static Message from_json(const nlohmann::json& j) {
        Message m;
        m.role = role_from_name(j.value("role", "assistant"));
        if (j.contains("content") && j["content"].is_string()) {
            m.content = j["content"].get<std::string>();
        }
        m.tool_name = j.value("tool_name", "");
        if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
            for (auto& tc : j["tool_calls"]) {
                ToolCall t;
                if (tc.contains("function") && tc["function"].is_object()) {
                    auto& fn = tc["function"];
                    if (fn.contains("name") && fn["name"].is_string()) {
                        t.name = fn["name"].get<std::string>();
                    }
                    if (fn.contains("arguments")) t.arguments = fn["arguments"];
                }
                m.tool_calls.push_back(std::move(t));
            }
        }
        return m;
    }
};

} // namespace zenbot
