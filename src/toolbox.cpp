#include "toolbox.hpp"
#include "log.hpp"
#include "schema.hpp"
#include <stdexcept>

namespace zenbot {

void Toolbox::register_tool(ToolDef def) {
    if (def.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (tools_.count(def.name)) {
        throw std::invalid_argument("Tool already registered: " + def.name);
    }
    def.parameters = normalize_parameters_schema(std::move(def.parameters));
    std::string name = def.name;
    tools_.emplace(std::move(name), std::move(def));
    spec_dirty_ = true;
}

const ToolDef* Toolbox::get_tool(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second;
}

nlohmann::json Toolbox::run_tool(const std::string& name, const nlohmann::json& raw_args) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return {{"error", "Tool not found: " + name}};
    }
    const ToolDef& def = it->second;

    nlohmann::json args = raw_args.is_null() ? nlohmann::json::object() : raw_args;
    auto problems = validate_schema(def.parameters, args);
    if (!problems.empty()) {
        return {{"error", "Invalid arguments"}, {"details", problems}};
    }
    if (!def.func) {
        return {{"error", "Tool has no implementation: " + name}};
    }

    try {
        return def.func(args);
    } catch (const std::exception& e) {
        ZENBOT_LOG_WARN("tool", name + " failed: " + e.what());
        return {{"error", std::string(e.what())}};
    }
}

nlohmann::json Toolbox::tools_spec() const {
    if (!spec_dirty_) return cached_spec_;
    nlohmann::json arr = nlohmann::json::array();
    for (auto& [name, def] : tools_) {
        arr.push_back({
            {"type", "function"},
            {"function", {
                {"name", def.name},
                {"description", def.description},
                {"parameters", def.parameters}
            }}
        });
    }
    cached_spec_ = std::move(arr);
    spec_dirty_ = false;
    return cached_spec_;
}

std::vector<std::string> Toolbox::tool_names() const {
    std::vector<std::string> names;
    for (auto& [n, _] : tools_) names.push_back(n);
    return names;
}

} // namespace zenbot
