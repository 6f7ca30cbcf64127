#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zenbot {

using ToolFunction = std::function<nlohmann::json(const nlohmann::json&)>;

struct ToolDef {
    std::string name;
    std::string description;
    std::string user_message;   // status line shown while the tool runs
    nlohmann::json parameters;  // JSON schema of the arguments object
    ToolFunction func;
};

class Toolbox {
public:
    // Throws std::invalid_argument on a duplicate or empty name.
    void register_tool(ToolDef def);

    const ToolDef* get_tool(const std::string& name) const;

    bool has(const std::string& name) const {
        return tools_.count(name) > 0;
    }

    // Validates args and runs the tool. Failures come back as {"error": ...};
    // this never throws.
    nlohmann::json run_tool(const std::string& name, const nlohmann::json& raw_args) const;

    nlohmann::json tools_spec() const;

    std::vector<std::string> tool_names() const;

private:
    std::map<std::string, ToolDef> tools_;
    mutable nlohmann::json cached_spec_;
    mutable bool spec_dirty_ = true;
};

} // namespace zenbot
