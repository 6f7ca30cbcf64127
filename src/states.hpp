#pragma once
#include "event.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace zenbot {

class Agent;

enum class StateKind {
    idle,
    generate,
    use_tools,
    task,
    cleanup
};

const char* state_kind_name(StateKind kind);

// A state handler. Concrete states carry no data; all turn data lives on the
// Agent, so each state exists once and is shared.
class State {
public:
    virtual ~State() = default;
    virtual StateKind kind() const = 0;
    virtual const char* name() const { return state_kind_name(kind()); }
    virtual State* handle(Agent& agent, const Event& event) = 0;
};

class IdleState : public State {
public:
    StateKind kind() const override { return StateKind::idle; }
    State* handle(Agent& agent, const Event& event) override;
};

class GenerateState : public State {
public:
    StateKind kind() const override { return StateKind::generate; }
    State* handle(Agent& agent, const Event& event) override;
};

class UseToolsState : public State {
public:
    StateKind kind() const override { return StateKind::use_tools; }
    State* handle(Agent& agent, const Event& event) override;
};

class TaskState : public State {
public:
    StateKind kind() const override { return StateKind::task; }
    State* handle(Agent& agent, const Event& event) override;
};

class CleanupState : public State {
public:
    StateKind kind() const override { return StateKind::cleanup; }
    State* handle(Agent& agent, const Event& event) override;
};

State& idle_state();
State& generate_state();
State& use_tools_state();
State& task_state();
State& cleanup_state();

extern const char* const kGenerateErrorText;
extern const char* const kReminderFallbackText;

// Object args pass through; a JSON-encoded string is decoded; anything else
// (or an undecodable string) becomes {}.
nlohmann::json safe_parse_args(const nlohmann::json& raw);

// The text a tool result can answer with directly, or "" when the result
// must go back to the model.
std::string direct_response_text(const std::string& tool_name, const nlohmann::json& result);

} // namespace zenbot
