#pragma once
#include "message.hpp"
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zenbot {

struct PendingToolCall {
    std::string name;
    nlohmann::json args;
};

struct ToolResultRecord {
    std::string name;
    nlohmann::json args;
    nlohmann::json result;
};

// Scratch data for one conversational turn. Owned by the Agent, cleared on
// every Cleanup and on step-limit recovery.
struct Turn {
    std::string user_text;
    std::string assistant_text;
    std::optional<nlohmann::json> reminder_payload;
    bool assistant_already_emitted = false;
    std::deque<PendingToolCall> pending_tool_calls;
    std::vector<ToolResultRecord> tool_results;
    std::vector<Message> working_messages;

    void reset() { *this = Turn{}; }

    bool empty() const {
        return user_text.empty() && assistant_text.empty() && !reminder_payload &&
               !assistant_already_emitted && pending_tool_calls.empty() &&
               tool_results.empty() && working_messages.empty();
    }
};

} // namespace zenbot
