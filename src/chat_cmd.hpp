#pragma once
#include <string>

namespace zenbot {

struct ChatOptions {
    std::string config_path;    // empty: ~/.zenbot/config.json
    std::string model;          // overrides llm.model when set
    bool debug = false;
    std::string message;        // single-shot mode when set
};

int cmd_chat(const ChatOptions& opts);

} // namespace zenbot
