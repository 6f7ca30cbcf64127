#include "system_prompt.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace zenbot {

const char* const kFallbackSystemPrompt = "You are a helpful AI assistant.";

std::string load_system_prompt(const std::string& override_path, const std::string& default_path) {
    for (auto& path : {override_path, default_path}) {
        if (path.empty()) continue;
        std::string text = trim(read_file(path));
        if (!text.empty()) {
            ZENBOT_LOG_DEBUG("prompt", "system prompt loaded from " + path);
            return text;
        }
    }
    ZENBOT_LOG_DEBUG("prompt", "no system prompt file found, using built-in prompt");
    return kFallbackSystemPrompt;
}

} // namespace zenbot
