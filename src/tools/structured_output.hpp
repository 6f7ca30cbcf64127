#pragma once
#include "../config.hpp"
#include "../provider.hpp"
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace zenbot {

// Non-streaming chat constrained to a JSON schema. Returns the decoded
// object when it conforms, std::nullopt when the reply is unusable.
// Backend failures propagate as exceptions.
std::optional<nlohmann::json> chat_structured(ChatBackend& backend, const LlmConfig& llm,
                                              std::vector<Message> messages,
                                              const nlohmann::json& schema);

// Current local time for prompts, e.g. "2026-02-18 09:15:00 CET".
std::string prompt_time_context();

} // namespace zenbot
