#pragma once
#include <string>

namespace zenbot {

extern const char* const kFallbackSystemPrompt;

// First non-empty file wins: override_path, then default_path. Falls back to
// a generic assistant prompt when neither has content.
std::string load_system_prompt(const std::string& override_path, const std::string& default_path);

} // namespace zenbot
