#include "structured_output.hpp"
#include "../datetime_utils.hpp"
#include "../log.hpp"
#include "../schema.hpp"
#include "../utils.hpp"
#include <ctime>

namespace zenbot {

// Models sometimes wrap JSON in a ```json fence despite the format hint.
static std::string strip_code_fence(const std::string& text) {
    std::string s = trim(text);
    if (s.compare(0, 3, "```") != 0) return s;
    size_t line_end = s.find('\n');
    if (line_end == std::string::npos) return s;
    size_t close = s.rfind("```");
    if (close == std::string::npos || close <= line_end) return s;
    return trim(s.substr(line_end + 1, close - line_end - 1));
}

std::optional<nlohmann::json> chat_structured(ChatBackend& backend, const LlmConfig& llm,
                                              std::vector<Message> messages,
                                              const nlohmann::json& schema) {
    ChatRequest req;
    req.model = llm.model;
    req.messages = std::move(messages);
    req.stream = false;
    req.think = llm.think;
    req.format = schema;

    Message reply = backend.chat(req);
    auto parsed = nlohmann::json::parse(strip_code_fence(reply.content), nullptr, false);
    if (parsed.is_discarded()) {
        ZENBOT_LOG_DEBUG("llm", "structured reply is not JSON");
        return std::nullopt;
    }
    auto problems = validate_schema(schema, parsed);
    if (!problems.empty()) {
        ZENBOT_LOG_DEBUG("llm", "structured reply rejected: " + problems.front());
        return std::nullopt;
    }
    return parsed;
}

std::string prompt_time_context() {
    return format_local(std::time(nullptr), "%Y-%m-%d %H:%M:%S %Z");
}

} // namespace zenbot
