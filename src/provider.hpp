#pragma once
#include "message.hpp"
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zenbot {

struct ChatRequest {
    std::string model;
    std::vector<Message> messages;
    nlohmann::json tools = nlohmann::json::array();
    bool stream = false;
    bool think = false;
    nlohmann::json format;      // JSON schema for structured output, null when unused
};

using StreamCallback = std::function<void(const std::string& chunk)>;

// Language-model backend. Implementations throw std::runtime_error on
// transport or protocol failure.
class ChatBackend {
public:
    virtual ~ChatBackend() = default;

    // When req.stream is set, on_chunk receives each content delta as it is
    // decoded; the returned message aggregates the whole reply.
    virtual Message chat(const ChatRequest& req, const StreamCallback& on_chunk = nullptr) = 0;
};

class OllamaProvider : public ChatBackend {
public:
    explicit OllamaProvider(const std::string& api_base);

    Message chat(const ChatRequest& req, const StreamCallback& on_chunk = nullptr) override;

    const std::string& base_url() const { return base_url_; }

    static nlohmann::json build_body(const ChatRequest& req);

    // Decode an NDJSON stream body, calling on_chunk per content delta.
    static Message parse_stream_body(const std::string& body, const StreamCallback& on_chunk);

private:
    std::string scheme_;
    std::string host_;
    int port_ = 11434;
    std::string path_prefix_;
    std::string base_url_;  // scheme://host:port
};

} // namespace zenbot
