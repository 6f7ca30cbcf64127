#include "provider.hpp"
#include "log.hpp"
#include <httplib.h>
#include <stdexcept>

namespace zenbot {

static void parse_url(const std::string& url, std::string& scheme, std::string& host, int& port, std::string& path_prefix) {
    scheme = "http";
    host = "127.0.0.1";
    port = 11434;
    path_prefix = "";

    size_t pos = 0;
    if (url.substr(0, 8) == "https://") {
        scheme = "https"; pos = 8; port = 443;
    } else if (url.substr(0, 7) == "http://") {
        scheme = "http"; pos = 7; port = 80;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        path_prefix = url.substr(slash);
        while (!path_prefix.empty() && path_prefix.back() == '/') path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        host = host_port.substr(0, colon);
        try {
            port = std::stoi(host_port.substr(colon + 1));
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid port in Ollama URL: " + url);
        }
    } else if (!host_port.empty()) {
        host = host_port;
    }
}

OllamaProvider::OllamaProvider(const std::string& api_base) {
    parse_url(api_base, scheme_, host_, port_, path_prefix_);
    base_url_ = scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

nlohmann::json OllamaProvider::build_body(const ChatRequest& req) {
    nlohmann::json body;
    body["model"] = req.model;
    body["stream"] = req.stream;
    body["think"] = req.think;

    auto& msgs = body["messages"];
    msgs = nlohmann::json::array();
    for (auto& m : req.messages) {
        msgs.push_back(m.to_json());
    }

    if (req.tools.is_array() && !req.tools.empty()) {
        body["tools"] = req.tools;
    }
    if (!req.format.is_null()) {
        body["format"] = req.format;
    }
    return body;
}

// Folds one NDJSON line into out. Returns true once the server marks the
// reply done.
static bool decode_stream_line(std::string line, Message& out, const StreamCallback& on_chunk) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
    if (line.empty()) return false;

    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        ZENBOT_LOG_DEBUG("ollama", "skipping undecodable stream line");
        return false;
    }
    if (j.contains("error")) {
        throw std::runtime_error("Ollama stream error: " +
                                 (j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump()));
    }
    if (j.contains("message") && j["message"].is_object()) {
        Message part = Message::from_json(j["message"]);
        if (!part.content.empty()) {
            out.content += part.content;
            if (on_chunk) on_chunk(part.content);
        }
        for (auto& tc : part.tool_calls) {
            out.tool_calls.push_back(std::move(tc));
        }
    }
    return j.value("done", false);
}

Message OllamaProvider::parse_stream_body(const std::string& body, const StreamCallback& on_chunk) {
    Message out;
    out.role = Role::assistant;

    size_t pos = 0;
    while (pos < body.size()) {
        size_t line_end = body.find('\n', pos);
        if (line_end == std::string::npos) line_end = body.size();
        bool done = decode_stream_line(body.substr(pos, line_end - pos), out, on_chunk);
        pos = line_end + 1;
        if (done) break;
    }
    return out;
}

Message OllamaProvider::chat(const ChatRequest& req, const StreamCallback& on_chunk) {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(30);
    cli.set_read_timeout(300);

    std::string path = path_prefix_ + "/api/chat";
    std::string payload = build_body(req).dump();

    if (req.stream) {
        // NDJSON lines are decoded as they arrive.
        Message out;
        out.role = Role::assistant;
        std::string pending;
        std::string raw;
        std::string stream_error;
        bool done = false;

        httplib::Request hreq;
        hreq.method = "POST";
        hreq.path = path;
        hreq.body = payload;
        hreq.set_header("Content-Type", "application/json");
        hreq.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
            raw.append(data, len);
            pending.append(data, len);
            size_t nl;
            while (!done && (nl = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, nl);
                pending.erase(0, nl + 1);
                try {
                    done = decode_stream_line(std::move(line), out, on_chunk);
                } catch (const std::runtime_error& e) {
                    stream_error = e.what();
                    return false;
                }
            }
            return true;
        };

        auto res = cli.send(hreq);
        if (!stream_error.empty()) {
            throw std::runtime_error(stream_error);
        }
        if (!res) {
            throw std::runtime_error("Ollama request failed: connection error (" + base_url_ + ")");
        }
        if (res->status != 200) {
            throw std::runtime_error("Ollama returned status " + std::to_string(res->status) + ": " +
                                     (raw.empty() ? res->body : raw));
        }
        if (!done && !pending.empty()) decode_stream_line(pending, out, on_chunk);
        return out;
    }

    auto res = cli.Post(path, payload, "application/json");
    if (!res) {
        throw std::runtime_error("Ollama request failed: connection error (" + base_url_ + ")");
    }
    if (res->status != 200) {
        throw std::runtime_error("Ollama returned status " + std::to_string(res->status) + ": " + res->body);
    }

    auto j = nlohmann::json::parse(res->body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw std::runtime_error("Ollama returned an undecodable response");
    }
    if (j.contains("error")) {
        throw std::runtime_error("Ollama error: " +
                                 (j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump()));
    }
    if (!j.contains("message") || !j["message"].is_object()) {
        throw std::runtime_error("Ollama response has no message");
    }
    Message m = Message::from_json(j["message"]);
    m.role = Role::assistant;
    return m;
}

} // namespace zenbot
