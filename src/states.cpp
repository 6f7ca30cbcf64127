#include "states.hpp"
#include "agent.hpp"
#include "datetime_utils.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <ctime>

namespace zenbot {

const char* const kGenerateErrorText = "Sorry, I hit an internal error while generating a response.";
const char* const kReminderFallbackText = "Hey, just a reminder: it's time now.";

static const char* const kReminderNotifyPrompt =
    "Write one short, friendly reminder notification for the user. "
    "The reminder is due now, so tell them it is time to do the task now. "
    "Focus only on this task and optional notes. "
    "Do not mention other reminders, future timing, or scheduling actions. "
    "Return plain text only. "
    "The reminder will be deleted after this notification, so do not include "
    "instructions about snoozing or rescheduling.";

const char* state_kind_name(StateKind kind) {
    switch (kind) {
        case StateKind::idle:      return "IDLE";
        case StateKind::generate:  return "GENERATE";
        case StateKind::use_tools: return "USE_TOOLS";
        case StateKind::task:      return "TASK";
        case StateKind::cleanup:   return "CLEANUP";
    }
    return "UNKNOWN";
}

State& idle_state() { static IdleState s; return s; }
State& generate_state() { static GenerateState s; return s; }
State& use_tools_state() { static UseToolsState s; return s; }
State& task_state() { static TaskState s; return s; }
State& cleanup_state() { static CleanupState s; return s; }

nlohmann::json safe_parse_args(const nlohmann::json& raw) {
    if (raw.is_object()) return raw;
    if (raw.is_string()) {
        auto parsed = nlohmann::json::parse(raw.get<std::string>(), nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) return parsed;
    }
    return nlohmann::json::object();
}

std::string direct_response_text(const std::string& tool_name, const nlohmann::json& result) {
    const char* field = nullptr;
    if (tool_name == "set_reminder" || tool_name == "delete_reminder") field = "confirmation";
    else if (tool_name == "list_reminders") field = "summary";
    if (!field || !result.is_object() || !result.contains(field)) return "";
    auto& v = result[field];
    if (!v.is_string()) return "";
    return trim(v.get<std::string>());
}

static std::string dump_for_model(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ── Idle ────────────────────────────────────────────────────────────

State* IdleState::handle(Agent& agent, const Event& event) {
    Turn& turn = agent.turn();
    switch (event.type()) {
        case EventType::user_message: {
            const auto& p = event.payload();
            turn.user_text = p.is_string() ? trim(p.get<std::string>()) : "";
            return &generate_state();
        }
        case EventType::reminder_due: {
            turn.user_text.clear();
            turn.reminder_payload = event.payload().is_object() ? event.payload() : nlohmann::json::object();
            return &task_state();
        }
        case EventType::tick:
            break;
    }
    return this;
}

// ── Generate ────────────────────────────────────────────────────────

namespace {

// Keeps begin_stream/end_stream paired even when the backend throws
// between chunks.
class StreamSection {
public:
    explicit StreamSection(OutputSink& out) : out_(out) {}
    ~StreamSection() {
        try {
            close();
        } catch (const std::exception& e) {
            ZENBOT_LOG_ERROR("agent", std::string("failed to close stream: ") + e.what());
        }
    }

    StreamSection(const StreamSection&) = delete;
    StreamSection& operator=(const StreamSection&) = delete;

    void open() {
        if (open_) return;
        out_.begin_stream();
        open_ = true;
    }

    void close() {
        if (!open_) return;
        open_ = false;
        out_.end_stream();
    }

private:
    OutputSink& out_;
    bool open_ = false;
};

} // namespace

State* GenerateState::handle(Agent& agent, const Event& event) {
    if (event.type() != EventType::tick) return this;

    Turn& turn = agent.turn();
    const Config& cfg = agent.config();
    OutputSink& out = agent.output();

    if (turn.working_messages.empty()) {
        turn.working_messages = agent.history().messages();
        turn.working_messages.push_back(Message::user(turn.user_text));
    }

    ChatRequest req;
    req.model = cfg.llm.model;
    req.messages = turn.working_messages;
    req.tools = agent.toolbox().tools_spec();
    req.stream = cfg.llm.stream;
    req.think = cfg.llm.think;

    Message response;
    bool streamed_any = false;
    try {
        StreamSection section(out);
        StreamCallback on_chunk;
        if (req.stream) {
            on_chunk = [&](const std::string& chunk) {
                if (chunk.empty()) return;
                section.open();
                out.emit_stream_chunk(chunk);
                streamed_any = true;
            };
        }
        response = agent.backend().chat(req, on_chunk);
    } catch (const std::exception& e) {
        ZENBOT_LOG_ERROR("agent", std::string("LLM call failed: ") + e.what());
        turn.assistant_text = kGenerateErrorText;
        turn.assistant_already_emitted = false;
        out.emit_text(turn.assistant_text);
        return &cleanup_state();
    }

    if (response.has_tool_calls()) {
        turn.assistant_already_emitted = false;
        Message raw = response;
        raw.role = Role::assistant;
        turn.working_messages.push_back(std::move(raw));

        for (auto& tc : response.tool_calls) {
            std::string name = trim(tc.name);
            if (name.empty()) {
                ZENBOT_LOG_WARN("agent", "tool call without function name");
                continue;
            }
            turn.pending_tool_calls.push_back(PendingToolCall{name, safe_parse_args(tc.arguments)});
        }
        ZENBOT_LOG_DEBUG("agent", "model requested " + std::to_string(turn.pending_tool_calls.size()) +
                                  " tool call(s)");
        return &use_tools_state();
    }

    turn.assistant_text = response.content;
    turn.assistant_already_emitted = req.stream && streamed_any && !response.content.empty();
    if (!turn.assistant_already_emitted) {
        if (trim(turn.assistant_text).empty()) {
            ZENBOT_LOG_WARN("agent", "model returned an empty reply");
        } else {
            out.emit_text(turn.assistant_text);
            turn.assistant_already_emitted = true;
        }
    }
    return &cleanup_state();
}

// ── UseTools ────────────────────────────────────────────────────────

State* UseToolsState::handle(Agent& agent, const Event& event) {
    if (event.type() != EventType::tick) return this;

    Turn& turn = agent.turn();
    if (turn.pending_tool_calls.empty()) return &generate_state();

    PendingToolCall call = std::move(turn.pending_tool_calls.front());
    turn.pending_tool_calls.pop_front();

    OutputSink& out = agent.output();
    const ToolDef* def = agent.toolbox().get_tool(call.name);
    if (def && !def->user_message.empty()) {
        out.emit_status(def->user_message);
    }

    ZENBOT_LOG_INFO("tool", "Tool started: " + call.name);
    nlohmann::json result = agent.toolbox().run_tool(call.name, call.args);
    bool failed = result.is_object() && result.contains("error");
    if (failed) {
        ZENBOT_LOG_WARN("tool", call.name + " returned an error: " + dump_for_model(result["error"]));
    } else {
        ZENBOT_LOG_INFO("tool", "Tool finished: " + call.name);
    }
    turn.tool_results.push_back(ToolResultRecord{call.name, call.args, result});

    nlohmann::json forwarded = result;
    if (call.name == "list_reminders" && result.is_object() && result.contains("summary")) {
        forwarded = {
            {"success", result.value("success", true)},
            {"count", result.value("count", 0)},
            {"summary", result["summary"]}
        };
    }
    turn.working_messages.push_back(Message::tool(call.name, dump_for_model(forwarded)));

    if (!failed && turn.pending_tool_calls.empty()) {
        std::string direct = direct_response_text(call.name, result);
        if (!direct.empty()) {
            turn.assistant_text = direct;
            out.emit_text(direct);
            turn.assistant_already_emitted = true;
            return &cleanup_state();
        }
    }

    if (!turn.pending_tool_calls.empty()) return this;
    return &generate_state();
}

// ── Task ────────────────────────────────────────────────────────────

static std::string payload_field(const nlohmann::json& payload, const char* key) {
    if (!payload.contains(key)) return "";
    auto& v = payload[key];
    if (v.is_null()) return "";
    return trim(v.is_string() ? v.get<std::string>() : v.dump());
}

State* TaskState::handle(Agent& agent, const Event& event) {
    if (event.type() != EventType::tick) return this;

    Turn& turn = agent.turn();
    if (!turn.reminder_payload) return &cleanup_state();

    const nlohmann::json& payload = *turn.reminder_payload;
    std::string task = payload_field(payload, "task");
    if (task.empty()) task = "your reminder";
    std::string when = payload_field(payload, "when");
    std::string notes = payload_field(payload, "notes");

    std::string user_prompt =
        "Current local date/time: " + format_local(std::time(nullptr), "%Y-%m-%d %H:%M:%S %Z") + "\n" +
        "Task: " + task + "\n" +
        "Due at: " + (when.empty() ? std::string("now") : when);
    if (!notes.empty()) user_prompt += "\nNotes: " + notes;

    ChatRequest req;
    req.model = agent.config().llm.model;
    req.messages = {Message::system(kReminderNotifyPrompt), Message::user(user_prompt)};
    req.stream = false;
    req.think = agent.config().llm.think;

    std::string text;
    try {
        text = trim(agent.backend().chat(req).content);
    } catch (const std::exception& e) {
        ZENBOT_LOG_ERROR("agent", std::string("reminder notification failed: ") + e.what());
    }
    if (text.empty()) text = kReminderFallbackText;

    turn.assistant_text = text;
    turn.assistant_already_emitted = true;
    agent.output().emit_text(text);
    ZENBOT_LOG_DEBUG("agent", "reminder delivered: " + task);
    return &cleanup_state();
}

// ── Cleanup ─────────────────────────────────────────────────────────

State* CleanupState::handle(Agent& agent, const Event& event) {
    if (event.type() != EventType::tick) return this;
    agent.commit_turn();
    return &idle_state();
}

} // namespace zenbot
