#include "agent.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace zenbot {

const char* const kStepLimitText =
    "I hit an internal step limit while processing that request. "
    "Please split it into smaller steps and try again.";

const char* const kInternalFaultText =
    "Sorry, something went wrong while processing that request.";

Agent::Agent(const Config& config, ChatBackend& backend, OutputSink& output, std::string system_prompt)
    : config_(config), backend_(backend), output_(output),
      history_(std::move(system_prompt)), current_(&idle_state()) {}

void Agent::set_current(State* s) {
    if (s != current_) {
        ZENBOT_LOG_DEBUG("agent", std::string("state ") + current_->name() + " -> " + s->name());
    }
    current_ = s;
    busy_ = s->kind() != StateKind::idle;
}

void Agent::dispatch(const Event& event) {
    ZENBOT_LOG_DEBUG("agent", std::string("dispatch ") + event_type_name(event.type()) +
                              " in " + current_->name());
    try {
        pending_ = current_->handle(*this, event);
    } catch (const std::exception& e) {
        ZENBOT_LOG_ERROR("agent", std::string("handler failed in ") + current_->name() + ": " + e.what());
        recover(kInternalFaultText);
        return;
    }
    if (pending_ && pending_->kind() != StateKind::idle) busy_ = true;
}

void Agent::drain() {
    int max_steps = config_.agent.max_internal_steps;
    int steps = 0;

    while (pending_ && steps < max_steps) {
        set_current(pending_);
        pending_ = nullptr;
        if (current_->kind() == StateKind::idle) break;
        try {
            pending_ = current_->handle(*this, Event::tick());
        } catch (const std::exception& e) {
            ZENBOT_LOG_ERROR("agent", std::string("handler failed in ") + current_->name() + ": " + e.what());
            recover(kInternalFaultText);
            return;
        }
        steps++;
    }

    if (pending_ && pending_->kind() == StateKind::idle) {
        set_current(pending_);
        pending_ = nullptr;
    }

    if (pending_) {
        ZENBOT_LOG_WARN("agent", "internal step limit (" + std::to_string(max_steps) +
                                 ") reached in " + current_->name() + ", discarding turn");
        recover(kStepLimitText);
        return;
    }

    if (current_->kind() == StateKind::idle) pending_ = nullptr;
}

void Agent::recover(const std::string& message) {
    try {
        output_.emit_text(message);
    } catch (const std::exception& e) {
        ZENBOT_LOG_ERROR("agent", std::string("could not deliver recovery message: ") + e.what());
    }
    reset_turn();
    pending_ = nullptr;
    set_current(&idle_state());
}

void Agent::commit_turn() {
    std::string user_text = trim(turn_.user_text);
    std::string assistant_text = trim(turn_.assistant_text);

    if (!user_text.empty() && !assistant_text.empty()) {
        history_.append(Message::user(user_text));
        history_.append(Message::assistant(assistant_text));
        history_.trim(config_.agent.max_history_messages);
        ZENBOT_LOG_DEBUG("agent", "turn committed, history size " + std::to_string(history_.size()));
    } else {
        ZENBOT_LOG_DEBUG("agent", "nothing to commit for this turn");
    }
    reset_turn();
}

void Agent::reset_turn() {
    turn_.reset();
}

void Agent::enqueue_event(Event event) {
    queue_.enqueue(std::move(event));
}

bool Agent::has_queued_events() const {
    return queue_.has_pending();
}

bool Agent::is_busy() const {
    return busy_ || queue_.has_pending();
}

bool Agent::process_one_queued_event() {
    auto event = queue_.take_one();
    if (!event) return false;
    busy_ = true;
    dispatch(*event);
    drain();
    return true;
}

int Agent::process_all_queued_events() {
    int processed = 0;
    while (process_one_queued_event()) processed++;
    return processed;
}

} // namespace zenbot
