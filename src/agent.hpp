#pragma once
#include "config.hpp"
#include "event.hpp"
#include "event_queue.hpp"
#include "history.hpp"
#include "output.hpp"
#include "provider.hpp"
#include "states.hpp"
#include "toolbox.hpp"
#include "turn.hpp"
#include <atomic>
#include <string>

namespace zenbot {

extern const char* const kStepLimitText;
extern const char* const kInternalFaultText;

class Agent {
public:
    Agent(const Config& config, ChatBackend& backend, OutputSink& output, std::string system_prompt);

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    // Runs the current state's handler for an external event and records the
    // state it asks for. The transition itself happens in drain().
    void dispatch(const Event& event);

    // Applies pending transitions, ticking non-idle states, until the agent
    // is idle or max_internal_steps handler calls have been made. Always ends
    // idle with nothing pending.
    void drain();

    void commit_turn();
    void reset_turn();

    // Safe from any thread.
    void enqueue_event(Event event);
    bool has_queued_events() const;

    bool process_one_queued_event();
    int process_all_queued_events();

    // Queues a transition for the next drain().
    void schedule(State& next) { pending_ = &next; }

    State& state() const { return *current_; }
    State* pending_state() const { return pending_; }

    // Safe from any thread: not idle, or events still waiting.
    bool is_busy() const;

    const Config& config() const { return config_; }
    ChatBackend& backend() { return backend_; }
    OutputSink& output() { return output_; }
    Toolbox& toolbox() { return toolbox_; }
    const Toolbox& toolbox() const { return toolbox_; }
    History& history() { return history_; }
    const History& history() const { return history_; }
    Turn& turn() { return turn_; }
    const Turn& turn() const { return turn_; }
    EventQueue& queue() { return queue_; }

private:
    Config config_;
    ChatBackend& backend_;
    OutputSink& output_;
    Toolbox toolbox_;
    History history_;
    Turn turn_;
    EventQueue queue_;

    State* current_;
    State* pending_ = nullptr;
    std::atomic<bool> busy_{false};

    void set_current(State* s);
    void recover(const std::string& message);
};

} // namespace zenbot
