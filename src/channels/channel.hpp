#pragma once
#include "../event.hpp"
#include "../output.hpp"
#include <functional>
#include <string>

namespace zenbot {

struct ChannelHooks {
    std::function<void(Event)> enqueue;     // hand an inbound event to the agent
    std::function<bool()> is_busy;          // agent mid-turn or events waiting
    std::function<void()> request_stop;     // user asked to quit, or input closed
};

// A user-facing I/O surface: produces events on its own thread and renders
// the agent's output.
class Channel : public OutputSink {
public:
    virtual std::string name() const = 0;
    virtual void start(ChannelHooks hooks) = 0;
    virtual void stop() = 0;
};

} // namespace zenbot
