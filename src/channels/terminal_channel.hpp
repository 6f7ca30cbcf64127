#pragma once
#include "channel.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace zenbot {

extern const char* const kBusyText;

class TerminalChannel : public Channel {
public:
    TerminalChannel(std::istream& in = std::cin, std::ostream& out = std::cout);
    ~TerminalChannel() override;

    std::string name() const override { return "terminal"; }
    void start(ChannelHooks hooks) override;
    void stop() override;

    void emit_text(const std::string& text) override;
    void emit_status(const std::string& text) override;
    void begin_stream() override;
    void emit_stream_chunk(const std::string& chunk) override;
    void end_stream() override;

    // True once the input loop has returned (EOF, exit or stop).
    bool input_finished() const { return input_done_; }

private:
    std::istream& in_;
    std::ostream& out_;
    bool interactive_;          // stdin/stdout attached to a terminal
    ChannelHooks hooks_;

    std::mutex console_;
    bool input_active_ = false;
    bool prompt_visible_ = false;
    bool streaming_ = false;

    std::atomic<bool> running_{false};
    std::atomic<bool> input_done_{false};
    std::thread thread_;

    void input_loop();
    bool read_line(std::string& line);
    void emit_line(const std::string& text);
    void clear_prompt_locked();
    void render_prompt_locked();
};

} // namespace zenbot
