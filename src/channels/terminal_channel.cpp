#include "terminal_channel.hpp"
#include "../log.hpp"
#include "../utils.hpp"
#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace zenbot {

const char* const kBusyText = "I'm focusing on another task right now. I will get back to you ASAP!";

static const char* const kPrompt = "> ";

TerminalChannel::TerminalChannel(std::istream& in, std::ostream& out)
    : in_(in), out_(out),
      interactive_(&in == &std::cin && &out == &std::cout &&
                   isatty(STDIN_FILENO) && isatty(STDOUT_FILENO)) {}

TerminalChannel::~TerminalChannel() {
    stop();
}

void TerminalChannel::start(ChannelHooks hooks) {
    if (running_.exchange(true)) return;
    hooks_ = std::move(hooks);
    input_done_ = false;
    thread_ = std::thread(&TerminalChannel::input_loop, this);
}

void TerminalChannel::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
}

// std::cin is polled so stop() can interrupt a pending read; other streams
// are read directly.
bool TerminalChannel::read_line(std::string& line) {
    if (&in_ == &std::cin) {
        while (running_) {
            pollfd pfd{STDIN_FILENO, POLLIN, 0};
            int rc = poll(&pfd, 1, 200);
            if (rc > 0) break;
            if (rc < 0 && errno != EINTR) return false;
        }
        if (!running_) return false;
    }
    return static_cast<bool>(std::getline(in_, line));
}

void TerminalChannel::input_loop() {
    while (running_) {
        {
            std::lock_guard<std::mutex> lock(console_);
            input_active_ = true;
            if (!streaming_) render_prompt_locked();
        }

        std::string line;
        bool got = read_line(line);
        {
            std::lock_guard<std::mutex> lock(console_);
            prompt_visible_ = false;
            if (!got) input_active_ = false;
        }

        if (!got) {
            if (running_ && hooks_.request_stop) {
                ZENBOT_LOG_DEBUG("terminal", "input closed");
                hooks_.request_stop();
            }
            break;
        }

        std::string text = trim(line);
        if (text.empty()) continue;

        std::string cmd = to_lower(text);
        if (cmd == "exit" || cmd == "quit" || cmd == ":q") {
            {
                std::lock_guard<std::mutex> lock(console_);
                input_active_ = false;
            }
            if (hooks_.request_stop) hooks_.request_stop();
            break;
        }

        if (hooks_.is_busy && hooks_.is_busy()) {
            emit_line(kBusyText);
        }
        if (hooks_.enqueue) hooks_.enqueue(Event::user_message(text));
    }

    {
        std::lock_guard<std::mutex> lock(console_);
        input_active_ = false;
    }
    input_done_ = true;
}

void TerminalChannel::clear_prompt_locked() {
    if (!prompt_visible_) return;
    if (interactive_) out_ << "\r\033[K";
    else out_ << "\n";
    prompt_visible_ = false;
}

void TerminalChannel::render_prompt_locked() {
    if (prompt_visible_) return;
    out_ << kPrompt << std::flush;
    prompt_visible_ = true;
}

void TerminalChannel::emit_line(const std::string& text) {
    std::lock_guard<std::mutex> lock(console_);
    clear_prompt_locked();
    out_ << text << "\n";
    if (input_active_ && !streaming_) render_prompt_locked();
    out_.flush();
}

void TerminalChannel::emit_text(const std::string& text) {
    emit_line(text);
}

void TerminalChannel::emit_status(const std::string& text) {
    emit_line(text);
}

void TerminalChannel::begin_stream() {
    std::lock_guard<std::mutex> lock(console_);
    clear_prompt_locked();
    streaming_ = true;
}

void TerminalChannel::emit_stream_chunk(const std::string& chunk) {
    std::lock_guard<std::mutex> lock(console_);
    out_ << chunk << std::flush;
}

void TerminalChannel::end_stream() {
    std::lock_guard<std::mutex> lock(console_);
    if (!streaming_) return;
    streaming_ = false;
    out_ << "\n";
    if (input_active_) render_prompt_locked();
    out_.flush();
}

} // namespace zenbot
