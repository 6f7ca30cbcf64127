#include <gtest/gtest.h>
#include "channels/terminal_channel.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

using namespace zenbot;

namespace {

class TerminalHarness {
public:
    explicit TerminalHarness(const std::string& input, bool busy = false)
        : in(input), channel(in, out), busy_(busy) {}

    void run() {
        ChannelHooks hooks;
        hooks.enqueue = [this](Event e) {
            std::lock_guard<std::mutex> lock(mu);
            events.push_back(std::move(e));
        };
        hooks.is_busy = [this] { return busy_; };
        hooks.request_stop = [this] { stops++; };
        channel.start(std::move(hooks));
        for (int i = 0; i < 200 && !channel.input_finished(); i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        channel.stop();
    }

    std::istringstream in;
    std::ostringstream out;
    TerminalChannel channel;
    std::mutex mu;
    std::vector<Event> events;
    std::atomic<int> stops{0};

private:
    bool busy_;
};

} // namespace

TEST(TerminalChannelTest, LinesBecomeUserEvents) {
    TerminalHarness h("hello\n\n   \n  remind me at 9:00  \n");
    h.run();

    ASSERT_TRUE(h.channel.input_finished());
    ASSERT_EQ(h.events.size(), 2u);
    EXPECT_EQ(h.events[0].type(), EventType::user_message);
    EXPECT_EQ(h.events[0].payload(), "hello");
    EXPECT_EQ(h.events[1].payload(), "remind me at 9:00");
    EXPECT_EQ(h.stops.load(), 1);   // EOF
}

TEST(TerminalChannelTest, ExitStopsWithoutEnqueue) {
    TerminalHarness h("first\nQuit\nnever\n");
    h.run();

    ASSERT_EQ(h.events.size(), 1u);
    EXPECT_EQ(h.events[0].payload(), "first");
    EXPECT_EQ(h.stops.load(), 1);
}

TEST(TerminalChannelTest, ColonQAlsoExits) {
    TerminalHarness h(":q\n");
    h.run();
    EXPECT_TRUE(h.events.empty());
    EXPECT_EQ(h.stops.load(), 1);
}

TEST(TerminalChannelTest, BusyNoticeStillEnqueues) {
    TerminalHarness h("are you there?\n", true);
    h.run();

    ASSERT_EQ(h.events.size(), 1u);
    EXPECT_NE(h.out.str().find(kBusyText), std::string::npos);
}

TEST(TerminalChannelTest, PromptIsShown) {
    TerminalHarness h("hi\n");
    h.run();
    EXPECT_EQ(h.out.str().rfind("> ", 0), 0u);
}

TEST(TerminalChannelTest, OutputRendering) {
    std::istringstream in;
    std::ostringstream out;
    TerminalChannel channel(in, out);

    channel.emit_status("Setting your reminder...");
    channel.begin_stream();
    channel.emit_stream_chunk("Hel");
    channel.emit_stream_chunk("lo");
    channel.end_stream();
    channel.end_stream();
    channel.emit_text("Done.");

    EXPECT_EQ(out.str(), "Setting your reminder...\nHello\nDone.\n");
}
