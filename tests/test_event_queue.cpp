#include <gtest/gtest.h>
#include "event_queue.hpp"
#include <set>
#include <thread>
#include <vector>

using namespace zenbot;

TEST(EventQueueTest, EmptyQueue) {
    EventQueue q;
    EXPECT_FALSE(q.has_pending());
    EXPECT_FALSE(q.take_one().has_value());
}

TEST(EventQueueTest, FifoOrder) {
    EventQueue q;
    q.enqueue(Event::user_message("first"));
    q.enqueue(Event::reminder_due({{"task", "second"}}));
    q.enqueue(Event::user_message("third"));
    EXPECT_EQ(q.size(), 3u);

    auto a = q.take_one();
    auto b = q.take_one();
    auto c = q.take_one();
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(a->payload(), "first");
    EXPECT_EQ(b->type(), EventType::reminder_due);
    EXPECT_EQ(b->payload()["task"], "second");
    EXPECT_EQ(c->payload(), "third");
    EXPECT_FALSE(q.has_pending());
}

TEST(EventQueueTest, ConcurrentProducersLoseNothing) {
    EventQueue q;
    const int threads = 8;
    const int per_thread = 200;
    std::vector<std::thread> producers;
    for (int t = 0; t < threads; t++) {
        producers.emplace_back([&q, t] {
            for (int i = 0; i < per_thread; i++) {
                q.enqueue(Event::user_message(std::to_string(t) + ":" + std::to_string(i)));
            }
        });
    }
    for (auto& p : producers) p.join();

    std::set<std::string> seen;
    while (auto e = q.take_one()) seen.insert(e->payload().get<std::string>());
    EXPECT_EQ(seen.size(), static_cast<size_t>(threads * per_thread));
}

TEST(EventQueueTest, PerProducerOrderIsPreserved) {
    EventQueue q;
    std::thread producer([&q] {
        for (int i = 0; i < 100; i++) q.enqueue(Event::user_message(std::to_string(i)));
    });
    producer.join();

    int expected = 0;
    while (auto e = q.take_one()) {
        EXPECT_EQ(e->payload().get<std::string>(), std::to_string(expected));
        expected++;
    }
    EXPECT_EQ(expected, 100);
}

TEST(EventQueueTest, WaitForWakesOnEnqueue) {
    EventQueue q;
    EXPECT_FALSE(q.wait_for(std::chrono::milliseconds(10)));

    std::thread producer([&q] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        q.enqueue(Event::user_message("late"));
    });
    EXPECT_TRUE(q.wait_for(std::chrono::seconds(5)));
    producer.join();
    EXPECT_TRUE(q.has_pending());
}
