#include <gtest/gtest.h>
#include <thread>
#include "playback/EventQueue.h"

using media::BackendEvent;
using playback::BackendEventQueue;

namespace {
BackendEvent event(int serial, BackendEvent::Type type = BackendEvent::Type::TimeChanged)
{
    BackendEvent e;
    e.serial = serial;
    e.type = type;
    return e;
}
} // namespace

TEST(BackendEventQueue, WakesOnlyWhenBecomingNonEmpty)
{
    int wakes = 0;
    BackendEventQueue queue([&wakes]() { ++wakes; });
    queue.post(event(1));
    queue.post(event(1));
    EXPECT_EQ(wakes, 1);
    EXPECT_EQ(queue.size(), 2u);

    auto events = queue.takeAll();
    EXPECT_EQ(events.size(), 2u);
    EXPECT_EQ(queue.size(), 0u);

    queue.post(event(1));
    EXPECT_EQ(wakes, 2);
}

TEST(BackendEventQueue, ClearBeforeDropsStaleSerials)
{
    BackendEventQueue queue([]() {});
    queue.post(event(1, BackendEvent::Type::Failed));
    queue.post(event(2, BackendEvent::Type::Ready));
    queue.post(event(1, BackendEvent::Type::TimeChanged));
    queue.clearBefore(2);

    auto events = queue.takeAll();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events.front().serial, 2);
    EXPECT_EQ(events.front().type, BackendEvent::Type::Ready);
}

TEST(BackendEventQueue, AcceptsEventsFromOtherThreads)
{
    BackendEventQueue queue([]() {});
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&queue]() {
            for (int i = 0; i < 250; ++i) {
                queue.post(event(3));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(queue.takeAll().size(), 1000u);
}
