/**
 * @file test_event_bus.cpp
 * @brief Unit tests for event subscriptions and drop-oldest delivery
 */

#include <gtest/gtest.h>

#include <kcenon/resilient_transfer/transfer/event_bus.h>

#include <chrono>
#include <thread>

namespace kcenon::resilient_transfer::test {

namespace {

auto progress_event(uint64_t bytes) -> transfer_event {
    transfer_event event;
    event.type = event_type::progress;
    event.bytes_transferred = bytes;
    event.total_bytes = 100;
    return event;
}

}  // namespace

class EventBusTest : public ::testing::Test {};

TEST_F(EventBusTest, CapacityIsClamped) {
    event_bus huge(1'000'000);
    EXPECT_EQ(huge.subscribe_all()->capacity(), event_bus::max_capacity);

    event_bus defaults;
    EXPECT_EQ(defaults.subscribe_all()->capacity(), event_bus::default_capacity);
}

TEST_F(EventBusTest, FilteredSubscription) {
    event_bus bus;
    auto completed = bus.subscribe(event_type::completed);
    auto everything = bus.subscribe_all();

    bus.publish(progress_event(10));
    transfer_event done;
    done.type = event_type::completed;
    bus.publish(done);

    EXPECT_EQ(completed->size(), 1u);
    EXPECT_EQ(everything->size(), 2u);

    auto first = everything->try_pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->type, event_type::progress);
}

TEST_F(EventBusTest, FullQueueDropsOldest) {
    event_bus bus(3);
    auto sub = bus.subscribe_all();

    for (uint64_t i = 1; i <= 5; ++i) {
        bus.publish(progress_event(i));
    }

    EXPECT_EQ(sub->dropped_count(), 2u);
    EXPECT_EQ(bus.total_dropped(), 2u);

    auto events = sub->drain();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].bytes_transferred, 3u);
    EXPECT_EQ(events[2].bytes_transferred, 5u);
    EXPECT_EQ(sub->size(), 0u);
}

TEST_F(EventBusTest, SlowSubscriberDoesNotAffectOthers) {
    event_bus bus(2);
    auto slow = bus.subscribe_all();
    auto fast = bus.subscribe_all();

    for (uint64_t i = 0; i < 4; ++i) {
        bus.publish(progress_event(i));
        EXPECT_TRUE(fast->try_pop().has_value());
    }

    EXPECT_EQ(slow->dropped_count(), 2u);
    EXPECT_EQ(fast->dropped_count(), 0u);
}

TEST_F(EventBusTest, WaitPopWakesOnPublish) {
    event_bus bus;
    auto sub = bus.subscribe(event_type::failed);

    std::thread publisher([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        transfer_event event;
        event.type = event_type::failed;
        event.error = "boom";
        bus.publish(event);
    });

    auto event = sub->wait_pop(std::chrono::seconds(5));
    publisher.join();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->error, "boom");
}

TEST_F(EventBusTest, WaitPopTimesOut) {
    event_bus bus;
    auto sub = bus.subscribe_all();
    EXPECT_FALSE(sub->wait_pop(std::chrono::milliseconds(10)).has_value());
}

TEST_F(EventBusTest, ReleasedSubscriptionsArePruned) {
    event_bus bus;
    auto kept = bus.subscribe_all();
    {
        auto temporary = bus.subscribe_all();
        EXPECT_EQ(bus.subscriber_count(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count(), 1u);

    kept->close();
    EXPECT_EQ(bus.subscriber_count(), 0u);
    bus.publish(progress_event(1));
    EXPECT_EQ(kept->size(), 0u);
}

TEST_F(EventBusTest, CloseWakesConsumers) {
    event_bus bus;
    auto sub = bus.subscribe_all();

    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        bus.close();
    });

    const auto start = std::chrono::steady_clock::now();
    auto event = sub->wait_pop(std::chrono::seconds(10));
    closer.join();

    EXPECT_FALSE(event.has_value());
    EXPECT_TRUE(sub->is_closed());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));

    auto late = bus.subscribe_all();
    EXPECT_TRUE(late->is_closed());
}

TEST_F(EventBusTest, EventTypeNames) {
    EXPECT_EQ(to_string(event_type::queue_stats_updated), "queue_stats_updated");
    EXPECT_EQ(to_string(event_type::cancelled), "cancelled");
}

}  // namespace kcenon::resilient_transfer::test
