#include "core/EventBus.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using flux::core::EventBus;
using flux::core::json;

TEST(EventBusTest, DeliversToEverySubscriberInOrder) {
    EventBus bus;
    std::vector<std::string> calls;

    bus.subscribe([&calls](const std::string& event, const json&) { calls.push_back("a:" + event); });
    bus.subscribe([&calls](const std::string& event, const json&) { calls.push_back("b:" + event); });

    bus.emit("first");
    bus.emit("second", {{"value", 1}});

    std::vector<std::string> expected = {"a:first", "b:first", "a:second", "b:second"};
    EXPECT_EQ(calls, expected);
}

TEST(EventBusTest, PayloadReachesHandler) {
    EventBus bus;
    json received;

    bus.subscribe([&received](const std::string&, const json& payload) { received = payload; });
    bus.emit("download_progress", {{"download_id", "abc"}, {"bytes_downloaded", 42}});

    EXPECT_EQ(received["download_id"], "abc");
    EXPECT_EQ(received["bytes_downloaded"], 42);
}

TEST(EventBusTest, DefaultPayloadIsEmptyObject) {
    EventBus bus;
    json received;

    bus.subscribe([&received](const std::string&, const json& payload) { received = payload; });
    bus.emit("engine_started");

    EXPECT_TRUE(received.is_object());
    EXPECT_TRUE(received.empty());
}

TEST(EventBusTest, ThrowingHandlerDoesNotStopDelivery) {
    EventBus bus;
    int delivered = 0;

    bus.subscribe([](const std::string&, const json&) { throw std::runtime_error("broken handler"); });
    bus.subscribe([&delivered](const std::string&, const json&) { ++delivered; });

    EXPECT_NO_THROW(bus.emit("event"));
    EXPECT_NO_THROW(bus.emit("event"));
    EXPECT_EQ(delivered, 2);
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus bus;
    int first = 0;
    int second = 0;

    auto subscription = bus.subscribe([&first](const std::string&, const json&) { ++first; });
    bus.subscribe([&second](const std::string&, const json&) { ++second; });
    ASSERT_EQ(bus.getSubscriberCount(), 2u);

    bus.emit("event");
    bus.unsubscribe(subscription);
    bus.emit("event");

    EXPECT_FALSE(subscription->isActive());
    EXPECT_EQ(bus.getSubscriberCount(), 1u);
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 2);

    EXPECT_NO_THROW(bus.unsubscribe(subscription));
    EXPECT_NO_THROW(bus.unsubscribe(nullptr));
}

TEST(EventBusTest, HandlerMayUnsubscribeDuringDelivery) {
    EventBus bus;
    int calls = 0;
    flux::core::SubscriptionPtr subscription;

    subscription = bus.subscribe([&](const std::string&, const json&) {
        ++calls;
        bus.unsubscribe(subscription);
    });

    bus.emit("event");
    bus.emit("event");

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.getSubscriberCount(), 0u);
}

TEST(EventBusTest, ClearCancelsAllSubscriptions) {
    EventBus bus;
    int calls = 0;

    auto subscription = bus.subscribe([&calls](const std::string&, const json&) { ++calls; });
    bus.clear();
    bus.emit("event");

    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(subscription->isActive());
}
