#include <gtest/gtest.h>

#include "castbridge/core/event_bus.hpp"
#include "castbridge/core/events.hpp"

#include <memory>
#include <stdexcept>

using namespace castbridge::core;

TEST(EventBusTest, DeliversToSubscribersOfThatType) {
    EventBus bus;
    int phase_events = 0;
    int lost_events = 0;

    bus.subscribe<events::SessionPhaseChanged>([&](const events::SessionPhaseChanged& e) {
        EXPECT_EQ(e.current, SessionPhase::Bound);
        ++phase_events;
    });
    bus.subscribe<events::DeviceLost>([&](const events::DeviceLost&) { ++lost_events; });

    bus.publish(events::SessionPhaseChanged{SessionPhase::Binding, SessionPhase::Bound, std::nullopt});

    EXPECT_EQ(phase_events, 1);
    EXPECT_EQ(lost_events, 0);
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus bus;
    int calls = 0;
    auto id = bus.subscribe<events::DeviceListChanged>([&](const events::DeviceListChanged&) { ++calls; });
    EXPECT_EQ(bus.subscriber_count<events::DeviceListChanged>(), 1u);

    bus.publish(events::DeviceListChanged{{}, {}, 0});
    bus.unsubscribe(id);
    bus.publish(events::DeviceListChanged{{}, {}, 0});

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.subscriber_count<events::DeviceListChanged>(), 0u);
}

TEST(EventBusTest, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int calls = 0;
    bus.subscribe<events::DeviceListChanged>([](const events::DeviceListChanged&) {
        throw std::runtime_error("handler failed");
    });
    bus.subscribe<events::DeviceListChanged>([&](const events::DeviceListChanged&) { ++calls; });

    EXPECT_NO_THROW(bus.publish(events::DeviceListChanged{{}, {}, 0}));
    EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, HandlerMaySubscribeWhilePublishing) {
    EventBus bus;
    int late_calls = 0;
    bus.subscribe<events::DeviceListChanged>([&](const events::DeviceListChanged&) {
        bus.subscribe<events::DeviceListChanged>([&](const events::DeviceListChanged&) { ++late_calls; });
    });

    bus.publish(events::DeviceListChanged{{}, {}, 0});
    EXPECT_EQ(late_calls, 0);
    bus.publish(events::DeviceListChanged{{}, {}, 0});
    EXPECT_EQ(late_calls, 1);
}

TEST(EventBusTest, SubscriptionGroupUnsubscribesWhenDestroyed) {
    auto bus = std::make_shared<EventBus>();
    int calls = 0;
    {
        SubscriptionGroup group(bus);
        group.on<events::DeviceListChanged>([&](const events::DeviceListChanged&) { ++calls; });
        group.on<events::DeviceLost>([&](const events::DeviceLost&) { ++calls; });
        EXPECT_EQ(group.size(), 2u);

        bus->publish(events::DeviceListChanged{{}, {}, 0});
    }
    bus->publish(events::DeviceListChanged{{}, {}, 0});

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus->subscriber_count<events::DeviceListChanged>(), 0u);
    EXPECT_EQ(bus->subscriber_count<events::DeviceLost>(), 0u);
}

TEST(EventBusTest, ReleasedGroupCanSubscribeAgain) {
    auto bus = std::make_shared<EventBus>();
    SubscriptionGroup group(bus);
    group.on<events::DeviceListChanged>([](const events::DeviceListChanged&) {});
    group.release();
    EXPECT_EQ(group.size(), 0u);
    EXPECT_EQ(bus->subscriber_count<events::DeviceListChanged>(), 0u);

    group.on<events::DeviceListChanged>([](const events::DeviceListChanged&) {});
    EXPECT_EQ(bus->subscriber_count<events::DeviceListChanged>(), 1u);
}
