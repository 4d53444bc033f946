#include <gtest/gtest.h>

#include "castbridge/services/discovery/device_registry.hpp"

using namespace castbridge;
using namespace castbridge::services;
using namespace std::chrono_literals;

namespace {

core::Device make_device(core::DeviceKind kind, const std::string& name, const std::string& host,
                         std::uint16_t port, const std::string& model) {
    core::Device device;
    device.kind = kind;
    device.name = name;
    device.host = host;
    device.port = port;
    device.model = model;
    device.id = core::Device::make_id(kind, host, port, name);
    return device;
}

core::Device living_room() {
    auto device = make_device(core::DeviceKind::CastReceiver, "LivingRoomTV", "192.168.1.20", 8009, "Chromecast");
    device.capabilities = {true, true, true};
    return device;
}

core::Device bedroom() {
    return make_device(core::DeviceKind::RokuReceiver, "Bedroom", "192.168.1.30", 8060, "Roku Ultra");
}

const std::vector<core::DeviceKind> kAllKinds{core::DeviceKind::CastReceiver, core::DeviceKind::RokuReceiver};

} // namespace

class DeviceRegistryTest : public ::testing::Test {
protected:
    DeviceRegistry registry{EvictionPolicy{3, 30s}};
    std::chrono::system_clock::time_point t0 = std::chrono::system_clock::now();
};

TEST_F(DeviceRegistryTest, MergeAddsNewDevices) {
    auto result = registry.merge({living_room(), bedroom()}, kAllKinds, t0);

    EXPECT_EQ(result.added.size(), 2u);
    EXPECT_TRUE(result.removed.empty());
    EXPECT_TRUE(result.membership_changed());
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(DeviceRegistryTest, SnapshotIsSortedByName) {
    registry.merge({living_room(), bedroom()}, kAllKinds, t0);

    auto devices = registry.snapshot();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].name, "Bedroom");
    EXPECT_EQ(devices[1].name, "LivingRoomTV");
}

TEST_F(DeviceRegistryTest, SameDeviceTwiceKeepsOneEntry) {
    registry.merge({living_room()}, kAllKinds, t0);
    auto result = registry.merge({living_room()}, kAllKinds, t0 + 5s);

    EXPECT_TRUE(result.added.empty());
    EXPECT_FALSE(result.membership_changed());
    EXPECT_EQ(registry.size(), 1u);

    auto found = registry.find(living_room().id);
    ASSERT_TRUE(found);
    EXPECT_EQ(found->last_seen, t0 + 5s);
}

TEST_F(DeviceRegistryTest, RenamedDeviceIsReportedAsUpdated) {
    registry.merge({bedroom()}, kAllKinds, t0);

    auto renamed = bedroom();
    renamed.model = "Roku Express";
    auto result = registry.merge({renamed}, kAllKinds, t0 + 1s);

    ASSERT_EQ(result.updated.size(), 1u);
    EXPECT_EQ(registry.find(renamed.id)->model, "Roku Express");
}

TEST_F(DeviceRegistryTest, DeviceSurvivesUntilMissedAndStale) {
    registry.merge({living_room(), bedroom()}, kAllKinds, t0);

    // Three misses, but still inside the staleness window
    registry.merge({bedroom()}, kAllKinds, t0 + 5s);
    registry.merge({bedroom()}, kAllKinds, t0 + 10s);
    auto early = registry.merge({bedroom()}, kAllKinds, t0 + 15s);
    EXPECT_TRUE(early.removed.empty());
    EXPECT_TRUE(registry.find(living_room().id));

    auto late = registry.merge({bedroom()}, kAllKinds, t0 + 31s);
    ASSERT_EQ(late.removed.size(), 1u);
    EXPECT_EQ(late.removed[0].name, "LivingRoomTV");
    EXPECT_FALSE(registry.find(living_room().id));
}

TEST_F(DeviceRegistryTest, StaleButRecentlyMissedOnceIsKept) {
    registry.merge({living_room()}, kAllKinds, t0);

    auto result = registry.merge({}, kAllKinds, t0 + 60s);
    EXPECT_TRUE(result.removed.empty());
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(DeviceRegistryTest, SeeingDeviceAgainResetsMisses) {
    registry.merge({living_room()}, kAllKinds, t0);
    registry.merge({}, kAllKinds, t0 + 40s);
    registry.merge({}, kAllKinds, t0 + 41s);
    registry.merge({living_room()}, kAllKinds, t0 + 42s);

    auto result = registry.merge({}, kAllKinds, t0 + 100s);
    EXPECT_TRUE(result.removed.empty());
}

TEST_F(DeviceRegistryTest, OnlyScannedKindsAccrueMisses) {
    registry.merge({living_room(), bedroom()}, kAllKinds, t0);

    const std::vector<core::DeviceKind> cast_only{core::DeviceKind::CastReceiver};
    for (int i = 1; i <= 4; ++i) {
        registry.merge({living_room()}, cast_only, t0 + std::chrono::seconds(40 * i));
    }

    EXPECT_TRUE(registry.find(bedroom().id));
}

TEST_F(DeviceRegistryTest, FilterMatchesKindLabelNameAndModel) {
    registry.merge({living_room(), bedroom()}, kAllKinds, t0);

    auto cast = registry.filter("cast");
    ASSERT_EQ(cast.size(), 1u);
    EXPECT_EQ(cast[0].name, "LivingRoomTV");

    auto room = registry.filter("room");
    EXPECT_EQ(room.size(), 2u);

    auto ultra = registry.filter("ULTRA");
    ASSERT_EQ(ultra.size(), 1u);
    EXPECT_EQ(ultra[0].name, "Bedroom");
}

TEST_F(DeviceRegistryTest, FilterRestrictsByKind) {
    registry.merge({living_room(), bedroom()}, kAllKinds, t0);

    auto roku_rooms = registry.filter("room", {core::DeviceKind::RokuReceiver});
    ASSERT_EQ(roku_rooms.size(), 1u);
    EXPECT_EQ(roku_rooms[0].name, "Bedroom");

    EXPECT_EQ(registry.filter("", {}).size(), 2u);
}

TEST_F(DeviceRegistryTest, ClearEmptiesRegistry) {
    registry.merge({living_room(), bedroom()}, kAllKinds, t0);
    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.snapshot().empty());
}
