#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "castbridge/services/adapters/protocol_adapter.hpp"
#include "mocks/mock_http_client.hpp"

using namespace castbridge;
using namespace castbridge::services;
using namespace castbridge::services::testing;

namespace {

core::Device device_of(core::DeviceKind kind, const std::string& name) {
    core::Device device;
    device.kind = kind;
    device.name = name;
    device.host = "192.168.1.50";
    device.port = kind == core::DeviceKind::RokuReceiver ? 8060 : 7000;
    return device;
}

} // namespace

class DefaultAdapterFactoryTest : public ::testing::Test {
protected:
    std::shared_ptr<::testing::NiceMock<MockHttpClient>> http = std::make_shared<::testing::NiceMock<MockHttpClient>>();
    DefaultAdapterFactory factory{[]() -> std::unique_ptr<CastChannel> { return nullptr; }, http, AdapterTimeouts{}};
};

TEST_F(DefaultAdapterFactoryTest, CreatesAdapterForEachKind) {
    for (auto kind : {core::DeviceKind::CastReceiver, core::DeviceKind::RokuReceiver, core::DeviceKind::AirPlayReceiver}) {
        auto adapter = factory.create(device_of(kind, "Receiver"));
        ASSERT_NE(adapter, nullptr);
        EXPECT_EQ(adapter->kind(), kind);
    }
}

TEST_F(DefaultAdapterFactoryTest, CapabilitiesFollowProtocol) {
    auto cast = factory.create(device_of(core::DeviceKind::CastReceiver, "Chromecast"));
    auto caps = cast->capabilities();
    EXPECT_TRUE(caps.supports_seek);
    EXPECT_TRUE(caps.supports_volume);
    EXPECT_TRUE(caps.supports_mute);

    auto roku = factory.create(device_of(core::DeviceKind::RokuReceiver, "Roku"));
    EXPECT_EQ(roku->capabilities(), core::DeviceCapabilities{});
}

TEST_F(DefaultAdapterFactoryTest, CastWithoutChannelCannotConnect) {
    auto cast = factory.create(device_of(core::DeviceKind::CastReceiver, "Chromecast"));

    auto result = cast->connect(device_of(core::DeviceKind::CastReceiver, "Chromecast"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().error, core::CastError::ConnectionError);
}

TEST(AirPlayAdapterTest, NeverConnects) {
    ProtocolAdapter adapter(std::in_place_type<AirPlayAdapter>);

    auto connected = adapter.connect(device_of(core::DeviceKind::AirPlayReceiver, "Apple TV"));
    ASSERT_FALSE(connected);
    EXPECT_EQ(connected.error().error, core::CastError::ConnectionError);
    EXPECT_EQ(adapter.capabilities(), core::DeviceCapabilities{});
}

TEST(AirPlayAdapterTest, EveryCommandIsUnsupported) {
    ProtocolAdapter adapter(std::in_place_type<AirPlayAdapter>);

    EXPECT_EQ(adapter.load(core::MediaRef{"http://h/a.mp4", "video/mp4", ""}).error().error,
              core::CastError::UnsupportedOperation);
    EXPECT_EQ(adapter.play_pause().error().error, core::CastError::UnsupportedOperation);
    EXPECT_EQ(adapter.stop().error().error, core::CastError::UnsupportedOperation);
    EXPECT_EQ(adapter.seek(5).error().error, core::CastError::UnsupportedOperation);
    EXPECT_EQ(adapter.set_volume(10).error().error, core::CastError::UnsupportedOperation);
    EXPECT_EQ(adapter.toggle_mute().error().error, core::CastError::UnsupportedOperation);
    EXPECT_EQ(adapter.poll_status().error().error, core::CastError::UnsupportedOperation);

    adapter.cancel();
    adapter.disconnect();
}
