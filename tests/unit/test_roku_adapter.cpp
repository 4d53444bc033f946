#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "castbridge/services/adapters/roku_adapter.hpp"
#include "castbridge/services/adapters/roku_ecp.hpp"
#include "mocks/mock_http_client.hpp"

using namespace castbridge;
using namespace castbridge::services;
using namespace castbridge::services::testing;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Return;

namespace {

constexpr const char* kStickInfo =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n"
    "<device-info>\n"
    "  <serial-number>X00400ABCDEF</serial-number>\n"
    "  <model-name>Roku Ultra</model-name>\n"
    "  <user-device-name>Bedroom</user-device-name>\n"
    "  <is-tv>false</is-tv>\n"
    "</device-info>\n";

constexpr const char* kTvInfo =
    "<device-info><friendly-device-name>Den &amp; Office TV</friendly-device-name>"
    "<model-name>TCL Roku TV</model-name><is-tv>true</is-tv></device-info>";

core::Device bedroom() {
    core::Device device;
    device.kind = core::DeviceKind::RokuReceiver;
    device.name = "Bedroom";
    device.host = "192.168.1.30";
    device.port = 8060;
    return device;
}

auto request_to(HttpMethod method, const std::string& url_part) {
    return AllOf(Field(&HttpRequest::method, method), Field(&HttpRequest::url, HasSubstr(url_part)));
}

} // namespace

class RokuAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        http = std::make_shared<::testing::StrictMock<MockHttpClient>>();
        adapter = std::make_unique<RokuAdapter>(http, AdapterTimeouts{});
    }

    void connect(const char* info = kStickInfo) {
        EXPECT_CALL(*http, execute(request_to(HttpMethod::GET, "http://192.168.1.30:8060/query/device-info")))
            .WillOnce(Return(http_response(200, info)));
        ASSERT_TRUE(adapter->connect(bedroom()));
    }

    std::shared_ptr<::testing::StrictMock<MockHttpClient>> http;
    std::unique_ptr<RokuAdapter> adapter;
};

TEST_F(RokuAdapterTest, ConnectReadsDeviceInfo) {
    connect();
    EXPECT_EQ(adapter->kind(), core::DeviceKind::RokuReceiver);
    EXPECT_FALSE(adapter->capabilities().supports_seek);
    EXPECT_FALSE(adapter->capabilities().supports_volume);
    EXPECT_FALSE(adapter->capabilities().supports_mute);
}

TEST_F(RokuAdapterTest, TvSupportsMute) {
    connect(kTvInfo);
    EXPECT_TRUE(adapter->capabilities().supports_mute);

    EXPECT_CALL(*http, execute(request_to(HttpMethod::POST, "/keypress/VolumeMute")))
        .Times(2)
        .WillRepeatedly(Return(http_response(200)));

    EXPECT_EQ(adapter->toggle_mute(), true);
    EXPECT_EQ(adapter->toggle_mute(), false);
}

TEST_F(RokuAdapterTest, UnreachableDeviceIsConnectionError) {
    EXPECT_CALL(*http, execute(_)).WillOnce(Return(std::unexpected(NetworkError::ConnectionFailed)));

    auto result = adapter->connect(bedroom());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().error, core::CastError::ConnectionError);
}

TEST_F(RokuAdapterTest, LoadPostsToMediaPlayerChannel) {
    connect();

    EXPECT_CALL(*http, execute(request_to(HttpMethod::POST,
        "/input/15985?t=a&u=http%3A%2F%2F192.168.1.10%3A8765%2Fmedia%2Ftok&videoName=Song%20One")))
        .WillOnce(Return(http_response(200)));

    ASSERT_TRUE(adapter->load(core::MediaRef{"http://192.168.1.10:8765/media/tok", "audio/mpeg", "Song One"}));
}

TEST_F(RokuAdapterTest, LoadHttpErrorIsLoadError) {
    connect();
    EXPECT_CALL(*http, execute(_)).WillOnce(Return(http_response(500)));

    auto result = adapter->load(core::MediaRef{"http://h/a.mp4", "video/mp4", ""});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().error, core::CastError::LoadError);
}

TEST_F(RokuAdapterTest, CommandsBeforeConnectFail) {
    auto result = adapter->stop();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().error, core::CastError::CommandError);

    auto status = adapter->poll_status();
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().error, core::CastError::StatusError);
}

TEST_F(RokuAdapterTest, PlayPauseSendsToggleKey) {
    connect();
    EXPECT_CALL(*http, execute(request_to(HttpMethod::POST, "/keypress/Play")))
        .Times(2)
        .WillRepeatedly(Return(http_response(200)));

    EXPECT_EQ(adapter->play_pause(), core::PlaybackStatus::Playing);
    EXPECT_EQ(adapter->play_pause(), core::PlaybackStatus::Paused);
}

TEST_F(RokuAdapterTest, StopGoesHome) {
    connect();
    EXPECT_CALL(*http, execute(request_to(HttpMethod::POST, "/keypress/Home")))
        .WillOnce(Return(http_response(200)));
    EXPECT_TRUE(adapter->stop());
}

TEST_F(RokuAdapterTest, SeekVolumeAndStickMuteAreUnsupported) {
    connect();

    EXPECT_EQ(adapter->seek(10).error().error, core::CastError::UnsupportedOperation);
    EXPECT_EQ(adapter->set_volume(20).error().error, core::CastError::UnsupportedOperation);
    EXPECT_EQ(adapter->toggle_mute().error().error, core::CastError::UnsupportedOperation);
}

TEST_F(RokuAdapterTest, PollParsesMediaPlayer) {
    connect();
    EXPECT_CALL(*http, execute(request_to(HttpMethod::GET, "/query/media-player")))
        .WillOnce(Return(http_response(200,
            "<player error=\"false\" state=\"pause\"><plugin id=\"15985\" name=\"Media Player\"/>"
            "<position>61000 ms</position><duration>3600000 ms</duration></player>")));

    auto snapshot = adapter->poll_status();
    ASSERT_TRUE(snapshot);
    EXPECT_EQ(snapshot->status, core::PlaybackStatus::Paused);
    EXPECT_EQ(snapshot->position, 61.0);
    EXPECT_EQ(snapshot->duration, 3600.0);
    EXPECT_FALSE(snapshot->muted.has_value());
}

TEST_F(RokuAdapterTest, CloseRightAfterLaunchStillReportsLoading) {
    connect();
    EXPECT_CALL(*http, execute(request_to(HttpMethod::POST, "/input/15985")))
        .WillOnce(Return(http_response(200)));
    ASSERT_TRUE(adapter->load(core::MediaRef{"http://192.168.1.10:8765/media/tok", "video/mp4", "Holiday"}));

    EXPECT_CALL(*http, execute(request_to(HttpMethod::GET, "/query/media-player")))
        .WillOnce(Return(http_response(200, "<player error=\"false\" state=\"close\"/>")))
        .WillOnce(Return(http_response(200, "<player error=\"false\" state=\"play\"/>")))
        .WillOnce(Return(http_response(200, "<player error=\"false\" state=\"close\"/>")));

    auto launching = adapter->poll_status();
    ASSERT_TRUE(launching);
    EXPECT_EQ(launching->status, core::PlaybackStatus::Loading);

    auto playing = adapter->poll_status();
    ASSERT_TRUE(playing);
    EXPECT_EQ(playing->status, core::PlaybackStatus::Playing);

    auto finished = adapter->poll_status();
    ASSERT_TRUE(finished);
    EXPECT_EQ(finished->status, core::PlaybackStatus::Stopped);
}

TEST_F(RokuAdapterTest, PollTimeoutIsStatusError) {
    connect();
    EXPECT_CALL(*http, execute(_)).WillOnce(Return(std::unexpected(NetworkError::Timeout)));

    auto snapshot = adapter->poll_status();
    ASSERT_FALSE(snapshot);
    EXPECT_EQ(snapshot.error().error, core::CastError::StatusError);
}

TEST(RokuEcpTest, DeviceInfoNameFallbacks) {
    auto tv = roku::parse_device_info(kTvInfo, "10.0.0.2");
    EXPECT_EQ(tv.name, "Den & Office TV");
    EXPECT_TRUE(tv.is_tv);

    auto bare = roku::parse_device_info("<device-info><model-name>Roku Express</model-name></device-info>", "10.0.0.3");
    EXPECT_EQ(bare.name, "Roku (10.0.0.3)");
    EXPECT_EQ(bare.model, "Roku Express");
    EXPECT_FALSE(bare.is_tv);
}

TEST(RokuEcpTest, MediaPlayerStates) {
    EXPECT_EQ(roku::parse_media_player("<player error=\"false\" state=\"play\"/>").status,
              core::PlaybackStatus::Playing);
    EXPECT_EQ(roku::parse_media_player("<player error=\"false\" state=\"buffer\"/>").status,
              core::PlaybackStatus::Loading);
    EXPECT_EQ(roku::parse_media_player("<player error=\"false\" state=\"close\"/>").status,
              core::PlaybackStatus::Stopped);

    auto failed = roku::parse_media_player("<player error=\"true\" state=\"play\"/>");
    EXPECT_EQ(failed.status, core::PlaybackStatus::Error);
    EXPECT_TRUE(failed.error_message.has_value());

    EXPECT_FALSE(roku::parse_media_player("<nothing/>").status.has_value());
}

TEST(RokuEcpTest, SsdpLocationOnlyForEcpDevices) {
    const std::string roku_reply =
        "HTTP/1.1 200 OK\r\n"
        "Cache-Control: max-age=3600\r\n"
        "ST: roku:ecp\r\n"
        "Location: http://192.168.1.30:8060/\r\n"
        "USN: uuid:roku:ecp:X00400ABCDEF\r\n\r\n";
    EXPECT_EQ(roku::parse_ssdp_location(roku_reply), "http://192.168.1.30:8060/");

    const std::string other =
        "HTTP/1.1 200 OK\r\n"
        "ST: upnp:rootdevice\r\n"
        "LOCATION: http://192.168.1.40:1900/desc.xml\r\n\r\n";
    EXPECT_FALSE(roku::parse_ssdp_location(other).has_value());
}

TEST(RokuEcpTest, MediaTypeCodes) {
    EXPECT_EQ(roku::media_type_code("video/mp4"), "v");
    EXPECT_EQ(roku::media_type_code("audio/flac"), "a");
    EXPECT_EQ(roku::media_type_code("image/jpeg"), "p");
    EXPECT_EQ(roku::media_type_code(""), "v");
}

TEST(RokuEcpTest, LaunchPathWithoutTitle) {
    EXPECT_EQ(RokuAdapter::build_launch_path(core::MediaRef{"http://h/v.mkv", "video/x-matroska", ""}),
              "/input/15985?t=v&u=http%3A%2F%2Fh%2Fv.mkv");
}
