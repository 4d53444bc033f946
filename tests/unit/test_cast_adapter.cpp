#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "castbridge/services/adapters/cast_adapter.hpp"
#include "mocks/mock_cast_channel.hpp"

#include <algorithm>

using namespace castbridge;
using namespace castbridge::services;
using namespace castbridge::services::testing;
using ::testing::_;
using ::testing::Eq;
using ::testing::Invoke;
using ::testing::Return;
using json = nlohmann::json;

namespace {

// Answers like a Chromecast running (or able to launch) the Default Media Receiver
struct ScriptedReceiver {
    bool app_running = false;
    bool silent = false;
    std::string load_reply_type = "MEDIA_STATUS";
    bool load_times_out = false;
    std::string player_state = "BUFFERING";
    double current_time = 0.0;
    double volume = 0.5;
    bool muted = false;

    std::vector<std::string> requests;   // "ns-suffix:TYPE"
    std::vector<json> media_payloads;

    json receiver_status() const {
        json status = {{"volume", {{"level", volume}, {"muted", muted}}}, {"applications", json::array()}};
        if (app_running) {
            status["applications"].push_back({{"appId", kDefaultMediaReceiverAppId},
                                              {"sessionId", "s-1"},
                                              {"transportId", "web-5"}});
        }
        return {{"type", "RECEIVER_STATUS"}, {"status", status}};
    }

    json media_status() const {
        return {{"type", "MEDIA_STATUS"},
                {"status", json::array({{{"mediaSessionId", 1},
                                         {"playerState", player_state},
                                         {"currentTime", current_time},
                                         {"media", {{"contentId", "http://h/a.mp4"}, {"duration", 120.0}}}}})}};
    }

    std::expected<json, core::Failure> handle(const std::string& destination, const std::string& ns, json payload) {
        const auto type = payload.value("type", std::string());
        const std::string channel = ns == cast_ns::kMedia ? "media" : "receiver";
        requests.push_back(channel + ":" + type);

        if (silent) {
            return core::make_failure(core::CastError::CommandError, "request timed out");
        }

        if (ns == cast_ns::kReceiver) {
            EXPECT_EQ(destination, kCastReceiverId);
            if (type == "LAUNCH") {
                app_running = true;
            } else if (type == "SET_VOLUME") {
                if (payload["volume"].contains("level")) {
                    volume = payload["volume"]["level"].get<double>();
                }
                if (payload["volume"].contains("muted")) {
                    muted = payload["volume"]["muted"].get<bool>();
                }
            }
            return receiver_status();
        }

        EXPECT_EQ(destination, "web-5");
        media_payloads.push_back(payload);
        if (type == "LOAD") {
            if (load_times_out) {
                return core::make_failure(core::CastError::CommandError, "request timed out");
            }
            if (load_reply_type != "MEDIA_STATUS") {
                return json{{"type", load_reply_type}, {"reason", "UNSUPPORTED_MEDIA"}};
            }
        } else if (type == "PAUSE") {
            player_state = "PAUSED";
        } else if (type == "PLAY") {
            player_state = "PLAYING";
        } else if (type == "SEEK") {
            current_time = payload["currentTime"].get<double>();
        } else if (type == "STOP") {
            player_state = "IDLE";
        }
        return media_status();
    }
};

core::Device living_room() {
    core::Device device;
    device.kind = core::DeviceKind::CastReceiver;
    device.name = "LivingRoomTV";
    device.host = "192.168.1.20";
    device.port = 8009;
    device.id = core::Device::make_id(device.kind, device.host, device.port, device.name);
    return device;
}

} // namespace

class CastAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto owned = std::make_unique<::testing::NiceMock<MockCastChannel>>();
        channel = owned.get();
        channel_owner = std::move(owned);

        ON_CALL(*channel, open(_, _, _)).WillByDefault(Return(std::expected<void, core::Failure>{}));
        ON_CALL(*channel, send(_, _, _)).WillByDefault(Invoke(
            [this](const std::string& destination, const std::string&, const json& payload) {
                sent.push_back(destination + ":" + payload.value("type", std::string()));
                return std::expected<void, core::Failure>{};
            }));
        ON_CALL(*channel, is_open()).WillByDefault(Return(true));
        ON_CALL(*channel, set_message_handler(_)).WillByDefault(Invoke(
            [this](CastChannel::MessageHandler handler) { message_handler = std::move(handler); }));
        ON_CALL(*channel, request(_, _, _, _)).WillByDefault(Invoke(
            [this](const std::string& destination, const std::string& ns, json payload, std::chrono::milliseconds) {
                return receiver.handle(destination, ns, std::move(payload));
            }));

        adapter = std::make_unique<CastAdapter>([this]() -> std::unique_ptr<CastChannel> {
            return std::move(channel_owner);
        }, AdapterTimeouts{});
    }

    void TearDown() override {
        adapter.reset();
    }

    void connect_and_load() {
        ASSERT_TRUE(adapter->connect(living_room()));
        ASSERT_TRUE(adapter->load(core::MediaRef{"http://192.168.1.10:8765/media/tok", "video/mp4", "Holiday"}));
    }

    ScriptedReceiver receiver;
    MockCastChannel* channel = nullptr;
    std::unique_ptr<CastChannel> channel_owner;
    std::unique_ptr<CastAdapter> adapter;
    std::vector<std::string> sent;
    CastChannel::MessageHandler message_handler;
};

TEST_F(CastAdapterTest, ConnectOpensChannelAndQueriesReceiver) {
    EXPECT_CALL(*channel, open(Eq("192.168.1.20"), Eq(8009), _));

    ASSERT_TRUE(adapter->connect(living_room()));
    ASSERT_EQ(receiver.requests.size(), 1u);
    EXPECT_EQ(receiver.requests[0], "receiver:GET_STATUS");
    EXPECT_TRUE(message_handler);
}

TEST_F(CastAdapterTest, SilentReceiverFailsConnect) {
    receiver.silent = true;
    EXPECT_CALL(*channel, close()).Times(::testing::AtLeast(1));

    auto result = adapter->connect(living_room());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().error, core::CastError::ConnectionError);
}

TEST_F(CastAdapterTest, OpenFailureIsReturned) {
    ON_CALL(*channel, open(_, _, _)).WillByDefault(Return(std::expected<void, core::Failure>(
        core::make_failure(core::CastError::ConnectionError, "connection refused"))));

    auto result = adapter->connect(living_room());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().error, core::CastError::ConnectionError);
    EXPECT_TRUE(receiver.requests.empty());
}

TEST_F(CastAdapterTest, NoChannelIsConnectionError) {
    CastAdapter without_channel([]() -> std::unique_ptr<CastChannel> { return nullptr; }, AdapterTimeouts{});

    auto result = without_channel.connect(living_room());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().error, core::CastError::ConnectionError);
}

TEST_F(CastAdapterTest, LoadLaunchesMediaReceiver) {
    connect_and_load();

    std::vector<std::string> expected{"receiver:GET_STATUS", "receiver:GET_STATUS", "receiver:LAUNCH", "media:LOAD"};
    EXPECT_EQ(receiver.requests, expected);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0], "web-5:CONNECT");

    const auto& load = receiver.media_payloads.back();
    EXPECT_EQ(load["media"]["contentId"], "http://192.168.1.10:8765/media/tok");
    EXPECT_EQ(load["media"]["contentType"], "video/mp4");
    EXPECT_EQ(load["media"]["metadata"]["title"], "Holiday");
    EXPECT_EQ(load["autoplay"], true);
}

TEST_F(CastAdapterTest, RunningReceiverIsReused) {
    receiver.app_running = true;
    connect_and_load();

    EXPECT_EQ(std::count(receiver.requests.begin(), receiver.requests.end(), "receiver:LAUNCH"), 0);

    // A second load reuses the virtual connection
    ASSERT_TRUE(adapter->load(core::MediaRef{"http://h/b.mp4", "video/mp4", "b"}));
    EXPECT_EQ(sent.size(), 1u);
}

TEST_F(CastAdapterTest, RejectedLoadIsLoadError) {
    receiver.load_reply_type = "LOAD_FAILED";
    ASSERT_TRUE(adapter->connect(living_room()));

    auto result = adapter->load(core::MediaRef{"http://h/a.mkv", "video/x-matroska", ""});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().error, core::CastError::LoadError);
}

TEST_F(CastAdapterTest, LoadTimeoutIsLoadError) {
    receiver.load_times_out = true;
    ASSERT_TRUE(adapter->connect(living_room()));

    auto result = adapter->load(core::MediaRef{"http://h/a.mp4", "video/mp4", ""});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().error, core::CastError::LoadError);
}

TEST_F(CastAdapterTest, MediaCommandsNeedLoadedMedia) {
    ASSERT_TRUE(adapter->connect(living_room()));

    auto result = adapter->play_pause();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().error, core::CastError::CommandError);
}

TEST_F(CastAdapterTest, PlayPauseFollowsReceiverState) {
    connect_and_load();

    auto first = adapter->play_pause();
    ASSERT_TRUE(first);
    EXPECT_EQ(*first, core::PlaybackStatus::Paused);
    EXPECT_EQ(receiver.media_payloads.back()["type"], "PAUSE");
    EXPECT_EQ(receiver.media_payloads.back()["mediaSessionId"], 1);

    auto second = adapter->play_pause();
    ASSERT_TRUE(second);
    EXPECT_EQ(*second, core::PlaybackStatus::Playing);
    EXPECT_EQ(receiver.media_payloads.back()["type"], "PLAY");
}

TEST_F(CastAdapterTest, SeekIsClampedToMedia) {
    connect_and_load();

    auto back = adapter->seek(-30.0);
    ASSERT_TRUE(back);
    EXPECT_DOUBLE_EQ(*back, 0.0);

    auto forward = adapter->seek(500.0);
    ASSERT_TRUE(forward);
    EXPECT_DOUBLE_EQ(*forward, 120.0);
    EXPECT_DOUBLE_EQ(receiver.media_payloads.back()["currentTime"].get<double>(), 120.0);
}

TEST_F(CastAdapterTest, VolumeAndMuteGoToReceiver) {
    ASSERT_TRUE(adapter->connect(living_room()));

    auto level = adapter->set_volume(130);
    ASSERT_TRUE(level);
    EXPECT_EQ(*level, 100);
    EXPECT_DOUBLE_EQ(receiver.volume, 1.0);

    auto muted = adapter->toggle_mute();
    ASSERT_TRUE(muted);
    EXPECT_TRUE(*muted);
    EXPECT_TRUE(receiver.muted);
}

TEST_F(CastAdapterTest, PollCombinesReceiverAndMediaStatus) {
    connect_and_load();
    receiver.player_state = "PLAYING";
    receiver.current_time = 12.5;

    auto snapshot = adapter->poll_status();
    ASSERT_TRUE(snapshot);
    EXPECT_EQ(snapshot->status, core::PlaybackStatus::Playing);
    EXPECT_EQ(snapshot->position, 12.5);
    EXPECT_EQ(snapshot->duration, 120.0);
    EXPECT_EQ(snapshot->volume, 50);
    EXPECT_EQ(snapshot->muted, false);
}

TEST_F(CastAdapterTest, PollWithoutMediaIsIdle) {
    ASSERT_TRUE(adapter->connect(living_room()));

    auto snapshot = adapter->poll_status();
    ASSERT_TRUE(snapshot);
    EXPECT_EQ(snapshot->status, core::PlaybackStatus::Idle);
    EXPECT_FALSE(snapshot->position.has_value());
}

TEST_F(CastAdapterTest, PollFailureIsStatusError) {
    ASSERT_TRUE(adapter->connect(living_room()));
    receiver.silent = true;

    auto snapshot = adapter->poll_status();
    ASSERT_FALSE(snapshot);
    EXPECT_EQ(snapshot.error().error, core::CastError::StatusError);
}

TEST_F(CastAdapterTest, UnsolicitedMediaStatusReachesListener) {
    connect_and_load();

    std::vector<core::StatusSnapshot> pushed;
    adapter->set_status_listener([&pushed](const core::StatusSnapshot& s) { pushed.push_back(s); });

    receiver.player_state = "IDLE";
    json finished = receiver.media_status();
    finished["status"][0]["idleReason"] = "FINISHED";
    ASSERT_TRUE(message_handler);
    message_handler(cast_ns::kMedia, finished);
    message_handler(cast_ns::kHeartbeat, json{{"type", "PONG"}});

    ASSERT_EQ(pushed.size(), 1u);
    EXPECT_EQ(pushed[0].status, core::PlaybackStatus::Stopped);
}

TEST_F(CastAdapterTest, DisconnectClosesMediaConnection) {
    connect_and_load();
    EXPECT_CALL(*channel, close());

    adapter->disconnect();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[1], "web-5:CLOSE");
}

TEST(CastStatusParsingTest, EmptyMediaStatusIsIdle) {
    auto snapshot = parse_media_status(json{{"type", "MEDIA_STATUS"}, {"status", json::array()}});
    EXPECT_EQ(snapshot.status, core::PlaybackStatus::Idle);
}

TEST(CastStatusParsingTest, IdleReasons) {
    auto with_reason = [](const std::string& reason) {
        return parse_media_status(json{{"type", "MEDIA_STATUS"},
                                       {"status", json::array({{{"playerState", "IDLE"}, {"idleReason", reason}}})}});
    };

    EXPECT_EQ(with_reason("FINISHED").status, core::PlaybackStatus::Stopped);
    EXPECT_EQ(with_reason("CANCELLED").status, core::PlaybackStatus::Stopped);
    auto failed = with_reason("ERROR");
    EXPECT_EQ(failed.status, core::PlaybackStatus::Error);
    EXPECT_TRUE(failed.error_message.has_value());
}

TEST(CastStatusParsingTest, NegativeTimeAndZeroDuration) {
    auto snapshot = parse_media_status(json{
        {"type", "MEDIA_STATUS"},
        {"status", json::array({{{"playerState", "PLAYING"}, {"currentTime", -3.0}, {"media", {{"duration", 0}}}}})}});

    EXPECT_EQ(snapshot.status, core::PlaybackStatus::Playing);
    EXPECT_EQ(snapshot.position, 0.0);
    EXPECT_FALSE(snapshot.duration.has_value());
}

TEST(CastStatusParsingTest, ReceiverVolume) {
    auto snapshot = parse_receiver_status(json{
        {"type", "RECEIVER_STATUS"},
        {"status", {{"volume", {{"level", 0.254}, {"muted", true}}}}}});

    EXPECT_EQ(snapshot.volume, 25);
    EXPECT_EQ(snapshot.muted, true);
    EXPECT_FALSE(snapshot.status.has_value());
}
