#pragma once

#include "castbridge/services/adapters/adapter_types.hpp"
#include "castbridge/services/adapters/cast_channel.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace castbridge::services {

// Drives a Cast receiver through the Default Media Receiver application
class CastAdapter {
public:
    using ChannelFactory = std::function<std::unique_ptr<CastChannel>()>;

    CastAdapter(ChannelFactory channel_factory, AdapterTimeouts timeouts);
    ~CastAdapter();

    CastAdapter(const CastAdapter&) = delete;
    CastAdapter& operator=(const CastAdapter&) = delete;

    core::DeviceKind kind() const { return core::DeviceKind::CastReceiver; }
    core::DeviceCapabilities capabilities() const { return {true, true, true}; }

    std::expected<void, core::Failure> connect(const core::Device& device);
    void disconnect();
    void cancel();

    std::expected<void, core::Failure> load(const core::MediaRef& media);
    // Returns the state the receiver was asked to enter
    std::expected<core::PlaybackStatus, core::Failure> play_pause();
    std::expected<void, core::Failure> stop();
    // Returns the absolute position that was requested
    std::expected<double, core::Failure> seek(double delta_seconds);
    std::expected<int, core::Failure> set_volume(int level);
    std::expected<bool, core::Failure> toggle_mute();
    std::expected<core::StatusSnapshot, core::Failure> poll_status();

    void set_status_listener(StatusListener listener);

private:
    struct Tracked {
        std::string transport_id;
        std::string app_session_id;
        std::optional<long long> media_session_id;
        core::PlaybackStatus status = core::PlaybackStatus::Idle;
        double position = 0.0;
        std::optional<double> duration;
        int volume = 100;
        bool muted = false;
    };

    ChannelFactory m_channel_factory;
    AdapterTimeouts m_timeouts;
    std::unique_ptr<CastChannel> m_channel;
    std::string m_connected_transport;

    mutable std::mutex m_state_mutex;
    Tracked m_tracked;
    StatusListener m_listener;

    std::expected<std::string, core::Failure> ensure_receiver_app();
    std::expected<nlohmann::json, core::Failure> media_command(const std::string& type, nlohmann::json payload);
    std::expected<nlohmann::json, core::Failure> receiver_request(nlohmann::json payload);

    void on_message(const std::string& ns, const nlohmann::json& payload);
    // Records receiver volume and the media receiver app, if running
    void track_receiver_status(const nlohmann::json& payload);
    void track_media_status(const nlohmann::json& payload);
};

// MEDIA_STATUS payload to a status report; an empty status array means no media session
core::StatusSnapshot parse_media_status(const nlohmann::json& payload);
// RECEIVER_STATUS payload to a status report carrying volume and mute only
core::StatusSnapshot parse_receiver_status(const nlohmann::json& payload);

} // namespace castbridge::services
