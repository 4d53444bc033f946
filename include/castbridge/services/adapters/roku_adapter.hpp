#pragma once

#include "castbridge/services/adapters/adapter_types.hpp"
#include "castbridge/services/network/http_client.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace castbridge::services {

// Roku receivers over ECP. Play/pause is a single toggle key, there is no
// seek or volume control, and mute exists only on Roku TVs.
class RokuAdapter {
public:
    RokuAdapter(std::shared_ptr<HttpClient> http_client, AdapterTimeouts timeouts);

    RokuAdapter(const RokuAdapter&) = delete;
    RokuAdapter& operator=(const RokuAdapter&) = delete;

    core::DeviceKind kind() const { return core::DeviceKind::RokuReceiver; }
    core::DeviceCapabilities capabilities() const { return {false, false, m_is_tv}; }

    std::expected<void, core::Failure> connect(const core::Device& device);
    void disconnect();
    void cancel() {}

    std::expected<void, core::Failure> load(const core::MediaRef& media);
    std::expected<core::PlaybackStatus, core::Failure> play_pause();
    std::expected<void, core::Failure> stop();
    std::expected<double, core::Failure> seek(double delta_seconds);
    std::expected<int, core::Failure> set_volume(int level);
    std::expected<bool, core::Failure> toggle_mute();
    std::expected<core::StatusSnapshot, core::Failure> poll_status();

    // ECP has no push channel
    void set_status_listener(StatusListener) {}

    static std::string build_launch_path(const core::MediaRef& media);

private:
    std::shared_ptr<HttpClient> m_http_client;
    AdapterTimeouts m_timeouts;

    std::string m_host;
    std::uint16_t m_port = 0;
    bool m_is_tv = false;
    bool m_muted = false;
    core::PlaybackStatus m_last_status = core::PlaybackStatus::Idle;
    // Set by load() until the player reports play or pause
    std::optional<std::chrono::steady_clock::time_point> m_launched_at;

    std::expected<HttpResponse, core::Failure> post(const std::string& path, core::CastError on_failure);
    std::expected<void, core::Failure> keypress(const std::string& key);
    std::string url(const std::string& path) const;
};

} // namespace castbridge::services
