#pragma once

#include "castbridge/services/adapters/adapter_types.hpp"

namespace castbridge::services {

// Placeholder for AirPlay receivers: never connects, every command is unsupported
class AirPlayAdapter {
public:
    AirPlayAdapter() = default;

    core::DeviceKind kind() const { return core::DeviceKind::AirPlayReceiver; }
    core::DeviceCapabilities capabilities() const { return {}; }

    std::expected<void, core::Failure> connect(const core::Device& device);
    void disconnect() {}
    void cancel() {}

    std::expected<void, core::Failure> load(const core::MediaRef& media);
    std::expected<core::PlaybackStatus, core::Failure> play_pause();
    std::expected<void, core::Failure> stop();
    std::expected<double, core::Failure> seek(double delta_seconds);
    std::expected<int, core::Failure> set_volume(int level);
    std::expected<bool, core::Failure> toggle_mute();
    std::expected<core::StatusSnapshot, core::Failure> poll_status();

    void set_status_listener(StatusListener) {}
};

} // namespace castbridge::services
