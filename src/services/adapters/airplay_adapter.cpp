#include "castbridge/services/adapters/airplay_adapter.hpp"
#include "castbridge/utils/logger.hpp"

namespace castbridge::services {

namespace {
    std::unexpected<core::Failure> unsupported() {
        return core::make_failure(core::CastError::UnsupportedOperation, "AirPlay is not supported yet");
    }
}

std::expected<void, core::Failure> AirPlayAdapter::connect(const core::Device& device) {
    CASTBRIDGE_LOG_WARNING("AirPlayAdapter", "Refusing to connect to " + device.name + ": AirPlay is not implemented");
    return core::make_failure(core::CastError::ConnectionError, "AirPlay receivers are not supported yet");
}

std::expected<void, core::Failure> AirPlayAdapter::load(const core::MediaRef&) {
    return unsupported();
}

std::expected<core::PlaybackStatus, core::Failure> AirPlayAdapter::play_pause() {
    return unsupported();
}

std::expected<void, core::Failure> AirPlayAdapter::stop() {
    return unsupported();
}

std::expected<double, core::Failure> AirPlayAdapter::seek(double) {
    return unsupported();
}

std::expected<int, core::Failure> AirPlayAdapter::set_volume(int) {
    return unsupported();
}

std::expected<bool, core::Failure> AirPlayAdapter::toggle_mute() {
    return unsupported();
}

std::expected<core::StatusSnapshot, core::Failure> AirPlayAdapter::poll_status() {
    return unsupported();
}

} // namespace castbridge::services
