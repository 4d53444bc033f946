#include "castbridge/services/adapters/protocol_adapter.hpp"
#include "castbridge/utils/logger.hpp"

namespace castbridge::services {

core::DeviceKind ProtocolAdapter::kind() const {
    return dispatch([](const auto& adapter) { return adapter.kind(); });
}

core::DeviceCapabilities ProtocolAdapter::capabilities() const {
    return dispatch([](const auto& adapter) { return adapter.capabilities(); });
}

std::expected<void, core::Failure> ProtocolAdapter::connect(const core::Device& device) {
    return dispatch([&device](auto& adapter) { return adapter.connect(device); });
}

void ProtocolAdapter::disconnect() {
    dispatch([](auto& adapter) { adapter.disconnect(); });
}

void ProtocolAdapter::cancel() {
    dispatch([](auto& adapter) { adapter.cancel(); });
}

std::expected<void, core::Failure> ProtocolAdapter::load(const core::MediaRef& media) {
    return dispatch([&media](auto& adapter) { return adapter.load(media); });
}

std::expected<core::PlaybackStatus, core::Failure> ProtocolAdapter::play_pause() {
    return dispatch([](auto& adapter) { return adapter.play_pause(); });
}

std::expected<void, core::Failure> ProtocolAdapter::stop() {
    return dispatch([](auto& adapter) { return adapter.stop(); });
}

std::expected<double, core::Failure> ProtocolAdapter::seek(double delta_seconds) {
    return dispatch([delta_seconds](auto& adapter) { return adapter.seek(delta_seconds); });
}

std::expected<int, core::Failure> ProtocolAdapter::set_volume(int level) {
    return dispatch([level](auto& adapter) { return adapter.set_volume(level); });
}

std::expected<bool, core::Failure> ProtocolAdapter::toggle_mute() {
    return dispatch([](auto& adapter) { return adapter.toggle_mute(); });
}

std::expected<core::StatusSnapshot, core::Failure> ProtocolAdapter::poll_status() {
    return dispatch([](auto& adapter) { return adapter.poll_status(); });
}

void ProtocolAdapter::set_status_listener(StatusListener listener) {
    dispatch([&listener](auto& adapter) { adapter.set_status_listener(std::move(listener)); });
}

DefaultAdapterFactory::DefaultAdapterFactory(CastAdapter::ChannelFactory channel_factory,
                                             std::shared_ptr<HttpClient> http_client,
                                             AdapterTimeouts timeouts)
    : m_channel_factory(std::move(channel_factory))
    , m_http_client(std::move(http_client))
    , m_timeouts(timeouts) {}

std::unique_ptr<ProtocolAdapter> DefaultAdapterFactory::create(const core::Device& device) {
    CASTBRIDGE_LOG_DEBUG("AdapterFactory", "Creating " + core::to_string(device.kind) + " adapter for " + device.name);

    switch (device.kind) {
        case core::DeviceKind::CastReceiver:
            return std::make_unique<ProtocolAdapter>(std::in_place_type<CastAdapter>, m_channel_factory, m_timeouts);
        case core::DeviceKind::RokuReceiver:
            return std::make_unique<ProtocolAdapter>(std::in_place_type<RokuAdapter>, m_http_client, m_timeouts);
        case core::DeviceKind::AirPlayReceiver:
            return std::make_unique<ProtocolAdapter>(std::in_place_type<AirPlayAdapter>);
    }
    return nullptr;
}

} // namespace castbridge::services
