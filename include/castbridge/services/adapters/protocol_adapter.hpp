#pragma once

#include "castbridge/services/adapters/airplay_adapter.hpp"
#include "castbridge/services/adapters/cast_adapter.hpp"
#include "castbridge/services/adapters/roku_adapter.hpp"

#include <memory>
#include <utility>
#include <variant>

namespace castbridge::services {

// The closed set of receiver protocols. Every operation is forwarded to the
// active alternative through dispatch().
class ProtocolAdapter {
public:
    using Variant = std::variant<CastAdapter, RokuAdapter, AirPlayAdapter>;

    template<typename Adapter, typename... Args>
    explicit ProtocolAdapter(std::in_place_type_t<Adapter> tag, Args&&... args)
        : m_adapter(tag, std::forward<Args>(args)...) {}

    ProtocolAdapter(const ProtocolAdapter&) = delete;
    ProtocolAdapter& operator=(const ProtocolAdapter&) = delete;

    core::DeviceKind kind() const;
    core::DeviceCapabilities capabilities() const;

    std::expected<void, core::Failure> connect(const core::Device& device);
    void disconnect();
    // Aborts an in-flight command; safe to call from another thread
    void cancel();

    std::expected<void, core::Failure> load(const core::MediaRef& media);
    std::expected<core::PlaybackStatus, core::Failure> play_pause();
    std::expected<void, core::Failure> stop();
    std::expected<double, core::Failure> seek(double delta_seconds);
    std::expected<int, core::Failure> set_volume(int level);
    std::expected<bool, core::Failure> toggle_mute();
    std::expected<core::StatusSnapshot, core::Failure> poll_status();

    void set_status_listener(StatusListener listener);

private:
    Variant m_adapter;

    template<typename F>
    decltype(auto) dispatch(F&& f) {
        return std::visit(std::forward<F>(f), m_adapter);
    }

    template<typename F>
    decltype(auto) dispatch(F&& f) const {
        return std::visit(std::forward<F>(f), m_adapter);
    }
};

class AdapterFactory {
public:
    virtual ~AdapterFactory() = default;
    virtual std::unique_ptr<ProtocolAdapter> create(const core::Device& device) = 0;
};

// Cast adapters get channels from channel_factory, Roku adapters share http_client
class DefaultAdapterFactory : public AdapterFactory {
public:
    DefaultAdapterFactory(CastAdapter::ChannelFactory channel_factory,
                          std::shared_ptr<HttpClient> http_client,
                          AdapterTimeouts timeouts);

    std::unique_ptr<ProtocolAdapter> create(const core::Device& device) override;

private:
    CastAdapter::ChannelFactory m_channel_factory;
    std::shared_ptr<HttpClient> m_http_client;
    AdapterTimeouts m_timeouts;
};

} // namespace castbridge::services
