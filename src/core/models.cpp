#include "castbridge/core/models.hpp"

#include <algorithm>
#include <cctype>

namespace castbridge {
namespace core {

DeviceId Device::make_id(DeviceKind kind, const std::string& host,
                         std::uint16_t port, const std::string& name) {
    return DeviceId(to_string(kind) + ":" + host + ":" + std::to_string(port) + "/" + name);
}

std::expected<void, ValidationError> DiscoveryConfig::validate() const {
    if (scan_window < std::chrono::milliseconds{100} || scan_window > std::chrono::milliseconds{60000}) {
        return std::unexpected(ValidationError::InvalidScanWindow);
    }
    if (rescan_interval < std::chrono::seconds{1}) {
        return std::unexpected(ValidationError::InvalidInterval);
    }
    if (stale_after < std::chrono::seconds{0} || missed_passes_before_eviction < 1) {
        return std::unexpected(ValidationError::InvalidThreshold);
    }
    if (enabled_kinds.empty()) {
        return std::unexpected(ValidationError::NoDiscoveryKinds);
    }
    return {};
}

std::expected<void, ValidationError> SessionConfig::validate() const {
    if (poll_interval < std::chrono::milliseconds{50}) {
        return std::unexpected(ValidationError::InvalidInterval);
    }
    if (max_consecutive_poll_failures < 1) {
        return std::unexpected(ValidationError::InvalidThreshold);
    }
    if (connect_timeout < std::chrono::seconds{1} || command_timeout < std::chrono::seconds{1}) {
        return std::unexpected(ValidationError::InvalidInterval);
    }
    return {};
}

std::expected<void, ValidationError> MediaServerConfig::validate() const {
    if (bind_address.empty()) {
        return std::unexpected(ValidationError::InvalidAddress);
    }
    if (port == 0) {
        return std::unexpected(ValidationError::InvalidPort);
    }
    if (worker_threads < 1 || worker_threads > 64) {
        return std::unexpected(ValidationError::InvalidWorkerCount);
    }
    if (max_upload_bytes == 0) {
        return std::unexpected(ValidationError::InvalidUploadLimit);
    }
    if (relay_ticket_ttl < std::chrono::seconds{1} || upload_ttl < std::chrono::seconds{1}) {
        return std::unexpected(ValidationError::InvalidInterval);
    }
    return {};
}

bool ApplicationConfig::is_valid() const {
    return discovery.validate().has_value() &&
           session.validate().has_value() &&
           media_server.validate().has_value();
}

std::string ApplicationConfig::version_string() const {
#ifdef CASTBRIDGE_VERSION_STRING
    return CASTBRIDGE_VERSION_STRING;
#else
    return "0.0.0";
#endif
}

std::string to_string(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::CastReceiver: return "cast";
        case DeviceKind::RokuReceiver: return "roku";
        case DeviceKind::AirPlayReceiver: return "airplay";
    }
    return "unknown";
}

std::optional<DeviceKind> device_kind_from_string(std::string_view label) {
    std::string lowered(label);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "cast" || lowered == "chromecast") return DeviceKind::CastReceiver;
    if (lowered == "roku") return DeviceKind::RokuReceiver;
    if (lowered == "airplay") return DeviceKind::AirPlayReceiver;
    return std::nullopt;
}

std::string to_string(PlaybackStatus status) {
    switch (status) {
        case PlaybackStatus::Idle: return "idle";
        case PlaybackStatus::Loading: return "loading";
        case PlaybackStatus::Playing: return "playing";
        case PlaybackStatus::Paused: return "paused";
        case PlaybackStatus::Stopped: return "stopped";
        case PlaybackStatus::Error: return "error";
    }
    return "idle";
}

std::string to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Unbound: return "unbound";
        case SessionPhase::Binding: return "binding";
        case SessionPhase::Bound: return "bound";
        case SessionPhase::Unbinding: return "unbinding";
    }
    return "unbound";
}

std::string to_string(CastError error) {
    switch (error) {
        case CastError::ConnectionError: return "connection_error";
        case CastError::LoadError: return "load_error";
        case CastError::CommandError: return "command_error";
        case CastError::StatusError: return "status_error";
        case CastError::UnsupportedOperation: return "unsupported_operation";
        case CastError::Busy: return "busy";
        case CastError::NoActiveSession: return "no_active_session";
        case CastError::RangeError: return "range_error";
        case CastError::NotFound: return "not_found";
        case CastError::InvalidInput: return "invalid_input";
        case CastError::ServerNotRunning: return "server_not_running";
    }
    return "unknown";
}

} // namespace core
} // namespace castbridge
