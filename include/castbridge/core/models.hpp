#pragma once

#include "castbridge/utils/logger.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace castbridge {
namespace core {

// ============================================================================
// Application-wide types
// ============================================================================

enum class ApplicationState {
    NotInitialized,
    Initializing,
    Running,
    Stopping,
    Stopped,
    Error
};

enum class ApplicationError {
    InitializationFailed,
    ServiceUnavailable,
    ConfigurationError,
    AlreadyRunning
};

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    WriteFailed
};

enum class ValidationError {
    InvalidScanWindow,
    InvalidInterval,
    InvalidThreshold,
    InvalidPort,
    InvalidAddress,
    InvalidWorkerCount,
    InvalidUploadLimit,
    NoDiscoveryKinds
};

// ============================================================================
// Domain types
// ============================================================================

enum class DeviceKind {
    CastReceiver,
    RokuReceiver,
    AirPlayReceiver  // reserved, never connects
};

enum class PlaybackStatus {
    Idle,
    Loading,
    Playing,
    Paused,
    Stopped,
    Error
};

enum class SessionPhase {
    Unbound,
    Binding,
    Bound,
    Unbinding
};

enum class CastError {
    ConnectionError,
    LoadError,
    CommandError,
    StatusError,
    UnsupportedOperation,
    Busy,
    NoActiveSession,
    RangeError,
    NotFound,
    InvalidInput,
    ServerNotRunning
};

// Error plus the human-readable cause reported to the consumer
struct Failure {
    CastError error = CastError::CommandError;
    std::string message;
};

inline std::unexpected<Failure> make_failure(CastError error, std::string message) {
    return std::unexpected(Failure{error, std::move(message)});
}

struct DeviceId {
    std::string value;

    DeviceId() = default;
    explicit DeviceId(std::string id) : value(std::move(id)) {}

    bool empty() const { return value.empty(); }
    const std::string& get() const { return value; }

    bool operator==(const DeviceId& other) const { return value == other.value; }
    bool operator<(const DeviceId& other) const { return value < other.value; }
};

struct DeviceCapabilities {
    bool supports_seek = false;
    bool supports_volume = false;
    bool supports_mute = false;

    bool operator==(const DeviceCapabilities&) const = default;
};

struct Device {
    DeviceId id;
    std::string name;
    DeviceKind kind = DeviceKind::CastReceiver;
    std::string host;
    std::uint16_t port = 0;
    std::string model;
    std::chrono::system_clock::time_point last_seen;
    DeviceCapabilities capabilities;

    // Stable identity: kind + network address + advertised name
    static DeviceId make_id(DeviceKind kind, const std::string& host,
                            std::uint16_t port, const std::string& name);

    std::string address() const { return host + ":" + std::to_string(port); }
};

struct MediaRef {
    std::string url;
    std::string content_type;
    std::string title;
};

struct PlaybackState {
    PlaybackStatus status = PlaybackStatus::Idle;
    std::optional<MediaRef> media;
    double position = 0.0;               // seconds, never negative
    std::optional<double> duration;      // seconds, when the device reports one
    int volume = 100;                    // 0-100
    bool muted = false;
    std::optional<Failure> last_error;
};

// One report from a device. Absent fields mean "not reported", never "zero".
struct StatusSnapshot {
    std::optional<PlaybackStatus> status;
    std::optional<double> position;
    std::optional<double> duration;
    std::optional<int> volume;
    std::optional<bool> muted;
    std::optional<std::string> content_url;
    std::optional<std::string> error_message;
};

// ============================================================================
// Configuration structures
// ============================================================================

struct DiscoveryConfig {
    std::chrono::milliseconds scan_window{3000};
    std::chrono::seconds rescan_interval{15};
    std::chrono::seconds stale_after{30};
    int missed_passes_before_eviction = 3;
    std::vector<DeviceKind> enabled_kinds{DeviceKind::CastReceiver, DeviceKind::RokuReceiver};

    std::expected<void, ValidationError> validate() const;
};

struct SessionConfig {
    std::chrono::milliseconds poll_interval{1000};
    int max_consecutive_poll_failures = 3;
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds command_timeout{5};

    std::expected<void, ValidationError> validate() const;
};

struct MediaServerConfig {
    std::string bind_address = "0.0.0.0";
    std::uint16_t port = 8765;
    std::string advertised_host;                 // empty: detect LAN address
    std::string upload_dir;                      // empty: <tmp>/castbridge-uploads
    std::uint64_t max_upload_bytes = 4ULL * 1024 * 1024 * 1024;
    std::chrono::seconds upload_ttl{6 * 3600};
    std::chrono::seconds relay_ticket_ttl{60};
    int worker_threads = 4;

    std::expected<void, ValidationError> validate() const;
};

struct ApplicationConfig {
    DiscoveryConfig discovery;
    SessionConfig session;
    MediaServerConfig media_server;

    utils::LogLevel log_level = utils::LogLevel::Info;

    bool is_valid() const;
    std::string version_string() const;
};

// ============================================================================
// String conversions
// ============================================================================

// Short lowercase label used in filters and config: "cast", "roku", "airplay"
std::string to_string(DeviceKind kind);
std::optional<DeviceKind> device_kind_from_string(std::string_view label);

std::string to_string(PlaybackStatus status);
std::string to_string(SessionPhase phase);
std::string to_string(CastError error);

template<typename T>
using EventCallback = std::function<void(const T&)>;

} // namespace core
} // namespace castbridge

namespace std {
    template<>
    struct hash<castbridge::core::DeviceId> {
        std::size_t operator()(const castbridge::core::DeviceId& id) const noexcept {
            return std::hash<std::string>{}(id.value);
        }
    };
}
