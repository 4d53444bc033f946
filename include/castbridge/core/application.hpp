#pragma once

#include "castbridge/core/models.hpp"
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Forward declarations
namespace castbridge {
namespace core {
    class EventBus;
}

namespace services {
    class SessionController;
}
}

namespace castbridge {
namespace core {

// Configuration manager
class ConfigManager {
public:
    explicit ConfigManager(const std::filesystem::path& config_path = {});
    ~ConfigManager();

    // Core operations
    std::expected<void, ConfigError> load();
    std::expected<void, ConfigError> save();

    // Configuration access
    ApplicationConfig get() const;
    std::expected<void, ConfigError> update(const ApplicationConfig& config);
    const std::filesystem::path& path() const;

    // Event notifications
    void set_event_bus(std::shared_ptr<EventBus> bus);

    // $XDG_CONFIG_HOME/castbridge, or ~/.config/castbridge
    static std::filesystem::path default_config_directory();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// Everything a front end needs: discovery, the active session and the
// media server, wired together and driven through one object
class Application {
public:
    virtual ~Application() = default;

    // Lifecycle management
    virtual std::expected<void, ApplicationError> initialize() = 0;
    virtual std::expected<void, ApplicationError> start() = 0;
    virtual void stop() = 0;

    // State management
    virtual ApplicationState get_state() const = 0;
    virtual bool is_running() const = 0;

    // Devices
    virtual std::vector<Device> devices() const = 0;
    virtual std::vector<Device> filter_devices(const std::string& query,
                                               const std::vector<DeviceKind>& kinds = {}) const = 0;
    // Blocks for one scan window; an empty kinds list scans the configured kinds
    virtual std::vector<Device> scan(const std::vector<DeviceKind>& kinds = {}) = 0;

    // Session
    virtual std::expected<void, Failure> bind(const DeviceId& id) = 0;
    virtual std::expected<void, Failure> unbind() = 0;
    virtual std::expected<MediaRef, Failure> cast_local_file(const std::filesystem::path& path) = 0;
    virtual std::expected<MediaRef, Failure> cast_remote_url(const std::string& url,
                                                             const std::string& title = {}) = 0;
    virtual PlaybackState playback_state() const = 0;
    virtual SessionPhase session_phase() const = 0;
    virtual std::optional<Device> bound_device() const = 0;

    // Empty while the media server is not running
    virtual std::string remote_url() const = 0;

    // Service access
    virtual std::expected<std::reference_wrapper<services::SessionController>, ApplicationError> session() = 0;
    virtual std::expected<std::shared_ptr<ConfigManager>, ApplicationError> get_configuration_service() = 0;
    virtual ApplicationConfig config() const = 0;

    // Event bus access
    virtual std::shared_ptr<EventBus> event_bus() const = 0;
};

// Application creation
std::expected<std::unique_ptr<Application>, ApplicationError> create_application(
    const std::filesystem::path& config_path = {});

} // namespace core
} // namespace castbridge
