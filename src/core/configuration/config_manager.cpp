#include "castbridge/core/application.hpp"
#include "castbridge/core/event_bus.hpp"
#include "castbridge/core/events.hpp"
#include "castbridge/utils/config_validator.hpp"
#include "castbridge/utils/logger.hpp"
#include "castbridge/utils/yaml_config.hpp"

#include <cstdlib>
#include <fstream>
#include <shared_mutex>
#include <sstream>

namespace castbridge {
namespace core {

class ConfigManager::Impl {
public:
    explicit Impl(const std::filesystem::path& config_path)
        : m_config_path(config_path.empty() ? default_config_directory() / "config.yaml" : config_path) {
        CASTBRIDGE_LOG_DEBUG("ConfigService", "Initializing with path: " + m_config_path.string());
        ensure_config_directory();
        std::error_code ec;
        m_config_exists = std::filesystem::exists(m_config_path, ec);
    }

    std::expected<void, ConfigError> load() {
        CASTBRIDGE_LOG_DEBUG("ConfigService", "Loading configuration");

        std::error_code ec;
        if (!std::filesystem::exists(m_config_path, ec)) {
            CASTBRIDGE_LOG_INFO("ConfigService", "Using default configuration");
            {
                std::unique_lock lock(m_mutex);
                m_config = ApplicationConfig{};
            }
            return save();
        }

        auto result = utils::YamlConfigHelper::load_from_file(m_config_path);
        if (!result) {
            return std::unexpected(result.error());
        }

        auto validation = utils::ConfigValidator::validate_application_config(*result);
        if (!validation.warnings.empty()) {
            CASTBRIDGE_LOG_WARNING("ConfigService", validation.get_warning_summary());
        }
        if (!validation.is_valid) {
            CASTBRIDGE_LOG_ERROR("ConfigService", "Invalid configuration: " + validation.get_error_summary());
            return std::unexpected(ConfigError::ValidationError);
        }

        std::unique_lock lock(m_mutex);
        m_config = *result;
        CASTBRIDGE_LOG_DEBUG("ConfigService", "Configuration loaded");
        return {};
    }

    std::expected<void, ConfigError> save() {
        ApplicationConfig config_copy;
        {
            std::shared_lock lock(m_mutex);
            config_copy = m_config;
        }

        CASTBRIDGE_LOG_DEBUG("ConfigService", "Saving configuration");

        auto result = utils::YamlConfigHelper::save_to_file(config_copy, m_config_path);

        if (result && !m_config_exists) {
            m_config_exists = true;
            if (auto documented = add_documentation_comments(); !documented) {
                CASTBRIDGE_LOG_DEBUG("ConfigService", "Configuration written without comments");
            }
        }

        return result;
    }

    std::expected<void, ConfigError> add_documentation_comments() const {
        std::ifstream in_file(m_config_path);
        if (!in_file) {
            return std::unexpected(ConfigError::FileNotFound);
        }

        std::stringstream content;
        content << "# castbridge configuration\n";
        content << "# This file was generated on first run; edit values below and restart\n\n";
        content << "# log_level: debug, info, warning, error or none\n\n";
        content << "# discovery\n";
        content << "#   scan_window_ms: How long one scan listens for answers\n";
        content << "#   rescan_interval: Seconds between background scans\n";
        content << "#   stale_after: Seconds a device must be unseen before it can be dropped\n";
        content << "#   missed_passes_before_eviction: Consecutive scans a device may miss\n";
        content << "#   enabled_kinds: Any of cast, roku, airplay\n\n";
        content << "# session\n";
        content << "#   poll_interval_ms: Status refresh period while a device is bound\n";
        content << "#   max_consecutive_poll_failures: Misses before the device is reported lost\n";
        content << "#   connect_timeout / command_timeout: Seconds\n\n";
        content << "# media_server\n";
        content << "#   bind_address / port: Where the HTTP server listens (port 0 picks one)\n";
        content << "#   advertised_host: Address given to receivers; empty detects the LAN address\n";
        content << "#   upload_dir: Where phone uploads are stored; empty uses the temp directory\n";
        content << "#   max_upload_bytes, upload_ttl, relay_ticket_ttl, worker_threads\n\n";

        content << in_file.rdbuf();
        in_file.close();

        std::ofstream out_file(m_config_path);
        if (!out_file) {
            return std::unexpected(ConfigError::WriteFailed);
        }

        out_file << content.str();
        CASTBRIDGE_LOG_INFO("ConfigService", "Wrote default configuration to " + m_config_path.string());
        return {};
    }

    ApplicationConfig get() const {
        std::shared_lock lock(m_mutex);
        return m_config;
    }

    std::expected<void, ConfigError> update(const ApplicationConfig& config) {
        CASTBRIDGE_LOG_INFO("ConfigService", "Updating configuration");

        auto validation = utils::ConfigValidator::validate_application_config(config);
        if (!validation.is_valid) {
            CASTBRIDGE_LOG_ERROR("ConfigService", "Rejected configuration: " + validation.get_error_summary());
            return std::unexpected(ConfigError::ValidationError);
        }

        ApplicationConfig old_config;
        {
            std::unique_lock lock(m_mutex);
            old_config = m_config;
            m_config = config;
        }

        // Save and publish outside of lock
        auto result = save();
        if (result && m_event_bus) {
            m_event_bus->publish(events::ConfigurationUpdated{std::move(old_config), config});
        }
        return result;
    }

    const std::filesystem::path& path() const {
        return m_config_path;
    }

    void set_event_bus(std::shared_ptr<EventBus> bus) {
        m_event_bus = std::move(bus);
    }

private:
    void ensure_config_directory() {
        auto dir = m_config_path.parent_path();
        if (dir.empty()) {
            return;
        }
        std::error_code ec;
        if (!std::filesystem::exists(dir, ec)) {
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                CASTBRIDGE_LOG_WARNING("ConfigService", "Cannot create " + dir.string() + ": " + ec.message());
            } else {
                CASTBRIDGE_LOG_DEBUG("ConfigService", "Created directory: " + dir.string());
            }
        }
    }

    mutable std::shared_mutex m_mutex;
    std::filesystem::path m_config_path;
    ApplicationConfig m_config;
    std::shared_ptr<EventBus> m_event_bus;
    bool m_config_exists = false;
};

// ConfigManager implementation

ConfigManager::ConfigManager(const std::filesystem::path& config_path)
    : m_impl(std::make_unique<Impl>(config_path)) {}

ConfigManager::~ConfigManager() = default;

std::expected<void, ConfigError> ConfigManager::load() {
    return m_impl->load();
}

std::expected<void, ConfigError> ConfigManager::save() {
    return m_impl->save();
}

ApplicationConfig ConfigManager::get() const {
    return m_impl->get();
}

std::expected<void, ConfigError> ConfigManager::update(const ApplicationConfig& config) {
    return m_impl->update(config);
}

const std::filesystem::path& ConfigManager::path() const {
    return m_impl->path();
}

void ConfigManager::set_event_bus(std::shared_ptr<EventBus> bus) {
    m_impl->set_event_bus(std::move(bus));
}

std::filesystem::path ConfigManager::default_config_directory() {
    // $XDG_CONFIG_HOME/castbridge or ~/.config/castbridge
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME"); xdg_config && *xdg_config) {
        return std::filesystem::path(xdg_config) / "castbridge";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "castbridge";
    }
    return std::filesystem::current_path() / ".castbridge";
}

} // namespace core
} // namespace castbridge
