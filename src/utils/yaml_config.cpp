#include "castbridge/utils/yaml_config.hpp"
#include "castbridge/utils/logger.hpp"
#include <fstream>

namespace castbridge {
namespace utils {

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        CASTBRIDGE_LOG_WARNING("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        CASTBRIDGE_LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<void, core::ConfigError>
YamlConfigHelper::save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path) {
    try {
        auto dir = path.parent_path();
        if (!dir.empty() && !std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }

        YAML::Node node = to_yaml(config);
        std::ofstream file(path);
        if (!file) {
            CASTBRIDGE_LOG_ERROR("YamlConfig", "Cannot open file for writing: " + path.string());
            return std::unexpected(core::ConfigError::WriteFailed);
        }

        file << node;
        return {};
    } catch (const std::filesystem::filesystem_error& e) {
        CASTBRIDGE_LOG_ERROR("YamlConfig", "Save error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::WriteFailed);
    } catch (const YAML::Exception& e) {
        CASTBRIDGE_LOG_ERROR("YamlConfig", "Save error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

core::ApplicationConfig YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::ApplicationConfig config;

    if (node["log_level"]) {
        const auto text = node["log_level"].as<std::string>();
        if (auto level = parse_log_level(text)) {
            config.log_level = *level;
        } else {
            CASTBRIDGE_LOG_WARNING("YamlConfig", "Unknown log_level '" + text + "', using info");
        }
    }
    if (node["discovery"]) {
        config.discovery = parse_discovery_config(node["discovery"]);
    }
    if (node["session"]) {
        config.session = parse_session_config(node["session"]);
    }
    if (node["media_server"]) {
        config.media_server = parse_media_server_config(node["media_server"]);
    }

    return config;
}

YAML::Node YamlConfigHelper::to_yaml(const core::ApplicationConfig& config) {
    YAML::Node node;

    node["log_level"] = to_string(config.log_level);
    merge_discovery_config(node, config.discovery);
    merge_session_config(node, config.session);
    merge_media_server_config(node, config.media_server);

    return node;
}

core::DiscoveryConfig YamlConfigHelper::parse_discovery_config(const YAML::Node& node) {
    core::DiscoveryConfig config;

    if (node["scan_window_ms"]) {
        config.scan_window = std::chrono::milliseconds(node["scan_window_ms"].as<int>());
    }
    if (node["rescan_interval"]) {
        config.rescan_interval = std::chrono::seconds(node["rescan_interval"].as<int>());
    }
    if (node["stale_after"]) {
        config.stale_after = std::chrono::seconds(node["stale_after"].as<int>());
    }
    if (node["missed_passes_before_eviction"]) {
        config.missed_passes_before_eviction = node["missed_passes_before_eviction"].as<int>();
    }
    if (node["enabled_kinds"]) {
        config.enabled_kinds.clear();
        for (const auto& kind_node : node["enabled_kinds"]) {
            auto label = kind_node.as<std::string>();
            if (auto kind = core::device_kind_from_string(label)) {
                config.enabled_kinds.push_back(*kind);
            } else {
                CASTBRIDGE_LOG_WARNING("YamlConfig", "Ignoring unknown device kind: " + label);
            }
        }
    }

    return config;
}

core::SessionConfig YamlConfigHelper::parse_session_config(const YAML::Node& node) {
    core::SessionConfig config;

    if (node["poll_interval_ms"]) {
        config.poll_interval = std::chrono::milliseconds(node["poll_interval_ms"].as<int>());
    }
    if (node["max_consecutive_poll_failures"]) {
        config.max_consecutive_poll_failures = node["max_consecutive_poll_failures"].as<int>();
    }
    if (node["connect_timeout"]) {
        config.connect_timeout = std::chrono::seconds(node["connect_timeout"].as<int>());
    }
    if (node["command_timeout"]) {
        config.command_timeout = std::chrono::seconds(node["command_timeout"].as<int>());
    }

    return config;
}

core::MediaServerConfig YamlConfigHelper::parse_media_server_config(const YAML::Node& node) {
    core::MediaServerConfig config;

    if (node["bind_address"]) {
        config.bind_address = node["bind_address"].as<std::string>();
    }
    if (node["port"]) {
        config.port = node["port"].as<std::uint16_t>();
    }
    if (node["advertised_host"]) {
        config.advertised_host = node["advertised_host"].as<std::string>();
    }
    if (node["upload_dir"]) {
        config.upload_dir = node["upload_dir"].as<std::string>();
    }
    if (node["max_upload_bytes"]) {
        config.max_upload_bytes = node["max_upload_bytes"].as<std::uint64_t>();
    }
    if (node["upload_ttl"]) {
        config.upload_ttl = std::chrono::seconds(node["upload_ttl"].as<int>());
    }
    if (node["relay_ticket_ttl"]) {
        config.relay_ticket_ttl = std::chrono::seconds(node["relay_ticket_ttl"].as<int>());
    }
    if (node["worker_threads"]) {
        config.worker_threads = node["worker_threads"].as<int>();
    }

    return config;
}

void YamlConfigHelper::merge_discovery_config(YAML::Node& node, const core::DiscoveryConfig& config) {
    node["discovery"]["scan_window_ms"] = static_cast<int>(config.scan_window.count());
    node["discovery"]["rescan_interval"] = static_cast<int>(config.rescan_interval.count());
    node["discovery"]["stale_after"] = static_cast<int>(config.stale_after.count());
    node["discovery"]["missed_passes_before_eviction"] = config.missed_passes_before_eviction;

    YAML::Node kinds(YAML::NodeType::Sequence);
    for (auto kind : config.enabled_kinds) {
        kinds.push_back(core::to_string(kind));
    }
    node["discovery"]["enabled_kinds"] = kinds;
}

void YamlConfigHelper::merge_session_config(YAML::Node& node, const core::SessionConfig& config) {
    node["session"]["poll_interval_ms"] = static_cast<int>(config.poll_interval.count());
    node["session"]["max_consecutive_poll_failures"] = config.max_consecutive_poll_failures;
    node["session"]["connect_timeout"] = static_cast<int>(config.connect_timeout.count());
    node["session"]["command_timeout"] = static_cast<int>(config.command_timeout.count());
}

void YamlConfigHelper::merge_media_server_config(YAML::Node& node, const core::MediaServerConfig& config) {
    node["media_server"]["bind_address"] = config.bind_address;
    node["media_server"]["port"] = config.port;
    node["media_server"]["advertised_host"] = config.advertised_host;
    node["media_server"]["upload_dir"] = config.upload_dir;
    node["media_server"]["max_upload_bytes"] = config.max_upload_bytes;
    node["media_server"]["upload_ttl"] = static_cast<int>(config.upload_ttl.count());
    node["media_server"]["relay_ticket_ttl"] = static_cast<int>(config.relay_ticket_ttl.count());
    node["media_server"]["worker_threads"] = config.worker_threads;
}

} // namespace utils
} // namespace castbridge
