#pragma once

#include "castbridge/core/models.hpp"
#include <yaml-cpp/yaml.h>
#include <expected>
#include <filesystem>

namespace castbridge {
namespace utils {

class YamlConfigHelper {
public:
    static std::expected<core::ApplicationConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    static std::expected<void, core::ConfigError>
    save_to_file(const core::ApplicationConfig& config, const std::filesystem::path& path);

    // Missing keys keep their defaults
    static core::ApplicationConfig from_yaml(const YAML::Node& node);
    static YAML::Node to_yaml(const core::ApplicationConfig& config);

private:
    static core::DiscoveryConfig parse_discovery_config(const YAML::Node& node);
    static core::SessionConfig parse_session_config(const YAML::Node& node);
    static core::MediaServerConfig parse_media_server_config(const YAML::Node& node);

    static void merge_discovery_config(YAML::Node& node, const core::DiscoveryConfig& config);
    static void merge_session_config(YAML::Node& node, const core::SessionConfig& config);
    static void merge_media_server_config(YAML::Node& node, const core::MediaServerConfig& config);
};

} // namespace utils
} // namespace castbridge
