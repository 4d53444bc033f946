#pragma once

#include "castbridge/core/models.hpp"
#include <string>
#include <utility>
#include <vector>

namespace castbridge::utils {

/**
 * @brief Detailed validation result
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<std::pair<core::ValidationError, std::string>> errors;
    std::vector<std::string> warnings;

    void add_error(core::ValidationError error, const std::string& message) {
        is_valid = false;
        errors.emplace_back(error, message);
    }

    void add_warning(const std::string& message) {
        warnings.emplace_back(message);
    }

    void merge(const ValidationResult& other) {
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
        is_valid = is_valid && other.is_valid;
    }

    std::string get_error_summary() const {
        std::string summary;
        for (const auto& [error, message] : errors) {
            if (!summary.empty()) summary += "; ";
            summary += message;
        }
        return summary;
    }

    std::string get_warning_summary() const {
        std::string summary;
        for (const auto& warning : warnings) {
            if (!summary.empty()) summary += "; ";
            summary += warning;
        }
        return summary;
    }
};

/**
 * @brief Configuration validator
 *
 * Hard limits come from each config struct's validate(); this adds readable
 * messages and warnings for values that work but are probably unintended.
 */
class ConfigValidator {
public:
    static ValidationResult validate_discovery_config(const core::DiscoveryConfig& config);
    static ValidationResult validate_session_config(const core::SessionConfig& config);
    static ValidationResult validate_media_server_config(const core::MediaServerConfig& config);
    static ValidationResult validate_application_config(const core::ApplicationConfig& config);
};

} // namespace castbridge::utils
