#include "castbridge/utils/config_validator.hpp"

#include <boost/asio/ip/address.hpp>

namespace castbridge::utils {

ValidationResult ConfigValidator::validate_discovery_config(const core::DiscoveryConfig& config) {
    ValidationResult result;

    if (auto valid = config.validate(); !valid) {
        switch (valid.error()) {
            case core::ValidationError::InvalidScanWindow:
                result.add_error(valid.error(), "Scan window must be between 100 ms and 60 s");
                break;
            case core::ValidationError::NoDiscoveryKinds:
                result.add_error(valid.error(), "At least one device kind must be enabled for discovery");
                break;
            case core::ValidationError::InvalidThreshold:
                result.add_error(valid.error(), "Eviction needs at least one missed pass and a non-negative stale window");
                break;
            default:
                result.add_error(valid.error(), "Rescan interval must be at least 1 second");
                break;
        }
        return result;
    }

    if (config.scan_window > std::chrono::milliseconds{10000}) {
        result.add_warning("Scan windows over 10 seconds make the device list slow to refresh");
    }
    if (config.stale_after < config.rescan_interval) {
        result.add_warning("stale_after shorter than rescan_interval evicts devices after a single quiet pass");
    }

    return result;
}

ValidationResult ConfigValidator::validate_session_config(const core::SessionConfig& config) {
    ValidationResult result;

    if (auto valid = config.validate(); !valid) {
        if (valid.error() == core::ValidationError::InvalidThreshold) {
            result.add_error(valid.error(), "max_consecutive_poll_failures must be at least 1");
        } else {
            result.add_error(valid.error(), "Poll interval must be at least 50 ms and timeouts at least 1 second");
        }
        return result;
    }

    if (config.poll_interval < std::chrono::milliseconds{250}) {
        result.add_warning("Poll intervals under 250 ms put noticeable load on receivers");
    }

    return result;
}

ValidationResult ConfigValidator::validate_media_server_config(const core::MediaServerConfig& config) {
    ValidationResult result;

    if (auto valid = config.validate(); !valid) {
        switch (valid.error()) {
            case core::ValidationError::InvalidPort:
                result.add_error(valid.error(), "Media server port must be non-zero");
                break;
            case core::ValidationError::InvalidWorkerCount:
                result.add_error(valid.error(), "worker_threads must be between 1 and 64");
                break;
            case core::ValidationError::InvalidUploadLimit:
                result.add_error(valid.error(), "max_upload_bytes must be positive");
                break;
            case core::ValidationError::InvalidAddress:
                result.add_error(valid.error(), "bind_address cannot be empty");
                break;
            default:
                result.add_error(valid.error(), "Ticket and upload lifetimes must be at least 1 second");
                break;
        }
        return result;
    }

    boost::system::error_code ec;
    boost::asio::ip::make_address(config.bind_address, ec);
    if (ec) {
        result.add_error(core::ValidationError::InvalidAddress,
            "bind_address is not an IP address: " + config.bind_address);
    }

    if (config.port < 1024) {
        result.add_warning("Ports below 1024 usually need elevated privileges");
    }

    return result;
}

ValidationResult ConfigValidator::validate_application_config(const core::ApplicationConfig& config) {
    ValidationResult result;

    result.merge(validate_discovery_config(config.discovery));
    result.merge(validate_session_config(config.session));
    result.merge(validate_media_server_config(config.media_server));

    return result;
}

} // namespace castbridge::utils
