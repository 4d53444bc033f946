#pragma once

#include "castbridge/services/discovery/discovery_scanner.hpp"
#include <map>
#include <string>

namespace castbridge {
namespace services {

// Browses _googlecast._tcp through the local Avahi daemon
class MdnsDiscovery : public DiscoveryProvider {
public:
    static constexpr const char* kServiceType = "_googlecast._tcp";
    static constexpr std::uint16_t kDefaultCastPort = 8009;

    core::DeviceKind kind() const override { return core::DeviceKind::CastReceiver; }
    std::string name() const override { return "mDNS (Cast)"; }

    std::expected<std::vector<core::Device>, DiscoveryError>
    discover(std::chrono::milliseconds window, std::stop_token stop) override;
};

// Builds a Cast device from a resolved service. TXT "fn" is the friendly
// name and "md" the model; the service instance name is the fallback.
core::Device make_cast_device(const std::string& host, std::uint16_t port,
                              const std::string& service_name,
                              const std::map<std::string, std::string>& txt);

} // namespace services
} // namespace castbridge
