#pragma once

#include "castbridge/services/discovery/discovery_scanner.hpp"
#include "castbridge/services/network/http_client.hpp"
#include <memory>
#include <string>

namespace castbridge {
namespace services {

// Finds Roku receivers with an SSDP M-SEARCH for roku:ecp, then reads each
// responder's /query/device-info for its name and model
class SsdpDiscovery : public DiscoveryProvider {
public:
    explicit SsdpDiscovery(std::shared_ptr<HttpClient> http_client);

    core::DeviceKind kind() const override { return core::DeviceKind::RokuReceiver; }
    std::string name() const override { return "SSDP (Roku)"; }

    std::expected<std::vector<core::Device>, DiscoveryError>
    discover(std::chrono::milliseconds window, std::stop_token stop) override;

    // Fetches device-info for one ECP endpoint; nullopt when it does not answer
    std::optional<core::Device> describe(const std::string& host, std::uint16_t port);

    static std::string build_search_request(std::chrono::milliseconds window);

private:
    std::shared_ptr<HttpClient> m_http_client;
};

} // namespace services
} // namespace castbridge
