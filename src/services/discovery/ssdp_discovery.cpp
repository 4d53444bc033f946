#include "castbridge/services/discovery/ssdp_discovery.hpp"
#include "castbridge/services/adapters/roku_ecp.hpp"
#include "castbridge/utils/logger.hpp"
#include "castbridge/utils/url_utils.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <array>
#include <functional>
#include <set>

namespace castbridge {
namespace services {

namespace net = boost::asio;
using udp = net::ip::udp;

namespace {
    constexpr const char* kMulticastAddress = "239.255.255.250";
    constexpr unsigned short kMulticastPort = 1900;
    constexpr std::chrono::seconds kDeviceInfoTimeout{3};
}

SsdpDiscovery::SsdpDiscovery(std::shared_ptr<HttpClient> http_client)
    : m_http_client(std::move(http_client)) {}

std::string SsdpDiscovery::build_search_request(std::chrono::milliseconds window) {
    auto mx = std::clamp<long long>(std::chrono::duration_cast<std::chrono::seconds>(window).count(), 1, 5);
    return "M-SEARCH * HTTP/1.1\r\n"
           "HOST: 239.255.255.250:1900\r\n"
           "MAN: \"ssdp:discover\"\r\n"
           "ST: " + std::string(roku::kSearchTarget) + "\r\n"
           "MX: " + std::to_string(mx) + "\r\n"
           "\r\n";
}

std::expected<std::vector<core::Device>, DiscoveryError>
SsdpDiscovery::discover(std::chrono::milliseconds window, std::stop_token stop) {
    net::io_context ioc;
    udp::socket socket(ioc);
    boost::system::error_code ec;

    socket.open(udp::v4(), ec);
    if (ec) {
        CASTBRIDGE_LOG_WARNING("SsdpDiscovery", "Failed to open UDP socket: " + ec.message());
        return std::unexpected(DiscoveryError::Unavailable);
    }
    socket.set_option(net::ip::multicast::hops(4), ec);

    const udp::endpoint multicast(net::ip::make_address(kMulticastAddress), kMulticastPort);
    const auto request = build_search_request(window);
    socket.send_to(net::buffer(request), multicast, 0, ec);
    if (ec) {
        CASTBRIDGE_LOG_WARNING("SsdpDiscovery", "M-SEARCH send failed: " + ec.message());
        return std::unexpected(DiscoveryError::NetworkError);
    }

    std::set<std::string> locations;
    std::array<char, 2048> buffer{};
    udp::endpoint sender;

    std::function<void()> receive = [&]() {
        socket.async_receive_from(net::buffer(buffer), sender,
            [&](const boost::system::error_code& error, std::size_t bytes) {
                if (error) {
                    return;
                }
                if (auto location = roku::parse_ssdp_location(std::string(buffer.data(), bytes))) {
                    if (locations.insert(*location).second) {
                        CASTBRIDGE_LOG_DEBUG("SsdpDiscovery", "ECP responder at " + *location);
                    }
                }
                receive();
            });
    };
    receive();

    const auto deadline = std::chrono::steady_clock::now() + window;
    while (std::chrono::steady_clock::now() < deadline && !stop.stop_requested()) {
        ioc.run_for(std::chrono::milliseconds(100));
        if (ioc.stopped()) {
            ioc.restart();
        }
    }

    socket.close(ec);
    ioc.restart();
    ioc.poll();

    if (stop.stop_requested()) {
        return std::unexpected(DiscoveryError::Cancelled);
    }

    std::vector<core::Device> devices;
    for (const auto& location : locations) {
        auto host = utils::UrlUtils::get_host(location);
        if (!host || host->empty()) {
            continue;
        }
        auto port = static_cast<std::uint16_t>(utils::UrlUtils::get_port(location).value_or(roku::kEcpPort));
        if (auto device = describe(*host, port)) {
            devices.push_back(std::move(*device));
        }
    }

    return devices;
}

std::optional<core::Device> SsdpDiscovery::describe(const std::string& host, std::uint16_t port) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = utils::UrlUtils::build_http_url(host, port, "/query/device-info");
    request.timeout = kDeviceInfoTimeout;

    auto response = m_http_client->execute(request);
    if (!response) {
        CASTBRIDGE_LOG_DEBUG("SsdpDiscovery", "device-info from " + host + " failed: " + to_string(response.error()));
        return std::nullopt;
    }
    if (!response->is_success()) {
        CASTBRIDGE_LOG_DEBUG("SsdpDiscovery", "device-info from " + host + " returned HTTP " +
                             std::to_string(response->status_code));
        return std::nullopt;
    }

    auto info = roku::parse_device_info(response->body, host);

    core::Device device;
    device.kind = core::DeviceKind::RokuReceiver;
    device.host = host;
    device.port = port;
    device.name = info.name;
    device.model = info.model;
    device.capabilities = {false, false, info.is_tv};
    device.last_seen = std::chrono::system_clock::now();
    device.id = core::Device::make_id(device.kind, device.host, device.port, device.name);
    return device;
}

} // namespace services
} // namespace castbridge
