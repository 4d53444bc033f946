#include "castbridge/utils/network_utils.hpp"
#include "castbridge/utils/logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

namespace castbridge::utils {

std::string detect_lan_address(const std::string& route_host, unsigned short route_port) {
    namespace net = boost::asio;
    using udp = net::ip::udp;

    boost::system::error_code ec;
    net::io_context ioc;
    udp::socket socket(ioc);

    auto address = net::ip::make_address(route_host, ec);
    if (!ec) {
        socket.open(udp::v4(), ec);
    }
    if (!ec) {
        socket.connect(udp::endpoint(address, route_port), ec);
    }

    udp::endpoint local;
    if (!ec) {
        local = socket.local_endpoint(ec);
    }

    if (ec || local.address().is_unspecified()) {
        CASTBRIDGE_LOG_WARNING("Network", "Could not detect LAN address, using loopback: " + ec.message());
        return "127.0.0.1";
    }

    return local.address().to_string();
}

} // namespace castbridge::utils
