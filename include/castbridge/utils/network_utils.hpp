#pragma once

#include <string>

namespace castbridge::utils {

// IPv4 address of the interface that routes to the wider network. Uses a
// connected UDP socket, so nothing is sent. Falls back to 127.0.0.1.
std::string detect_lan_address(const std::string& route_host = "8.8.8.8", unsigned short route_port = 80);

} // namespace castbridge::utils
