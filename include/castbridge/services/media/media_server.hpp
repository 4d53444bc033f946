#pragma once

#include "castbridge/core/models.hpp"
#include "castbridge/services/media/media_library.hpp"
#include "castbridge/services/media/relay_bridge.hpp"
#include "castbridge/services/session/session_manager.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>

namespace castbridge::services {

/**
 * @brief HTTP server for receivers and phones on the LAN
 *
 * Routes:
 * - GET|HEAD /media/{token}[/name]  registered files with single-range support
 * - GET /remote                     remote control page
 * - GET /remote/info, /remote/status
 * - POST /remote/upload             raw request body becomes a cast (503 while unbound)
 * - POST /remote/url                JSON {"url","title"} or a bare URL
 * - POST /remote/control            JSON {"action", ...}
 */
class MediaServer {
public:
    MediaServer(core::MediaServerConfig config,
                std::shared_ptr<MediaLibrary> library,
                std::shared_ptr<RelayBridge> relay,
                std::shared_ptr<SessionController> sessions);
    ~MediaServer();

    MediaServer(const MediaServer&) = delete;
    MediaServer& operator=(const MediaServer&) = delete;

    // Binds and starts the worker threads. Port 0 picks an ephemeral port.
    std::expected<void, core::Failure> start();
    void stop();
    bool is_running() const;

    // Actual listening port, 0 while stopped
    std::uint16_t port() const;
    // "http://host:port" as receivers should reach it
    std::string base_url() const;
    std::string media_url(const ServedFile& file) const;
    std::string remote_url() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace castbridge::services
