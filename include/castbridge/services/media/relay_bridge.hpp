#pragma once

#include "castbridge/core/event_bus.hpp"
#include "castbridge/services/media/media_library.hpp"
#include "castbridge/services/session/session_manager.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace castbridge::services {

// Handoff record for media submitted by a remote client; consumed exactly once
struct RelayTicket {
    std::string id;
    std::string media_url;
    std::string content_type;
    std::string display_name;
    std::string origin;
    std::chrono::steady_clock::time_point expires_at;
};

// Turns uploads and URLs from remote clients into casts on the bound device.
// Nothing is accepted, and no ticket is issued, while no device is bound.
class RelayBridge {
public:
    using MediaUrlBuilder = std::function<std::string(const ServedFile&)>;

    RelayBridge(std::shared_ptr<SessionController> sessions,
                std::shared_ptr<core::EventBus> event_bus,
                std::chrono::seconds ticket_ttl);

    void set_media_url_builder(MediaUrlBuilder builder);

    bool accepting() const;

    std::expected<RelayTicket, core::Failure> issue(const std::string& media_url,
                                                    const std::string& content_type,
                                                    const std::string& display_name,
                                                    const std::string& origin);

    // NotFound when the ticket is unknown, already used or expired
    std::expected<RelayTicket, core::Failure> consume(const std::string& ticket_id);

    std::expected<core::MediaRef, core::Failure> relay_upload(const ServedFile& file, const std::string& origin);
    std::expected<core::MediaRef, core::Failure> relay_url(const std::string& url,
                                                           const std::string& title,
                                                           const std::string& origin);

    std::size_t pending_tickets() const;
    std::size_t purge_expired();

private:
    std::shared_ptr<SessionController> m_sessions;
    std::shared_ptr<core::EventBus> m_event_bus;
    std::chrono::seconds m_ticket_ttl;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, RelayTicket> m_tickets;
    MediaUrlBuilder m_media_url_builder;

    std::expected<core::MediaRef, core::Failure> deliver(const std::string& ticket_id);
};

} // namespace castbridge::services
