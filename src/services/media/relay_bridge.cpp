#include "castbridge/services/media/relay_bridge.hpp"
#include "castbridge/core/events.hpp"
#include "castbridge/utils/logger.hpp"
#include "castbridge/utils/media_types.hpp"
#include "castbridge/utils/url_utils.hpp"
#include "castbridge/utils/uuid.hpp"

namespace castbridge::services {

RelayBridge::RelayBridge(std::shared_ptr<SessionController> sessions,
                         std::shared_ptr<core::EventBus> event_bus,
                         std::chrono::seconds ticket_ttl)
    : m_sessions(std::move(sessions))
    , m_event_bus(std::move(event_bus))
    , m_ticket_ttl(ticket_ttl) {}

void RelayBridge::set_media_url_builder(MediaUrlBuilder builder) {
    std::lock_guard lock(m_mutex);
    m_media_url_builder = std::move(builder);
}

bool RelayBridge::accepting() const {
    return m_sessions && m_sessions->has_session();
}

std::expected<RelayTicket, core::Failure> RelayBridge::issue(const std::string& media_url,
                                                             const std::string& content_type,
                                                             const std::string& display_name,
                                                             const std::string& origin) {
    if (!accepting()) {
        return core::make_failure(core::CastError::NoActiveSession, "no device is bound");
    }

    RelayTicket ticket;
    ticket.id = utils::Uuid::generate_v4().to_hex();
    ticket.media_url = media_url;
    ticket.content_type = content_type;
    ticket.display_name = display_name;
    ticket.origin = origin;
    ticket.expires_at = std::chrono::steady_clock::now() + m_ticket_ttl;

    std::lock_guard lock(m_mutex);
    m_tickets.emplace(ticket.id, ticket);
    return ticket;
}

std::expected<RelayTicket, core::Failure> RelayBridge::consume(const std::string& ticket_id) {
    std::lock_guard lock(m_mutex);
    auto it = m_tickets.find(ticket_id);
    if (it == m_tickets.end()) {
        return core::make_failure(core::CastError::NotFound, "unknown or already used relay ticket");
    }

    auto ticket = std::move(it->second);
    m_tickets.erase(it);

    if (ticket.expires_at <= std::chrono::steady_clock::now()) {
        return core::make_failure(core::CastError::NotFound, "relay ticket expired");
    }
    return ticket;
}

std::expected<core::MediaRef, core::Failure> RelayBridge::relay_upload(const ServedFile& file,
                                                                       const std::string& origin) {
    MediaUrlBuilder builder;
    {
        std::lock_guard lock(m_mutex);
        builder = m_media_url_builder;
    }
    if (!builder) {
        return core::make_failure(core::CastError::NotFound, "media server is not running");
    }

    auto ticket = issue(builder(file), file.content_type, file.display_name, origin);
    if (!ticket) {
        return std::unexpected(ticket.error());
    }
    return deliver(ticket->id);
}

std::expected<core::MediaRef, core::Failure> RelayBridge::relay_url(const std::string& url,
                                                                    const std::string& title,
                                                                    const std::string& origin) {
    if (!utils::UrlUtils::is_valid_url(url)) {
        return core::make_failure(core::CastError::InvalidInput, "not an http(s) URL: " + url);
    }

    auto file_name = utils::UrlUtils::file_name(url);
    auto content_type = utils::guess_content_type(file_name);
    if (content_type == "application/octet-stream") {
        content_type.clear();
    }

    auto name = title.empty() ? file_name : title;
    auto ticket = issue(url, content_type, name.empty() ? url : name, origin);
    if (!ticket) {
        return std::unexpected(ticket.error());
    }
    return deliver(ticket->id);
}

std::size_t RelayBridge::pending_tickets() const {
    std::lock_guard lock(m_mutex);
    return m_tickets.size();
}

std::size_t RelayBridge::purge_expired() {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(m_mutex);
    return std::erase_if(m_tickets, [now](const auto& entry) { return entry.second.expires_at <= now; });
}

std::expected<core::MediaRef, core::Failure> RelayBridge::deliver(const std::string& ticket_id) {
    auto ticket = consume(ticket_id);
    if (!ticket) {
        return std::unexpected(ticket.error());
    }

    core::MediaRef media{ticket->media_url, ticket->content_type, ticket->display_name};
    if (media.content_type.empty()) {
        media.content_type = "video/mp4";
    }

    CASTBRIDGE_LOG_INFO("RelayBridge", "Relaying " + media.title + " from " +
                        (ticket->origin.empty() ? std::string("unknown client") : ticket->origin));

    auto cast = m_sessions->cast(media);
    if (!cast) {
        return std::unexpected(cast.error());
    }

    if (m_event_bus) {
        m_event_bus->publish(core::events::RelayReceived{ticket->id, ticket->display_name, ticket->origin, media});
    }
    return media;
}

} // namespace castbridge::services
