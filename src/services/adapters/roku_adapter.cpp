#include "castbridge/services/adapters/roku_adapter.hpp"
#include "castbridge/services/adapters/roku_ecp.hpp"
#include "castbridge/utils/logger.hpp"
#include "castbridge/utils/url_utils.hpp"

namespace castbridge::services {

namespace {
    // Roku's built-in media player channel
    constexpr const char* kMediaPlayerChannel = "15985";
    // How long "close"/"none" after a launch still counts as loading
    constexpr auto kLaunchGrace = std::chrono::seconds(20);
}

RokuAdapter::RokuAdapter(std::shared_ptr<HttpClient> http_client, AdapterTimeouts timeouts)
    : m_http_client(std::move(http_client))
    , m_timeouts(timeouts) {}

std::string RokuAdapter::build_launch_path(const core::MediaRef& media) {
    std::string path = "/input/" + std::string(kMediaPlayerChannel) +
                       "?t=" + roku::media_type_code(media.content_type) +
                       "&u=" + utils::UrlUtils::encode(media.url);
    if (!media.title.empty()) {
        path += "&videoName=" + utils::UrlUtils::encode(media.title);
    }
    return path;
}

std::expected<void, core::Failure> RokuAdapter::connect(const core::Device& device) {
    m_host = device.host;
    m_port = device.port != 0 ? device.port : roku::kEcpPort;

    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = url("/query/device-info");
    request.timeout = std::chrono::duration_cast<std::chrono::seconds>(m_timeouts.connect);

    auto response = m_http_client->execute(request);
    if (!response) {
        return core::make_failure(core::CastError::ConnectionError,
                                  device.name + " unreachable: " + to_string(response.error()));
    }
    if (!response->is_success()) {
        return core::make_failure(core::CastError::ConnectionError,
                                  device.name + " answered HTTP " + std::to_string(response->status_code));
    }

    auto info = roku::parse_device_info(response->body, m_host);
    m_is_tv = info.is_tv;
    m_muted = false;
    m_last_status = core::PlaybackStatus::Idle;
    m_launched_at.reset();

    CASTBRIDGE_LOG_INFO("RokuAdapter", "Connected to " + info.name + " (" + info.model + ")" +
                        (m_is_tv ? ", TV" : ""));
    return {};
}

void RokuAdapter::disconnect() {
    if (!m_host.empty()) {
        CASTBRIDGE_LOG_DEBUG("RokuAdapter", "Released " + m_host);
    }
    m_host.clear();
    m_port = 0;
    m_last_status = core::PlaybackStatus::Idle;
    m_launched_at.reset();
}

std::expected<void, core::Failure> RokuAdapter::load(const core::MediaRef& media) {
    auto response = post(build_launch_path(media), core::CastError::LoadError);
    if (!response) {
        return std::unexpected(response.error());
    }
    m_last_status = core::PlaybackStatus::Loading;
    m_launched_at = std::chrono::steady_clock::now();
    return {};
}

std::expected<core::PlaybackStatus, core::Failure> RokuAdapter::play_pause() {
    auto pressed = keypress("Play");
    if (!pressed) {
        return std::unexpected(pressed.error());
    }

    const bool was_playing = m_last_status == core::PlaybackStatus::Playing ||
                             m_last_status == core::PlaybackStatus::Loading;
    m_last_status = was_playing ? core::PlaybackStatus::Paused : core::PlaybackStatus::Playing;
    return m_last_status;
}

std::expected<void, core::Failure> RokuAdapter::stop() {
    auto pressed = keypress("Home");
    if (!pressed) {
        return std::unexpected(pressed.error());
    }
    m_last_status = core::PlaybackStatus::Stopped;
    m_launched_at.reset();
    return {};
}

std::expected<double, core::Failure> RokuAdapter::seek(double) {
    return core::make_failure(core::CastError::UnsupportedOperation, "Roku receivers cannot seek");
}

std::expected<int, core::Failure> RokuAdapter::set_volume(int) {
    return core::make_failure(core::CastError::UnsupportedOperation, "Roku receivers have no volume control over ECP");
}

std::expected<bool, core::Failure> RokuAdapter::toggle_mute() {
    if (!m_is_tv) {
        return core::make_failure(core::CastError::UnsupportedOperation, "mute is only available on Roku TVs");
    }
    auto pressed = keypress("VolumeMute");
    if (!pressed) {
        return std::unexpected(pressed.error());
    }
    m_muted = !m_muted;
    return m_muted;
}

std::expected<core::StatusSnapshot, core::Failure> RokuAdapter::poll_status() {
    if (m_host.empty()) {
        return core::make_failure(core::CastError::StatusError, "not connected");
    }

    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = url("/query/media-player");
    request.timeout = std::chrono::duration_cast<std::chrono::seconds>(m_timeouts.command);

    auto response = m_http_client->execute(request);
    if (!response) {
        return core::make_failure(core::CastError::StatusError, "media-player query failed: " + to_string(response.error()));
    }
    if (!response->is_success()) {
        return core::make_failure(core::CastError::StatusError,
                                  "media-player query returned HTTP " + std::to_string(response->status_code));
    }

    auto snapshot = roku::parse_media_player(response->body);
    if (m_launched_at && snapshot.status) {
        const bool started = *snapshot.status == core::PlaybackStatus::Playing ||
                             *snapshot.status == core::PlaybackStatus::Paused ||
                             *snapshot.status == core::PlaybackStatus::Error;
        if (started || std::chrono::steady_clock::now() - *m_launched_at > kLaunchGrace) {
            m_launched_at.reset();
        } else {
            // The player channel still shows the previous close/none while launching
            snapshot.status = core::PlaybackStatus::Loading;
        }
    }
    if (snapshot.status) {
        m_last_status = *snapshot.status;
    }
    if (m_is_tv) {
        snapshot.muted = m_muted;
    }
    return snapshot;
}

std::expected<HttpResponse, core::Failure> RokuAdapter::post(const std::string& path, core::CastError on_failure) {
    if (m_host.empty()) {
        return core::make_failure(on_failure, "not connected");
    }

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url(path);
    request.timeout = std::chrono::duration_cast<std::chrono::seconds>(m_timeouts.command);

    auto response = m_http_client->execute(request);
    if (!response) {
        return core::make_failure(on_failure, "POST " + path + " failed: " + to_string(response.error()));
    }
    if (!response->is_success()) {
        return core::make_failure(on_failure, "POST " + path + " returned HTTP " + std::to_string(response->status_code));
    }
    return std::move(*response);
}

std::expected<void, core::Failure> RokuAdapter::keypress(const std::string& key) {
    auto response = post("/keypress/" + key, core::CastError::CommandError);
    if (!response) {
        return std::unexpected(response.error());
    }
    return {};
}

std::string RokuAdapter::url(const std::string& path) const {
    return utils::UrlUtils::build_http_url(m_host, m_port, path);
}

} // namespace castbridge::services
