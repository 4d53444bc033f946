#include "castbridge/services/adapters/cast_adapter.hpp"
#include "castbridge/utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace castbridge::services {

namespace {
    constexpr int kLaunchStatusAttempts = 5;
    constexpr std::chrono::milliseconds kLaunchStatusDelay{500};

    bool is_load_rejection(const std::string& type) {
        return type == "LOAD_FAILED" || type == "LOAD_CANCELLED" || type == "INVALID_REQUEST";
    }

    bool is_command_rejection(const std::string& type) {
        return type == "INVALID_REQUEST" || type == "INVALID_PLAYER_STATE" || type == "LOAD_FAILED";
    }

    std::string rejection_reason(const nlohmann::json& reply) {
        auto type = reply.value("type", std::string("unknown"));
        if (reply.contains("reason") && reply["reason"].is_string()) {
            return type + " (" + reply["reason"].get<std::string>() + ")";
        }
        return type;
    }

    core::PlaybackStatus map_player_state(const std::string& state, const std::string& idle_reason) {
        if (state == "PLAYING") {
            return core::PlaybackStatus::Playing;
        }
        if (state == "PAUSED") {
            return core::PlaybackStatus::Paused;
        }
        if (state == "BUFFERING" || state == "LOADING") {
            return core::PlaybackStatus::Loading;
        }
        if (state == "ERROR") {
            return core::PlaybackStatus::Error;
        }
        if (state == "IDLE") {
            if (idle_reason == "FINISHED" || idle_reason == "CANCELLED" || idle_reason == "INTERRUPTED") {
                return core::PlaybackStatus::Stopped;
            }
            if (idle_reason == "ERROR") {
                return core::PlaybackStatus::Error;
            }
        }
        return core::PlaybackStatus::Idle;
    }

    const nlohmann::json* find_media_receiver(const nlohmann::json& payload) {
        if (!payload.contains("status") || !payload["status"].is_object()) {
            return nullptr;
        }
        const auto& status = payload["status"];
        if (!status.contains("applications") || !status["applications"].is_array()) {
            return nullptr;
        }
        for (const auto& app : status["applications"]) {
            if (app.value("appId", std::string()) == kDefaultMediaReceiverAppId) {
                return &app;
            }
        }
        return nullptr;
    }
}

core::StatusSnapshot parse_media_status(const nlohmann::json& payload) {
    core::StatusSnapshot snapshot;

    if (!payload.contains("status") || !payload["status"].is_array() || payload["status"].empty()) {
        snapshot.status = core::PlaybackStatus::Idle;
        return snapshot;
    }

    const auto& entry = payload["status"][0];
    const auto state = entry.value("playerState", std::string());
    const auto idle_reason = entry.value("idleReason", std::string());
    snapshot.status = map_player_state(state, idle_reason);
    if (snapshot.status == core::PlaybackStatus::Error) {
        snapshot.error_message = "receiver reported a playback error";
    }

    if (entry.contains("currentTime") && entry["currentTime"].is_number()) {
        snapshot.position = std::max(0.0, entry["currentTime"].get<double>());
    }

    if (entry.contains("media") && entry["media"].is_object()) {
        const auto& media = entry["media"];
        if (media.contains("duration") && media["duration"].is_number()) {
            double duration = media["duration"].get<double>();
            if (duration > 0) {
                snapshot.duration = duration;
            }
        }
        if (media.contains("contentId") && media["contentId"].is_string()) {
            snapshot.content_url = media["contentId"].get<std::string>();
        }
    }

    return snapshot;
}

core::StatusSnapshot parse_receiver_status(const nlohmann::json& payload) {
    core::StatusSnapshot snapshot;

    if (!payload.contains("status") || !payload["status"].is_object()) {
        return snapshot;
    }
    const auto& status = payload["status"];
    if (!status.contains("volume") || !status["volume"].is_object()) {
        return snapshot;
    }

    const auto& volume = status["volume"];
    if (volume.contains("level") && volume["level"].is_number()) {
        double level = std::clamp(volume["level"].get<double>(), 0.0, 1.0);
        snapshot.volume = static_cast<int>(std::lround(level * 100.0));
    }
    if (volume.contains("muted") && volume["muted"].is_boolean()) {
        snapshot.muted = volume["muted"].get<bool>();
    }

    return snapshot;
}

CastAdapter::CastAdapter(ChannelFactory channel_factory, AdapterTimeouts timeouts)
    : m_channel_factory(std::move(channel_factory))
    , m_timeouts(timeouts) {}

CastAdapter::~CastAdapter() {
    disconnect();
}

std::expected<void, core::Failure> CastAdapter::connect(const core::Device& device) {
    disconnect();

    m_channel = m_channel_factory ? m_channel_factory() : nullptr;
    if (!m_channel) {
        return core::make_failure(core::CastError::ConnectionError, "no Cast channel available");
    }

    auto opened = m_channel->open(device.host, device.port, m_timeouts.connect);
    if (!opened) {
        m_channel.reset();
        return std::unexpected(opened.error());
    }

    m_channel->set_message_handler([this](const std::string& ns, const nlohmann::json& payload) {
        on_message(ns, payload);
    });

    auto status = receiver_request({{"type", "GET_STATUS"}});
    if (!status) {
        m_channel->close();
        m_channel.reset();
        return core::make_failure(core::CastError::ConnectionError,
                                  device.name + " did not answer: " + status.error().message);
    }

    track_receiver_status(*status);
    CASTBRIDGE_LOG_INFO("CastAdapter", "Connected to " + device.name + " at " + device.address());
    return {};
}

void CastAdapter::disconnect() {
    if (!m_channel) {
        return;
    }

    if (!m_connected_transport.empty() && m_channel->is_open()) {
        auto closed = m_channel->send(m_connected_transport, cast_ns::kConnection, {{"type", "CLOSE"}});
        if (!closed) {
            CASTBRIDGE_LOG_DEBUG("CastAdapter", "CLOSE to media receiver failed: " + closed.error().message);
        }
    }

    m_channel->set_message_handler(nullptr);
    m_channel->close();
    m_channel.reset();
    m_connected_transport.clear();

    std::lock_guard lock(m_state_mutex);
    m_tracked = Tracked{};
}

void CastAdapter::cancel() {
    if (m_channel) {
        m_channel->cancel();
    }
}

std::expected<void, core::Failure> CastAdapter::load(const core::MediaRef& media) {
    if (!m_channel) {
        return core::make_failure(core::CastError::ConnectionError, "not connected");
    }

    auto transport = ensure_receiver_app();
    if (!transport) {
        return std::unexpected(transport.error());
    }

    nlohmann::json load = {
        {"type", "LOAD"},
        {"autoplay", true},
        {"currentTime", 0},
        {"media", {
            {"contentId", media.url},
            {"contentType", media.content_type},
            {"streamType", "BUFFERED"},
            {"metadata", {{"metadataType", 0}, {"title", media.title.empty() ? media.url : media.title}}}
        }}
    };

    CASTBRIDGE_LOG_INFO("CastAdapter", "Loading " + media.url + " (" + media.content_type + ")");
    auto reply = m_channel->request(*transport, cast_ns::kMedia, std::move(load), m_timeouts.connect);
    if (!reply) {
        if (reply.error().error == core::CastError::ConnectionError) {
            return std::unexpected(reply.error());
        }
        return core::make_failure(core::CastError::LoadError, reply.error().message);
    }

    const auto type = reply->value("type", std::string());
    if (is_load_rejection(type)) {
        return core::make_failure(core::CastError::LoadError, "receiver rejected media: " + rejection_reason(*reply));
    }

    track_media_status(*reply);
    return {};
}

std::expected<core::PlaybackStatus, core::Failure> CastAdapter::play_pause() {
    core::PlaybackStatus current;
    {
        std::lock_guard lock(m_state_mutex);
        current = m_tracked.status;
    }

    const bool pause = current == core::PlaybackStatus::Playing || current == core::PlaybackStatus::Loading;
    auto reply = media_command(pause ? "PAUSE" : "PLAY", nlohmann::json::object());
    if (!reply) {
        return std::unexpected(reply.error());
    }
    return pause ? core::PlaybackStatus::Paused : core::PlaybackStatus::Playing;
}

std::expected<void, core::Failure> CastAdapter::stop() {
    auto reply = media_command("STOP", nlohmann::json::object());
    if (!reply) {
        return std::unexpected(reply.error());
    }
    return {};
}

std::expected<double, core::Failure> CastAdapter::seek(double delta_seconds) {
    double target;
    {
        std::lock_guard lock(m_state_mutex);
        target = std::max(0.0, m_tracked.position + delta_seconds);
        if (m_tracked.duration) {
            target = std::min(target, *m_tracked.duration);
        }
    }

    auto reply = media_command("SEEK", {{"currentTime", target}});
    if (!reply) {
        return std::unexpected(reply.error());
    }

    std::lock_guard lock(m_state_mutex);
    m_tracked.position = target;
    return target;
}

std::expected<int, core::Failure> CastAdapter::set_volume(int level) {
    level = std::clamp(level, 0, 100);
    auto reply = receiver_request({{"type", "SET_VOLUME"}, {"volume", {{"level", level / 100.0}}}});
    if (!reply) {
        return core::make_failure(core::CastError::CommandError, reply.error().message);
    }

    std::lock_guard lock(m_state_mutex);
    m_tracked.volume = level;
    return level;
}

std::expected<bool, core::Failure> CastAdapter::toggle_mute() {
    bool muted;
    {
        std::lock_guard lock(m_state_mutex);
        muted = !m_tracked.muted;
    }

    auto reply = receiver_request({{"type", "SET_VOLUME"}, {"volume", {{"muted", muted}}}});
    if (!reply) {
        return core::make_failure(core::CastError::CommandError, reply.error().message);
    }

    std::lock_guard lock(m_state_mutex);
    m_tracked.muted = muted;
    return muted;
}

std::expected<core::StatusSnapshot, core::Failure> CastAdapter::poll_status() {
    if (!m_channel) {
        return core::make_failure(core::CastError::StatusError, "not connected");
    }

    auto receiver = receiver_request({{"type", "GET_STATUS"}});
    if (!receiver) {
        return core::make_failure(core::CastError::StatusError, receiver.error().message);
    }

    track_receiver_status(*receiver);
    auto snapshot = parse_receiver_status(*receiver);

    std::string transport;
    bool has_media_session;
    {
        std::lock_guard lock(m_state_mutex);
        transport = m_tracked.transport_id;
        has_media_session = m_tracked.media_session_id.has_value();
    }

    if (transport.empty() || !has_media_session) {
        snapshot.status = core::PlaybackStatus::Idle;
        return snapshot;
    }

    auto media = m_channel->request(transport, cast_ns::kMedia, {{"type", "GET_STATUS"}}, m_timeouts.command);
    if (!media) {
        return core::make_failure(core::CastError::StatusError, media.error().message);
    }

    track_media_status(*media);
    auto media_snapshot = parse_media_status(*media);
    snapshot.status = media_snapshot.status;
    snapshot.position = media_snapshot.position;
    snapshot.duration = media_snapshot.duration;
    snapshot.content_url = media_snapshot.content_url;
    snapshot.error_message = media_snapshot.error_message;
    return snapshot;
}

void CastAdapter::set_status_listener(StatusListener listener) {
    std::lock_guard lock(m_state_mutex);
    m_listener = std::move(listener);
}

std::expected<std::string, core::Failure> CastAdapter::ensure_receiver_app() {
    auto status = receiver_request({{"type", "GET_STATUS"}});
    if (!status) {
        return core::make_failure(core::CastError::LoadError, "receiver status unavailable: " + status.error().message);
    }
    track_receiver_status(*status);

    if (!find_media_receiver(*status)) {
        CASTBRIDGE_LOG_DEBUG("CastAdapter", "Launching Default Media Receiver");
        auto launched = m_channel->request(kCastReceiverId, cast_ns::kReceiver,
                                           {{"type", "LAUNCH"}, {"appId", kDefaultMediaReceiverAppId}},
                                           m_timeouts.connect);
        if (!launched) {
            return core::make_failure(core::CastError::LoadError, "launch failed: " + launched.error().message);
        }
        if (launched->value("type", std::string()) == "LAUNCH_ERROR") {
            return core::make_failure(core::CastError::LoadError, "launch failed: " + rejection_reason(*launched));
        }
        track_receiver_status(*launched);

        // Older firmware answers LAUNCH before the application is listed
        for (int attempt = 0; attempt < kLaunchStatusAttempts && !find_media_receiver(*launched); ++attempt) {
            std::this_thread::sleep_for(kLaunchStatusDelay);
            auto refreshed = receiver_request({{"type", "GET_STATUS"}});
            if (refreshed) {
                track_receiver_status(*refreshed);
                launched = std::move(refreshed);
            }
        }
    }

    std::string transport;
    {
        std::lock_guard lock(m_state_mutex);
        transport = m_tracked.transport_id;
    }
    if (transport.empty()) {
        return core::make_failure(core::CastError::LoadError, "media receiver did not start");
    }

    if (transport != m_connected_transport) {
        auto connected = m_channel->send(transport, cast_ns::kConnection, {{"type", "CONNECT"}});
        if (!connected) {
            return std::unexpected(connected.error());
        }
        m_connected_transport = transport;
    }
    return transport;
}

std::expected<nlohmann::json, core::Failure> CastAdapter::media_command(const std::string& type,
                                                                        nlohmann::json payload) {
    if (!m_channel) {
        return core::make_failure(core::CastError::CommandError, "not connected");
    }

    std::string transport;
    std::optional<long long> media_session;
    {
        std::lock_guard lock(m_state_mutex);
        transport = m_tracked.transport_id;
        media_session = m_tracked.media_session_id;
    }
    if (transport.empty() || !media_session) {
        return core::make_failure(core::CastError::CommandError, "nothing is loaded");
    }

    payload["type"] = type;
    payload["mediaSessionId"] = *media_session;

    auto reply = m_channel->request(transport, cast_ns::kMedia, std::move(payload), m_timeouts.command);
    if (!reply) {
        return core::make_failure(core::CastError::CommandError, type + ": " + reply.error().message);
    }

    if (is_command_rejection(reply->value("type", std::string()))) {
        return core::make_failure(core::CastError::CommandError, type + " rejected: " + rejection_reason(*reply));
    }

    track_media_status(*reply);
    return reply;
}

std::expected<nlohmann::json, core::Failure> CastAdapter::receiver_request(nlohmann::json payload) {
    if (!m_channel) {
        return core::make_failure(core::CastError::ConnectionError, "not connected");
    }
    return m_channel->request(kCastReceiverId, cast_ns::kReceiver, std::move(payload), m_timeouts.command);
}

void CastAdapter::on_message(const std::string& ns, const nlohmann::json& payload) {
    const auto type = payload.value("type", std::string());
    core::StatusSnapshot snapshot;

    if (ns == cast_ns::kMedia && type == "MEDIA_STATUS") {
        track_media_status(payload);
        snapshot = parse_media_status(payload);
    } else if (ns == cast_ns::kReceiver && type == "RECEIVER_STATUS") {
        track_receiver_status(payload);
        snapshot = parse_receiver_status(payload);
    } else {
        CASTBRIDGE_LOG_DEBUG("CastAdapter", "Unhandled " + type + " on " + ns);
        return;
    }

    StatusListener listener;
    {
        std::lock_guard lock(m_state_mutex);
        listener = m_listener;
    }
    if (listener) {
        listener(snapshot);
    }
}

void CastAdapter::track_receiver_status(const nlohmann::json& payload) {
    const auto report = parse_receiver_status(payload);
    const auto* app = find_media_receiver(payload);
    const bool is_status = payload.contains("status") && payload["status"].is_object();

    std::lock_guard lock(m_state_mutex);
    if (report.volume) {
        m_tracked.volume = *report.volume;
    }
    if (report.muted) {
        m_tracked.muted = *report.muted;
    }

    if (app) {
        auto transport = app->value("transportId", std::string());
        if (!transport.empty() && transport != m_tracked.transport_id) {
            m_tracked.transport_id = transport;
            m_tracked.media_session_id.reset();
        }
        m_tracked.app_session_id = app->value("sessionId", std::string());
    } else if (is_status) {
        // The receiver app went away, typically another sender took over
        if (!m_tracked.transport_id.empty()) {
            CASTBRIDGE_LOG_DEBUG("CastAdapter", "Media receiver application is no longer running");
        }
        m_tracked.transport_id.clear();
        m_tracked.app_session_id.clear();
        m_tracked.media_session_id.reset();
    }
}

void CastAdapter::track_media_status(const nlohmann::json& payload) {
    if (payload.value("type", std::string()) != "MEDIA_STATUS") {
        return;
    }

    const auto report = parse_media_status(payload);

    std::lock_guard lock(m_state_mutex);
    if (payload.contains("status") && payload["status"].is_array() && !payload["status"].empty()) {
        const auto& entry = payload["status"][0];
        if (entry.contains("mediaSessionId") && entry["mediaSessionId"].is_number_integer()) {
            m_tracked.media_session_id = entry["mediaSessionId"].get<long long>();
        }
    }

    if (report.status) {
        m_tracked.status = *report.status;
    }
    if (report.position) {
        m_tracked.position = *report.position;
    }
    if (report.duration) {
        m_tracked.duration = report.duration;
    }
}

} // namespace castbridge::services
