#include "castbridge/services/session/session_manager.hpp"
#include "castbridge/core/events.hpp"
#include "castbridge/utils/logger.hpp"

#include <algorithm>
#include <functional>

namespace castbridge {
namespace services {

namespace {
    bool same_state(const core::PlaybackState& a, const core::PlaybackState& b) {
        auto media_url = [](const core::PlaybackState& s) { return s.media ? s.media->url : std::string(); };
        auto error_text = [](const core::PlaybackState& s) { return s.last_error ? s.last_error->message : std::string(); };

        return a.status == b.status &&
               media_url(a) == media_url(b) &&
               a.position == b.position &&
               a.duration == b.duration &&
               a.volume == b.volume &&
               a.muted == b.muted &&
               error_text(a) == error_text(b);
    }

    void merge_snapshot(core::PlaybackState& state, const core::StatusSnapshot& snapshot) {
        if (snapshot.status) {
            // Receivers report idle until the load becomes visible to them
            bool still_loading = state.status == core::PlaybackStatus::Loading &&
                                 *snapshot.status == core::PlaybackStatus::Idle;
            if (!still_loading) {
                state.status = *snapshot.status;
            }
        }

        if (state.status == core::PlaybackStatus::Error) {
            if (snapshot.error_message) {
                state.last_error = core::Failure{core::CastError::StatusError, *snapshot.error_message};
            }
        } else if (snapshot.status) {
            state.last_error.reset();
        }

        if (snapshot.duration && *snapshot.duration > 0) {
            state.duration = snapshot.duration;
        }
        if (snapshot.position) {
            state.position = std::max(0.0, *snapshot.position);
        }
        if (state.duration) {
            state.position = std::min(state.position, *state.duration);
        }
        if (snapshot.volume) {
            state.volume = std::clamp(*snapshot.volume, 0, 100);
        }
        if (snapshot.muted) {
            state.muted = *snapshot.muted;
        }
    }
}

// ============================================================================
// PollTask
// ============================================================================

class SessionManager::PollTask {
public:
    PollTask(std::chrono::milliseconds interval, std::function<void()> tick)
        : m_thread([this, interval, tick = std::move(tick)](std::stop_token stop_token) {
            while (!stop_token.stop_requested()) {
                {
                    std::unique_lock lock(m_mutex);
                    m_cv.wait_for(lock, stop_token, interval, [] { return false; });
                }
                if (stop_token.stop_requested()) {
                    break;
                }
                tick();
            }
        }) {}

    ~PollTask() {
        stop();
    }

    // Must not be called from the tick itself
    void stop() {
        if (m_thread.joinable()) {
            m_thread.request_stop();
            m_thread.join();
        }
    }

private:
    std::mutex m_mutex;
    std::condition_variable_any m_cv;
    std::jthread m_thread;
};

struct SessionManager::Session {
    core::Device device;
    core::DeviceCapabilities capabilities;
    std::unique_ptr<ProtocolAdapter> adapter;
    std::mutex adapter_mutex;
    std::atomic<bool> command_pending{false};

    std::mutex state_mutex;
    core::PlaybackState state;
    int poll_failures = 0;
    bool lost_reported = false;

    std::unique_ptr<PollTask> poll_task;
};

// ============================================================================
// SessionManager
// ============================================================================

SessionManager::SessionManager(std::shared_ptr<AdapterFactory> adapter_factory,
                               std::shared_ptr<core::EventBus> event_bus,
                               core::SessionConfig config)
    : m_adapter_factory(std::move(adapter_factory))
    , m_event_bus(std::move(event_bus))
    , m_config(config) {}

SessionManager::~SessionManager() {
    std::lock_guard lifecycle(m_lifecycle_mutex);
    if (current_session()) {
        if (auto result = unbind_locked(); !result) {
            CASTBRIDGE_LOG_WARNING("SessionManager", "Unbind on shutdown failed: " + result.error().message);
        }
    }
}

std::expected<void, core::Failure> SessionManager::bind(const core::Device& device) {
    std::lock_guard lifecycle(m_lifecycle_mutex);

    if (current_session()) {
        CASTBRIDGE_LOG_INFO("SessionManager", "Releasing current device before binding " + device.name);
        if (auto released = unbind_locked(); !released) {
            CASTBRIDGE_LOG_WARNING("SessionManager", "Unbind before rebind failed: " + released.error().message);
        }
    }

    set_phase(core::SessionPhase::Binding, device);

    auto adapter = m_adapter_factory->create(device);
    if (!adapter) {
        set_phase(core::SessionPhase::Unbound, std::nullopt);
        core::Failure failure{core::CastError::ConnectionError, "no adapter for " + core::to_string(device.kind)};
        report_failure("bind", failure);
        return std::unexpected(failure);
    }

    auto connected = adapter->connect(device);
    if (!connected) {
        set_phase(core::SessionPhase::Unbound, std::nullopt);
        report_failure("bind", connected.error());
        return std::unexpected(connected.error());
    }

    auto session = std::make_shared<Session>();
    session->device = device;
    session->capabilities = adapter->capabilities();
    session->adapter = std::move(adapter);

    Session* raw = session.get();
    session->adapter->set_status_listener([this, raw](const core::StatusSnapshot& snapshot) {
        apply_snapshot(*raw, snapshot);
    });

    {
        std::lock_guard lock(m_session_mutex);
        m_session = session;
    }

    CASTBRIDGE_LOG_INFO("SessionManager", "Bound to " + device.name + " (" + core::to_string(device.kind) + ")");
    set_phase(core::SessionPhase::Bound, device);

    session->poll_task = std::make_unique<PollTask>(m_config.poll_interval, [this] { poll_now(); });
    return {};
}

std::expected<void, core::Failure> SessionManager::unbind() {
    std::lock_guard lifecycle(m_lifecycle_mutex);
    return unbind_locked();
}

std::expected<void, core::Failure> SessionManager::unbind_locked() {
    auto session = current_session();
    if (!session) {
        return core::make_failure(core::CastError::NoActiveSession, "no device is bound");
    }

    set_phase(core::SessionPhase::Unbinding, session->device);

    session->adapter->cancel();
    if (session->poll_task) {
        session->poll_task->stop();
    }

    {
        std::lock_guard adapter_lock(session->adapter_mutex);
        session->adapter->set_status_listener(nullptr);
        session->adapter->disconnect();
    }

    {
        std::lock_guard lock(m_session_mutex);
        m_session.reset();
    }

    core::PlaybackState previous;
    {
        std::lock_guard lock(session->state_mutex);
        previous = session->state;
    }

    CASTBRIDGE_LOG_INFO("SessionManager", "Unbound from " + session->device.name);
    set_phase(core::SessionPhase::Unbound, std::nullopt);

    if (m_event_bus && !same_state(previous, core::PlaybackState{})) {
        m_event_bus->publish(core::events::PlaybackStateChanged{previous, core::PlaybackState{}});
    }
    return {};
}

bool SessionManager::has_session() const {
    std::lock_guard lock(m_session_mutex);
    return m_session != nullptr && m_phase == core::SessionPhase::Bound;
}

std::optional<core::Device> SessionManager::bound_device() const {
    auto session = current_session();
    if (!session) {
        return std::nullopt;
    }
    auto device = session->device;
    device.capabilities = session->capabilities;
    return device;
}

core::PlaybackState SessionManager::playback_state() const {
    auto session = current_session();
    if (!session) {
        return {};
    }
    std::lock_guard lock(session->state_mutex);
    return session->state;
}

core::SessionPhase SessionManager::phase() const {
    std::lock_guard lock(m_session_mutex);
    return m_phase;
}

template<typename Command>
std::expected<void, core::Failure> SessionManager::run_command(const std::string& name, Command&& command) {
    auto session = current_session();
    if (!session) {
        return core::make_failure(core::CastError::NoActiveSession, "no device is bound");
    }

    bool idle = false;
    if (!session->command_pending.compare_exchange_strong(idle, true)) {
        CASTBRIDGE_LOG_DEBUG("SessionManager", name + " rejected, another command is in flight");
        return core::make_failure(core::CastError::Busy, "another command is in progress");
    }

    struct PendingGuard {
        std::atomic<bool>& flag;
        ~PendingGuard() { flag = false; }
    } guard{session->command_pending};

    std::expected<void, core::Failure> result;
    {
        std::lock_guard adapter_lock(session->adapter_mutex);
        result = command(*session);
    }

    if (!result) {
        report_failure(name, result.error());
    }
    return result;
}

std::expected<void, core::Failure> SessionManager::cast(const core::MediaRef& media) {
    if (media.url.empty()) {
        return core::make_failure(core::CastError::InvalidInput, "media URL is empty");
    }

    return run_command("cast", [&](Session& session) -> std::expected<void, core::Failure> {
        update_state(session, [&](core::PlaybackState& state) {
            state.status = core::PlaybackStatus::Loading;
            state.media = media;
            state.position = 0.0;
            state.duration.reset();
            state.last_error.reset();
        });

        auto loaded = session.adapter->load(media);
        if (!loaded) {
            update_state(session, [&](core::PlaybackState& state) {
                state.status = core::PlaybackStatus::Error;
                state.last_error = loaded.error();
            });
            return std::unexpected(loaded.error());
        }

        CASTBRIDGE_LOG_INFO("SessionManager", "Casting " + (media.title.empty() ? media.url : media.title));
        return {};
    });
}

std::expected<void, core::Failure> SessionManager::play_pause() {
    return run_command("play_pause", [this](Session& session) -> std::expected<void, core::Failure> {
        auto status = session.adapter->play_pause();
        if (!status) {
            return std::unexpected(status.error());
        }
        update_state(session, [&](core::PlaybackState& state) { state.status = *status; });
        return {};
    });
}

std::expected<void, core::Failure> SessionManager::stop() {
    return run_command("stop", [this](Session& session) -> std::expected<void, core::Failure> {
        auto stopped = session.adapter->stop();
        if (!stopped) {
            return std::unexpected(stopped.error());
        }
        update_state(session, [](core::PlaybackState& state) { state.status = core::PlaybackStatus::Stopped; });
        return {};
    });
}

std::expected<void, core::Failure> SessionManager::seek(double delta_seconds) {
    auto session = current_session();
    if (!session) {
        return core::make_failure(core::CastError::NoActiveSession, "no device is bound");
    }
    if (!session->capabilities.supports_seek) {
        core::Failure failure{core::CastError::UnsupportedOperation, session->device.name + " cannot seek"};
        report_failure("seek", failure);
        return std::unexpected(failure);
    }

    return run_command("seek", [this, delta_seconds](Session& s) -> std::expected<void, core::Failure> {
        auto position = s.adapter->seek(delta_seconds);
        if (!position) {
            return std::unexpected(position.error());
        }
        update_state(s, [&](core::PlaybackState& state) {
            state.position = std::max(0.0, *position);
            if (state.duration) {
                state.position = std::min(state.position, *state.duration);
            }
        });
        return {};
    });
}

std::expected<void, core::Failure> SessionManager::seek_to(double position_seconds) {
    auto current = playback_state();
    return seek(std::max(0.0, position_seconds) - current.position);
}

std::expected<void, core::Failure> SessionManager::set_volume(int level) {
    auto session = current_session();
    if (!session) {
        return core::make_failure(core::CastError::NoActiveSession, "no device is bound");
    }
    if (!session->capabilities.supports_volume) {
        core::Failure failure{core::CastError::UnsupportedOperation, session->device.name + " has no volume control"};
        report_failure("set_volume", failure);
        return std::unexpected(failure);
    }

    level = std::clamp(level, 0, 100);
    return run_command("set_volume", [this, level](Session& s) -> std::expected<void, core::Failure> {
        auto applied = s.adapter->set_volume(level);
        if (!applied) {
            return std::unexpected(applied.error());
        }
        update_state(s, [&](core::PlaybackState& state) { state.volume = std::clamp(*applied, 0, 100); });
        return {};
    });
}

std::expected<void, core::Failure> SessionManager::toggle_mute() {
    auto session = current_session();
    if (!session) {
        return core::make_failure(core::CastError::NoActiveSession, "no device is bound");
    }
    if (!session->capabilities.supports_mute) {
        core::Failure failure{core::CastError::UnsupportedOperation, session->device.name + " cannot mute"};
        report_failure("toggle_mute", failure);
        return std::unexpected(failure);
    }

    return run_command("toggle_mute", [this](Session& s) -> std::expected<void, core::Failure> {
        auto muted = s.adapter->toggle_mute();
        if (!muted) {
            return std::unexpected(muted.error());
        }
        update_state(s, [&](core::PlaybackState& state) { state.muted = *muted; });
        return {};
    });
}

PollOutcome SessionManager::poll_now() {
    auto session = current_session();
    if (!session || session->command_pending) {
        return PollOutcome::Skipped;
    }

    std::unique_lock adapter_lock(session->adapter_mutex, std::try_to_lock);
    if (!adapter_lock.owns_lock()) {
        return PollOutcome::Skipped;
    }

    auto snapshot = session->adapter->poll_status();
    adapter_lock.unlock();

    if (!snapshot) {
        record_poll_failure(*session, snapshot.error());
        return PollOutcome::Failed;
    }

    apply_snapshot(*session, *snapshot);
    return PollOutcome::Applied;
}

int SessionManager::consecutive_poll_failures() const {
    auto session = current_session();
    if (!session) {
        return 0;
    }
    std::lock_guard lock(session->state_mutex);
    return session->poll_failures;
}

std::shared_ptr<SessionManager::Session> SessionManager::current_session() const {
    std::lock_guard lock(m_session_mutex);
    return m_session;
}

void SessionManager::set_phase(core::SessionPhase phase, std::optional<core::Device> device) {
    core::SessionPhase previous;
    {
        std::lock_guard lock(m_session_mutex);
        previous = m_phase;
        m_phase = phase;
    }

    if (previous != phase && m_event_bus) {
        m_event_bus->publish(core::events::SessionPhaseChanged{previous, phase, std::move(device)});
    }
}

void SessionManager::apply_snapshot(Session& session, const core::StatusSnapshot& snapshot) {
    std::optional<core::events::PlaybackStateChanged> event;
    {
        std::lock_guard lock(session.state_mutex);
        if (session.poll_failures > 0) {
            CASTBRIDGE_LOG_INFO("SessionManager", session.device.name + " answered again after " +
                                std::to_string(session.poll_failures) + " missed poll(s)");
        }
        session.poll_failures = 0;
        session.lost_reported = false;

        auto previous = session.state;
        merge_snapshot(session.state, snapshot);
        if (!same_state(previous, session.state)) {
            event.emplace(std::move(previous), session.state);
        }
    }

    if (event && m_event_bus) {
        m_event_bus->publish(*event);
    }
}

void SessionManager::record_poll_failure(Session& session, const core::Failure& failure) {
    std::optional<core::events::PlaybackStateChanged> state_event;
    std::optional<core::events::DeviceLost> lost_event;
    {
        std::lock_guard lock(session.state_mutex);
        ++session.poll_failures;
        CASTBRIDGE_LOG_WARNING("SessionManager", "Status poll " + std::to_string(session.poll_failures) +
                               " failed for " + session.device.name + ": " + failure.message);

        if (session.poll_failures >= m_config.max_consecutive_poll_failures && !session.lost_reported) {
            session.lost_reported = true;

            auto previous = session.state;
            session.state.status = core::PlaybackStatus::Error;
            session.state.last_error = failure;
            state_event.emplace(std::move(previous), session.state);
            lost_event.emplace(session.device, session.poll_failures, failure.message);
        }
    }

    if (lost_event) {
        CASTBRIDGE_LOG_ERROR("SessionManager", "Lost contact with " + lost_event->device.name);
    }
    if (m_event_bus) {
        if (state_event) {
            m_event_bus->publish(*state_event);
        }
        if (lost_event) {
            m_event_bus->publish(*lost_event);
        }
    }
}

void SessionManager::update_state(Session& session, const std::function<void(core::PlaybackState&)>& mutate) {
    std::optional<core::events::PlaybackStateChanged> event;
    {
        std::lock_guard lock(session.state_mutex);
        auto previous = session.state;
        mutate(session.state);
        if (!same_state(previous, session.state)) {
            event.emplace(std::move(previous), session.state);
        }
    }

    if (event && m_event_bus) {
        m_event_bus->publish(*event);
    }
}

void SessionManager::report_failure(const std::string& command, const core::Failure& failure) {
    CASTBRIDGE_LOG_WARNING("SessionManager", command + " failed: " + core::to_string(failure.error) +
                           ": " + failure.message);
    if (m_event_bus) {
        m_event_bus->publish(core::events::CommandFailed{command, failure});
    }
}

} // namespace services
} // namespace castbridge
