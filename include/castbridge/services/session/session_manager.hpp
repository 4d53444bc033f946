#pragma once

#include "castbridge/core/event_bus.hpp"
#include "castbridge/core/models.hpp"
#include "castbridge/services/adapters/protocol_adapter.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace castbridge {
namespace services {

// What the media server and the relay bridge need from the active session
class SessionController {
public:
    virtual ~SessionController() = default;

    virtual bool has_session() const = 0;
    virtual std::optional<core::Device> bound_device() const = 0;
    virtual core::PlaybackState playback_state() const = 0;
    virtual core::SessionPhase phase() const = 0;

    virtual std::expected<void, core::Failure> cast(const core::MediaRef& media) = 0;
    virtual std::expected<void, core::Failure> play_pause() = 0;
    virtual std::expected<void, core::Failure> stop() = 0;
    virtual std::expected<void, core::Failure> seek(double delta_seconds) = 0;
    virtual std::expected<void, core::Failure> seek_to(double position_seconds) = 0;
    virtual std::expected<void, core::Failure> set_volume(int level) = 0;
    virtual std::expected<void, core::Failure> toggle_mute() = 0;
};

enum class PollOutcome {
    Applied,
    Skipped,    // a command was in flight, or nothing is bound
    Failed
};

// Owns the single active binding. Commands on one session are serialised:
// a command issued while another is in flight fails with Busy and leaves the
// state untouched. A poll task refreshes the state while bound; after
// max_consecutive_poll_failures misses in a row the session goes to Error
// and DeviceLost is published once for that run of failures.
class SessionManager : public SessionController {
public:
    SessionManager(std::shared_ptr<AdapterFactory> adapter_factory,
                   std::shared_ptr<core::EventBus> event_bus,
                   core::SessionConfig config);
    ~SessionManager() override;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Unbinds any current session first; failures there are logged, not returned
    std::expected<void, core::Failure> bind(const core::Device& device);
    std::expected<void, core::Failure> unbind();

    bool has_session() const override;
    std::optional<core::Device> bound_device() const override;
    core::PlaybackState playback_state() const override;
    core::SessionPhase phase() const override;

    std::expected<void, core::Failure> cast(const core::MediaRef& media) override;
    std::expected<void, core::Failure> play_pause() override;
    std::expected<void, core::Failure> stop() override;
    std::expected<void, core::Failure> seek(double delta_seconds) override;
    std::expected<void, core::Failure> seek_to(double position_seconds) override;
    std::expected<void, core::Failure> set_volume(int level) override;
    std::expected<void, core::Failure> toggle_mute() override;

    // One status refresh, as the poll task performs it
    PollOutcome poll_now();
    int consecutive_poll_failures() const;

private:
    class PollTask;
    struct Session;

    std::shared_ptr<AdapterFactory> m_adapter_factory;
    std::shared_ptr<core::EventBus> m_event_bus;
    core::SessionConfig m_config;

    std::mutex m_lifecycle_mutex;          // bind / unbind
    mutable std::mutex m_session_mutex;    // m_session pointer and phase
    std::shared_ptr<Session> m_session;
    core::SessionPhase m_phase = core::SessionPhase::Unbound;

    std::shared_ptr<Session> current_session() const;
    void set_phase(core::SessionPhase phase, std::optional<core::Device> device);
    std::expected<void, core::Failure> unbind_locked();

    template<typename Command>
    std::expected<void, core::Failure> run_command(const std::string& name, Command&& command);

    void apply_snapshot(Session& session, const core::StatusSnapshot& snapshot);
    void record_poll_failure(Session& session, const core::Failure& failure);
    void update_state(Session& session, const std::function<void(core::PlaybackState&)>& mutate);
    void report_failure(const std::string& command, const core::Failure& failure);
};

} // namespace services
} // namespace castbridge
