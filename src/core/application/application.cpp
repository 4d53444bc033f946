#include "castbridge/core/application.hpp"
#include "castbridge/core/event_bus.hpp"
#include "castbridge/core/events.hpp"
#include "castbridge/services/adapters/protocol_adapter.hpp"
#include "castbridge/services/discovery/device_registry.hpp"
#include "castbridge/services/discovery/discovery_scanner.hpp"
#include "castbridge/services/discovery/mdns_discovery.hpp"
#include "castbridge/services/discovery/ssdp_discovery.hpp"
#include "castbridge/services/media/media_library.hpp"
#include "castbridge/services/media/media_server.hpp"
#include "castbridge/services/media/relay_bridge.hpp"
#include "castbridge/services/network/http_client.hpp"
#include "castbridge/services/session/session_manager.hpp"
#include "castbridge/utils/logger.hpp"
#include "castbridge/utils/media_types.hpp"
#include "castbridge/utils/threading.hpp"
#include "castbridge/utils/url_utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace castbridge {
namespace core {

namespace {
constexpr auto kHousekeepingInterval = std::chrono::seconds(60);
constexpr std::size_t kDiscoveryWorkers = 4;
}

class ApplicationImpl : public Application {
public:
    explicit ApplicationImpl(std::filesystem::path config_path)
        : m_config_path(std::move(config_path)),
          m_state(ApplicationState::NotInitialized),
          m_event_bus(std::make_shared<EventBus>()) {
        CASTBRIDGE_LOG_DEBUG("Application", "Application created");
    }

    ~ApplicationImpl() override {
        stop();
        m_subscriptions.release();
        CASTBRIDGE_LOG_DEBUG("Application", "Application destroyed");
    }

    std::expected<void, ApplicationError> initialize() override {
        CASTBRIDGE_LOG_INFO("Application", "Initializing...");

        if (m_state != ApplicationState::NotInitialized) {
            CASTBRIDGE_LOG_WARNING("Application", "Already initialized");
            return std::unexpected(ApplicationError::AlreadyRunning);
        }

        m_state = ApplicationState::Initializing;

        try {
            if (!initialize_configuration()) {
                m_state = ApplicationState::Error;
                return std::unexpected(ApplicationError::ConfigurationError);
            }

            const auto config = m_config_manager->get();
            utils::LoggerManager::get_instance().set_level(config.log_level);

            initialize_discovery(config);
            initialize_session(config);
            initialize_media(config);
            subscribe_to_events();

            m_state = ApplicationState::Stopped;
            CASTBRIDGE_LOG_INFO("Application", "Initialization complete");
            return {};

        } catch (const std::exception& e) {
            CASTBRIDGE_LOG_ERROR("Application", "Initialization failed: " + std::string(e.what()));
            m_state = ApplicationState::Error;
            return std::unexpected(ApplicationError::InitializationFailed);
        }
    }

    std::expected<void, ApplicationError> start() override {
        CASTBRIDGE_LOG_INFO("Application", "Starting services...");

        if (m_state == ApplicationState::Running) {
            return std::unexpected(ApplicationError::AlreadyRunning);
        }
        if (m_state != ApplicationState::Stopped) {
            CASTBRIDGE_LOG_ERROR("Application", "Not initialized");
            return std::unexpected(ApplicationError::InitializationFailed);
        }

        if (auto started = m_media_server->start(); !started) {
            // Casting local files and the phone remote need the server; discovery and
            // remote URLs still work without it
            CASTBRIDGE_LOG_ERROR("Application", "Media server unavailable: " + started.error().message);
        }

        m_scanner->start_periodic();
        m_housekeeping_thread = std::jthread([this](std::stop_token stop_token) {
            housekeeping_loop(stop_token);
        });

        m_state = ApplicationState::Running;
        CASTBRIDGE_LOG_INFO("Application", "Services started");
        return {};
    }

    void stop() override {
        if (m_state != ApplicationState::Running) {
            return;
        }

        CASTBRIDGE_LOG_INFO("Application", "Stopping...");
        m_state = ApplicationState::Stopping;

        m_housekeeping_thread.request_stop();
        m_housekeeping_cv.notify_all();
        if (m_housekeeping_thread.joinable()) {
            m_housekeeping_thread.join();
        }

        m_scanner->stop();

        if (m_sessions->has_session()) {
            if (auto result = m_sessions->unbind(); !result) {
                CASTBRIDGE_LOG_WARNING("Application", "Unbind during shutdown failed: " + result.error().message);
            }
        }

        m_media_server->stop();

        m_state = ApplicationState::Stopped;
        CASTBRIDGE_LOG_INFO("Application", "Shutdown complete");
    }

    ApplicationState get_state() const override {
        return m_state;
    }

    bool is_running() const override {
        return m_state == ApplicationState::Running;
    }

    std::vector<Device> devices() const override {
        return m_registry ? m_registry->snapshot() : std::vector<Device>{};
    }

    std::vector<Device> filter_devices(const std::string& query,
                                       const std::vector<DeviceKind>& kinds) const override {
        return m_registry ? m_registry->filter(query, kinds) : std::vector<Device>{};
    }

    std::vector<Device> scan(const std::vector<DeviceKind>& kinds) override {
        if (!m_scanner) {
            return {};
        }
        auto pass = m_scanner->scan(kinds);
        return pass.run();
    }

    std::expected<void, Failure> bind(const DeviceId& id) override {
        if (!m_sessions) {
            return make_failure(CastError::ConnectionError, "application is not initialized");
        }
        auto device = m_registry->find(id);
        if (!device) {
            return make_failure(CastError::NotFound, "unknown device " + id.get());
        }
        return m_sessions->bind(*device);
    }

    std::expected<void, Failure> unbind() override {
        if (!m_sessions) {
            return make_failure(CastError::NoActiveSession, "no device is bound");
        }
        return m_sessions->unbind();
    }

    std::expected<MediaRef, Failure> cast_local_file(const std::filesystem::path& path) override {
        if (!m_media_server || !m_media_server->is_running()) {
            return make_failure(CastError::ServerNotRunning,
                                "media server is not running; check media_server.port and bind_address");
        }
        if (!m_sessions || !m_sessions->has_session()) {
            return make_failure(CastError::NoActiveSession, "no device is bound");
        }
        if (!utils::is_supported_media(path)) {
            return make_failure(CastError::InvalidInput, "unsupported media type: " + path.filename().string());
        }

        auto served = m_library->add_file(path);
        if (!served) {
            return std::unexpected(served.error());
        }

        MediaRef media{m_media_server->media_url(*served), served->content_type, served->display_name};
        CASTBRIDGE_LOG_INFO("Application", "Casting " + media.title + " via " + media.url);

        if (auto result = m_sessions->cast(media); !result) {
            return std::unexpected(result.error());
        }
        return media;
    }

    std::expected<MediaRef, Failure> cast_remote_url(const std::string& url, const std::string& title) override {
        if (!m_sessions) {
            return make_failure(CastError::NoActiveSession, "no device is bound");
        }
        if (!utils::UrlUtils::is_valid_url(url)) {
            return make_failure(CastError::InvalidInput, "not an http(s) URL: " + url);
        }

        auto file_name = utils::UrlUtils::file_name(url);
        auto content_type = utils::guess_content_type(file_name);
        if (content_type == "application/octet-stream") {
            content_type = "video/mp4";
        }

        MediaRef media{url, content_type, title.empty() ? (file_name.empty() ? url : file_name) : title};
        if (auto result = m_sessions->cast(media); !result) {
            return std::unexpected(result.error());
        }
        return media;
    }

    PlaybackState playback_state() const override {
        return m_sessions ? m_sessions->playback_state() : PlaybackState{};
    }

    SessionPhase session_phase() const override {
        return m_sessions ? m_sessions->phase() : SessionPhase::Unbound;
    }

    std::optional<Device> bound_device() const override {
        return m_sessions ? m_sessions->bound_device() : std::nullopt;
    }

    std::string remote_url() const override {
        if (!m_media_server || !m_media_server->is_running()) {
            return {};
        }
        return m_media_server->remote_url();
    }

    std::expected<std::reference_wrapper<services::SessionController>, ApplicationError> session() override {
        if (!m_sessions) {
            return std::unexpected(ApplicationError::ServiceUnavailable);
        }
        return std::ref<services::SessionController>(*m_sessions);
    }

    std::expected<std::shared_ptr<ConfigManager>, ApplicationError> get_configuration_service() override {
        if (!m_config_manager) {
            return std::unexpected(ApplicationError::ServiceUnavailable);
        }
        return m_config_manager;
    }

    ApplicationConfig config() const override {
        return m_config_manager ? m_config_manager->get() : ApplicationConfig{};
    }

    std::shared_ptr<EventBus> event_bus() const override {
        return m_event_bus;
    }

private:
    std::filesystem::path m_config_path;
    std::atomic<ApplicationState> m_state;

    std::shared_ptr<EventBus> m_event_bus;
    std::shared_ptr<ConfigManager> m_config_manager;
    std::shared_ptr<utils::ThreadPool> m_thread_pool;
    std::shared_ptr<services::HttpClient> m_http_client;

    std::shared_ptr<services::DeviceRegistry> m_registry;
    std::shared_ptr<services::DiscoveryScanner> m_scanner;
    std::shared_ptr<services::SessionManager> m_sessions;
    std::shared_ptr<services::MediaLibrary> m_library;
    std::shared_ptr<services::RelayBridge> m_relay;
    std::unique_ptr<services::MediaServer> m_media_server;

    SubscriptionGroup m_subscriptions{m_event_bus};

    std::mutex m_housekeeping_mutex;
    std::condition_variable_any m_housekeeping_cv;
    std::jthread m_housekeeping_thread;

    bool initialize_configuration() {
        m_config_manager = std::make_shared<ConfigManager>(m_config_path);
        m_config_manager->set_event_bus(m_event_bus);

        auto result = m_config_manager->load();
        if (!result) {
            CASTBRIDGE_LOG_ERROR("Application", "Failed to load configuration from " +
                                 m_config_manager->path().string());
            return false;
        }
        return true;
    }

    void initialize_discovery(const ApplicationConfig& config) {
        m_thread_pool = std::make_shared<utils::ThreadPool>(kDiscoveryWorkers);
        m_http_client = services::create_http_client();

        m_registry = std::make_shared<services::DeviceRegistry>(services::EvictionPolicy{
            config.discovery.missed_passes_before_eviction, config.discovery.stale_after});
        m_scanner = std::make_shared<services::DiscoveryScanner>(m_registry, m_event_bus, m_thread_pool,
                                                                 config.discovery);

        m_scanner->add_provider(std::make_shared<services::MdnsDiscovery>());
        m_scanner->add_provider(std::make_shared<services::SsdpDiscovery>(m_http_client));
    }

    void initialize_session(const ApplicationConfig& config) {
        auto factory = std::make_shared<services::DefaultAdapterFactory>(
            [] { return services::create_tls_cast_channel(); },
            m_http_client,
            services::AdapterTimeouts::from(config.session));
        m_sessions = std::make_shared<services::SessionManager>(factory, m_event_bus, config.session);
    }

    void initialize_media(const ApplicationConfig& config) {
        std::filesystem::path upload_dir = config.media_server.upload_dir;
        if (upload_dir.empty()) {
            upload_dir = std::filesystem::temp_directory_path() / "castbridge-uploads";
        }

        m_library = std::make_shared<services::MediaLibrary>(upload_dir);
        m_relay = std::make_shared<services::RelayBridge>(m_sessions, m_event_bus,
                                                          config.media_server.relay_ticket_ttl);
        m_media_server = std::make_unique<services::MediaServer>(config.media_server, m_library, m_relay, m_sessions);
    }

    void subscribe_to_events() {
        m_subscriptions.on<events::ConfigurationUpdated>(
            [this](const events::ConfigurationUpdated& event) {
                utils::LoggerManager::get_instance().set_level(event.current.log_level);
                m_registry->set_policy(services::EvictionPolicy{
                    event.current.discovery.missed_passes_before_eviction,
                    event.current.discovery.stale_after});
                m_scanner->update_config(event.current.discovery);
                if (event.current.media_server.port != event.previous.media_server.port ||
                    event.current.session.poll_interval != event.previous.session.poll_interval) {
                    CASTBRIDGE_LOG_INFO("Application", "Server and session changes take effect after a restart");
                }
            });

        m_subscriptions.on<events::DeviceLost>(
            [](const events::DeviceLost& event) {
                CASTBRIDGE_LOG_WARNING("Application", event.device.name + " stopped answering: " + event.reason);
            });
    }

    void housekeeping_loop(std::stop_token stop_token) {
        while (!stop_token.stop_requested()) {
            {
                std::unique_lock lock(m_housekeeping_mutex);
                m_housekeeping_cv.wait_for(lock, stop_token, kHousekeepingInterval, [] { return false; });
            }
            if (stop_token.stop_requested()) {
                break;
            }

            auto uploads = m_library->purge_expired();
            auto tickets = m_relay->purge_expired();
            if (uploads > 0 || tickets > 0) {
                CASTBRIDGE_LOG_DEBUG("Application", "Housekeeping removed " + std::to_string(uploads) +
                                     " upload(s) and " + std::to_string(tickets) + " ticket(s)");
            }
        }
    }
};

std::expected<std::unique_ptr<Application>, ApplicationError> create_application(
    const std::filesystem::path& config_path) {
    try {
        return std::make_unique<ApplicationImpl>(config_path);
    } catch (const std::exception& e) {
        CASTBRIDGE_LOG_ERROR("Application", "Failed to create application: " + std::string(e.what()));
        return std::unexpected(ApplicationError::InitializationFailed);
    }
}

} // namespace core
} // namespace castbridge
