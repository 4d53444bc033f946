#include "castbridge/services/discovery/discovery_scanner.hpp"
#include "castbridge/core/events.hpp"
#include "castbridge/utils/logger.hpp"

#include <algorithm>
#include <future>

namespace castbridge {
namespace services {

namespace {
    // Providers get this long past the window before their results are dropped
    constexpr std::chrono::milliseconds kProviderGrace{1500};

    using ProviderResult = std::expected<std::vector<core::Device>, DiscoveryError>;
}

std::string to_string(DiscoveryError error) {
    switch (error) {
        case DiscoveryError::Unavailable: return "unavailable";
        case DiscoveryError::NetworkError: return "network error";
        case DiscoveryError::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ============================================================================
// DiscoveryPass
// ============================================================================

DiscoveryPass::DiscoveryPass(Runner runner, std::vector<core::DeviceKind> kinds)
    : m_runner(std::move(runner)), m_kinds(std::move(kinds)) {}

const std::vector<core::Device>& DiscoveryPass::run() {
    if (!m_results) {
        m_results = m_runner(m_kinds);
    }
    return *m_results;
}

void DiscoveryPass::restart() {
    m_results.reset();
}

// ============================================================================
// DiscoveryScanner
// ============================================================================

DiscoveryScanner::DiscoveryScanner(std::shared_ptr<DeviceRegistry> registry,
                                   std::shared_ptr<core::EventBus> event_bus,
                                   std::shared_ptr<utils::ThreadPool> thread_pool,
                                   core::DiscoveryConfig config)
    : m_registry(std::move(registry))
    , m_event_bus(std::move(event_bus))
    , m_thread_pool(std::move(thread_pool))
    , m_config(std::move(config)) {
    m_registry->set_policy({m_config.missed_passes_before_eviction, m_config.stale_after});
}

DiscoveryScanner::~DiscoveryScanner() {
    stop();
}

void DiscoveryScanner::add_provider(std::shared_ptr<DiscoveryProvider> provider) {
    std::lock_guard lock(m_config_mutex);
    CASTBRIDGE_LOG_DEBUG("DiscoveryScanner", "Registered provider: " + provider->name());
    m_providers.push_back(std::move(provider));
}

DiscoveryPass DiscoveryScanner::scan(std::vector<core::DeviceKind> kinds) {
    if (kinds.empty()) {
        kinds = config_snapshot().enabled_kinds;
    }
    return DiscoveryPass([this](const std::vector<core::DeviceKind>& k) { return run_pass(k); },
                         std::move(kinds));
}

std::vector<core::Device> DiscoveryScanner::run_pass(const std::vector<core::DeviceKind>& kinds) {
    std::lock_guard pass_lock(m_pass_mutex);

    const auto config = config_snapshot();
    std::vector<std::shared_ptr<DiscoveryProvider>> providers;
    {
        std::lock_guard lock(m_config_mutex);
        for (const auto& provider : m_providers) {
            if (std::find(kinds.begin(), kinds.end(), provider->kind()) != kinds.end()) {
                providers.push_back(provider);
            }
        }
    }

    if (providers.empty()) {
        CASTBRIDGE_LOG_WARNING("DiscoveryScanner", "No discovery provider for the requested kinds");
        return {};
    }

    std::stop_source stop_source;
    {
        std::lock_guard lock(m_active_stop_mutex);
        m_active_stop = stop_source;
    }

    CASTBRIDGE_LOG_DEBUG("DiscoveryScanner", "Starting discovery pass with " +
                         std::to_string(providers.size()) + " provider(s)");

    struct Pending {
        std::shared_ptr<DiscoveryProvider> provider;
        std::future<ProviderResult> result;
    };
    std::vector<Pending> pending;

    const auto window = config.scan_window;
    for (const auto& provider : providers) {
        auto token = stop_source.get_token();
        auto submitted = m_thread_pool->try_submit([provider, window, token]() -> ProviderResult {
            return provider->discover(window, token);
        });
        if (!submitted) {
            CASTBRIDGE_LOG_WARNING("DiscoveryScanner", "Thread pool rejected provider " + provider->name());
            continue;
        }
        pending.push_back({provider, std::move(*submitted)});
    }

    const auto deadline = std::chrono::steady_clock::now() + window + kProviderGrace;
    std::vector<core::Device> found;
    std::vector<core::DeviceKind> completed_kinds;

    for (auto& [provider, result] : pending) {
        if (result.wait_until(deadline) != std::future_status::ready) {
            CASTBRIDGE_LOG_WARNING("DiscoveryScanner", provider->name() + " did not finish within the scan window");
            continue;
        }

        ProviderResult devices;
        try {
            devices = result.get();
        } catch (const std::exception& e) {
            CASTBRIDGE_LOG_ERROR("DiscoveryScanner", provider->name() + " threw: " + e.what());
            continue;
        }

        if (!devices) {
            CASTBRIDGE_LOG_WARNING("DiscoveryScanner", provider->name() + " failed: " +
                                   to_string(devices.error()) + ", will retry next pass");
            continue;
        }

        completed_kinds.push_back(provider->kind());
        found.insert(found.end(), devices->begin(), devices->end());
    }

    // Late providers must stop touching the network
    stop_source.request_stop();
    {
        std::lock_guard lock(m_active_stop_mutex);
        m_active_stop.reset();
    }

    auto merge = m_registry->merge(found, completed_kinds);
    CASTBRIDGE_LOG_INFO("DiscoveryScanner", "Pass complete: " + std::to_string(found.size()) + " seen, " +
                        std::to_string(merge.added.size()) + " added, " +
                        std::to_string(merge.removed.size()) + " removed");

    if (merge.membership_changed() && m_event_bus) {
        m_event_bus->publish(core::events::DeviceListChanged{
            std::move(merge.added), std::move(merge.removed), m_registry->size()});
    }

    return found;
}

void DiscoveryScanner::start_periodic() {
    if (m_periodic_thread.joinable()) {
        CASTBRIDGE_LOG_DEBUG("DiscoveryScanner", "Periodic discovery already running");
        return;
    }

    CASTBRIDGE_LOG_INFO("DiscoveryScanner", "Starting periodic discovery every " +
                        std::to_string(config_snapshot().rescan_interval.count()) + "s");
    m_periodic_thread = std::jthread([this](std::stop_token stop_token) { periodic_loop(stop_token); });
}

void DiscoveryScanner::stop() {
    if (!m_periodic_thread.joinable()) {
        return;
    }

    m_periodic_thread.request_stop();
    {
        std::lock_guard lock(m_active_stop_mutex);
        if (m_active_stop) {
            m_active_stop->request_stop();
        }
    }
    m_wait_cv.notify_all();
    m_periodic_thread.join();
    m_periodic_thread = std::jthread();

    CASTBRIDGE_LOG_INFO("DiscoveryScanner", "Periodic discovery stopped");
}

bool DiscoveryScanner::is_running() const {
    return m_periodic_thread.joinable();
}

void DiscoveryScanner::update_config(const core::DiscoveryConfig& config) {
    {
        std::lock_guard lock(m_config_mutex);
        m_config = config;
    }
    m_registry->set_policy({config.missed_passes_before_eviction, config.stale_after});
    m_wait_cv.notify_all();
}

void DiscoveryScanner::periodic_loop(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        run_pass(config_snapshot().enabled_kinds);

        std::unique_lock lock(m_wait_mutex);
        m_wait_cv.wait_for(lock, stop_token, config_snapshot().rescan_interval, [] { return false; });
    }
}

core::DiscoveryConfig DiscoveryScanner::config_snapshot() const {
    std::lock_guard lock(m_config_mutex);
    return m_config;
}

} // namespace services
} // namespace castbridge
