#pragma once

#include "castbridge/core/event_bus.hpp"
#include "castbridge/core/models.hpp"
#include "castbridge/services/discovery/device_registry.hpp"
#include "castbridge/utils/threading.hpp"

#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace castbridge {
namespace services {

enum class DiscoveryError {
    Unavailable,     // local daemon or socket could not be set up
    NetworkError,
    Cancelled
};

std::string to_string(DiscoveryError error);

// One mechanism that finds receivers of a single kind on the LAN
class DiscoveryProvider {
public:
    virtual ~DiscoveryProvider() = default;

    virtual core::DeviceKind kind() const = 0;
    virtual std::string name() const = 0;

    // Blocks for at most window; returns early when stop is requested
    virtual std::expected<std::vector<core::Device>, DiscoveryError>
    discover(std::chrono::milliseconds window, std::stop_token stop) = 0;
};

// A discovery pass that has not run yet. Iterating it (or calling run())
// performs the scan; restart() discards the results so the next iteration
// scans again. A pass must not outlive the scanner that created it.
class DiscoveryPass {
public:
    using Runner = std::function<std::vector<core::Device>(const std::vector<core::DeviceKind>&)>;
    using const_iterator = std::vector<core::Device>::const_iterator;

    DiscoveryPass(Runner runner, std::vector<core::DeviceKind> kinds);

    const std::vector<core::Device>& run();
    void restart();

    const_iterator begin() { return run().begin(); }
    const_iterator end() { return run().end(); }

    bool has_run() const { return m_results.has_value(); }
    const std::vector<core::DeviceKind>& kinds() const { return m_kinds; }

private:
    Runner m_runner;
    std::vector<core::DeviceKind> m_kinds;
    std::optional<std::vector<core::Device>> m_results;
};

class DiscoveryScanner {
public:
    DiscoveryScanner(std::shared_ptr<DeviceRegistry> registry,
                     std::shared_ptr<core::EventBus> event_bus,
                     std::shared_ptr<utils::ThreadPool> thread_pool,
                     core::DiscoveryConfig config);
    ~DiscoveryScanner();

    DiscoveryScanner(const DiscoveryScanner&) = delete;
    DiscoveryScanner& operator=(const DiscoveryScanner&) = delete;

    void add_provider(std::shared_ptr<DiscoveryProvider> provider);

    // Lazy pass over kinds; an empty list means the configured kinds
    DiscoveryPass scan(std::vector<core::DeviceKind> kinds = {});

    // Runs every matching provider concurrently, folds the results into the
    // registry and returns the devices seen in this pass
    std::vector<core::Device> run_pass(const std::vector<core::DeviceKind>& kinds);

    void start_periodic();
    void stop();
    bool is_running() const;

    void update_config(const core::DiscoveryConfig& config);

private:
    std::shared_ptr<DeviceRegistry> m_registry;
    std::shared_ptr<core::EventBus> m_event_bus;
    std::shared_ptr<utils::ThreadPool> m_thread_pool;

    mutable std::mutex m_config_mutex;
    core::DiscoveryConfig m_config;
    std::vector<std::shared_ptr<DiscoveryProvider>> m_providers;

    std::mutex m_pass_mutex;
    std::mutex m_active_stop_mutex;
    std::optional<std::stop_source> m_active_stop;

    std::mutex m_wait_mutex;
    std::condition_variable_any m_wait_cv;
    std::jthread m_periodic_thread;

    void periodic_loop(std::stop_token stop_token);
    core::DiscoveryConfig config_snapshot() const;
};

} // namespace services
} // namespace castbridge
