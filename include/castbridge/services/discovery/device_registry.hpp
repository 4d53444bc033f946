#pragma once

#include "castbridge/core/models.hpp"
#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace castbridge {
namespace services {

struct EvictionPolicy {
    int missed_passes = 3;
    std::chrono::seconds stale_after{30};
};

struct MergeResult {
    std::vector<core::Device> added;
    std::vector<core::Device> removed;
    std::vector<core::Device> updated;

    bool membership_changed() const { return !added.empty() || !removed.empty(); }
};

// Discovered devices keyed by id. merge() is the only mutation path; every
// reader gets a copy.
class DeviceRegistry {
public:
    explicit DeviceRegistry(EvictionPolicy policy = {});

    // Folds one discovery pass into the registry. Only devices of the scanned
    // kinds can accrue missed passes; a device is evicted once it has missed
    // policy.missed_passes passes and was last seen at least stale_after ago.
    MergeResult merge(const std::vector<core::Device>& seen,
                      const std::vector<core::DeviceKind>& scanned_kinds,
                      std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Sorted by name, then id
    std::vector<core::Device> snapshot() const;
    std::optional<core::Device> find(const core::DeviceId& id) const;
    std::vector<core::Device> filter(const std::string& query,
                                     const std::vector<core::DeviceKind>& kinds = {}) const;
    std::size_t size() const;
    void clear();

    void set_policy(EvictionPolicy policy);

    // Case-insensitive substring match of query against name, kind label and
    // model; an empty kinds list means every kind
    static std::vector<core::Device> filter(const std::vector<core::Device>& devices,
                                            const std::string& query,
                                            const std::vector<core::DeviceKind>& kinds);

private:
    struct Entry {
        core::Device device;
        int missed_passes = 0;
    };

    mutable std::shared_mutex m_mutex;
    std::unordered_map<core::DeviceId, Entry> m_entries;
    EvictionPolicy m_policy;
};

} // namespace services
} // namespace castbridge
