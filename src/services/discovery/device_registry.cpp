#include "castbridge/services/discovery/device_registry.hpp"
#include "castbridge/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <unordered_set>

namespace castbridge {
namespace services {

namespace {
    std::string lowercase(const std::string& in) {
        std::string out(in);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    bool contains(const std::vector<core::DeviceKind>& kinds, core::DeviceKind kind) {
        return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
    }

    void sort_devices(std::vector<core::Device>& devices) {
        std::sort(devices.begin(), devices.end(), [](const core::Device& a, const core::Device& b) {
            auto an = lowercase(a.name);
            auto bn = lowercase(b.name);
            return an != bn ? an < bn : a.id < b.id;
        });
    }
}

DeviceRegistry::DeviceRegistry(EvictionPolicy policy) : m_policy(policy) {}

MergeResult DeviceRegistry::merge(const std::vector<core::Device>& seen,
                                  const std::vector<core::DeviceKind>& scanned_kinds,
                                  std::chrono::system_clock::time_point now) {
    MergeResult result;
    std::unordered_set<core::DeviceId> seen_ids;

    std::unique_lock lock(m_mutex);

    for (const auto& device : seen) {
        seen_ids.insert(device.id);

        auto it = m_entries.find(device.id);
        if (it == m_entries.end()) {
            Entry entry{device, 0};
            entry.device.last_seen = now;
            result.added.push_back(entry.device);
            m_entries.emplace(device.id, std::move(entry));
            continue;
        }

        auto& existing = it->second.device;
        bool changed = existing.name != device.name ||
                       existing.model != device.model ||
                       existing.capabilities != device.capabilities;

        existing.name = device.name;
        existing.model = device.model;
        existing.capabilities = device.capabilities;
        existing.last_seen = now;
        it->second.missed_passes = 0;

        if (changed) {
            result.updated.push_back(existing);
        }
    }

    for (auto it = m_entries.begin(); it != m_entries.end();) {
        auto& entry = it->second;
        if (seen_ids.contains(it->first) || !contains(scanned_kinds, entry.device.kind)) {
            ++it;
            continue;
        }

        ++entry.missed_passes;
        bool missed_enough = entry.missed_passes >= m_policy.missed_passes;
        bool stale = now - entry.device.last_seen >= m_policy.stale_after;

        if (missed_enough && stale) {
            CASTBRIDGE_LOG_INFO("DeviceRegistry", "Evicting " + entry.device.name + " after " +
                                std::to_string(entry.missed_passes) + " missed passes");
            result.removed.push_back(entry.device);
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }

    sort_devices(result.added);
    sort_devices(result.removed);
    return result;
}

std::vector<core::Device> DeviceRegistry::snapshot() const {
    std::vector<core::Device> devices;
    {
        std::shared_lock lock(m_mutex);
        devices.reserve(m_entries.size());
        for (const auto& [id, entry] : m_entries) {
            devices.push_back(entry.device);
        }
    }
    sort_devices(devices);
    return devices;
}

std::optional<core::Device> DeviceRegistry::find(const core::DeviceId& id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.device;
}

std::vector<core::Device> DeviceRegistry::filter(const std::string& query,
                                                 const std::vector<core::DeviceKind>& kinds) const {
    return filter(snapshot(), query, kinds);
}

std::vector<core::Device> DeviceRegistry::filter(const std::vector<core::Device>& devices,
                                                 const std::string& query,
                                                 const std::vector<core::DeviceKind>& kinds) {
    const auto needle = lowercase(query);
    std::vector<core::Device> matches;

    for (const auto& device : devices) {
        if (!kinds.empty() && !contains(kinds, device.kind)) {
            continue;
        }
        if (needle.empty() ||
            lowercase(device.name).find(needle) != std::string::npos ||
            core::to_string(device.kind).find(needle) != std::string::npos ||
            lowercase(device.model).find(needle) != std::string::npos) {
            matches.push_back(device);
        }
    }

    return matches;
}

std::size_t DeviceRegistry::size() const {
    std::shared_lock lock(m_mutex);
    return m_entries.size();
}

void DeviceRegistry::clear() {
    std::unique_lock lock(m_mutex);
    m_entries.clear();
}

void DeviceRegistry::set_policy(EvictionPolicy policy) {
    std::unique_lock lock(m_mutex);
    m_policy = policy;
}

} // namespace services
} // namespace castbridge
