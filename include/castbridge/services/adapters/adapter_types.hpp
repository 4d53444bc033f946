#pragma once

#include "castbridge/core/models.hpp"
#include <chrono>
#include <functional>

namespace castbridge::services {

struct AdapterTimeouts {
    std::chrono::milliseconds connect{10000};
    std::chrono::milliseconds command{5000};

    static AdapterTimeouts from(const core::SessionConfig& config) {
        return {std::chrono::duration_cast<std::chrono::milliseconds>(config.connect_timeout),
                std::chrono::duration_cast<std::chrono::milliseconds>(config.command_timeout)};
    }
};

// Status the device pushed without being asked. May run on an adapter thread.
using StatusListener = std::function<void(const core::StatusSnapshot&)>;

} // namespace castbridge::services
