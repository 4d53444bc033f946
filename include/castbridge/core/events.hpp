#pragma once

#include "castbridge/core/models.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace castbridge::core::events {

struct Event {
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
    Event() = default;
    virtual ~Event() = default;
};

// Result of one registry merge; never published when both lists are empty
struct DeviceListChanged : Event {
    std::vector<Device> added;
    std::vector<Device> removed;
    std::size_t total = 0;

    DeviceListChanged(std::vector<Device> added_devices, std::vector<Device> removed_devices, std::size_t count)
        : added(std::move(added_devices)), removed(std::move(removed_devices)), total(count) {}
};

struct SessionPhaseChanged : Event {
    SessionPhase previous;
    SessionPhase current;
    std::optional<Device> device;

    SessionPhaseChanged(SessionPhase prev, SessionPhase curr, std::optional<Device> dev = std::nullopt)
        : previous(prev), current(curr), device(std::move(dev)) {}
};

struct PlaybackStateChanged : Event {
    PlaybackState previous;
    PlaybackState current;

    PlaybackStateChanged(PlaybackState prev, PlaybackState curr)
        : previous(std::move(prev)), current(std::move(curr)) {}
};

// Published once per run of consecutive poll failures
struct DeviceLost : Event {
    Device device;
    int consecutive_failures;
    std::string reason;

    DeviceLost(Device dev, int failures, std::string why)
        : device(std::move(dev)), consecutive_failures(failures), reason(std::move(why)) {}
};

struct CommandFailed : Event {
    std::string command;
    Failure failure;

    CommandFailed(std::string cmd, Failure f)
        : command(std::move(cmd)), failure(std::move(f)) {}
};

struct RelayReceived : Event {
    std::string ticket_id;
    std::string display_name;
    std::string origin;
    MediaRef media;

    RelayReceived(std::string id, std::string name, std::string from, MediaRef ref)
        : ticket_id(std::move(id)), display_name(std::move(name)),
          origin(std::move(from)), media(std::move(ref)) {}
};

struct ConfigurationUpdated : Event {
    ApplicationConfig previous;
    ApplicationConfig current;

    ConfigurationUpdated(ApplicationConfig prev, ApplicationConfig curr)
        : previous(std::move(prev)), current(std::move(curr)) {}
};

} // namespace castbridge::core::events
