#pragma once

#include "castbridge/core/models.hpp"
#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace castbridge::services {

// Cast V2 wire frames: a 4-byte big-endian length followed by a serialised
// CastMessage carrying a JSON string payload.
namespace cast_frame {

inline constexpr std::size_t kHeaderSize = 4;
inline constexpr std::uint32_t kMaxFrameSize = 64 * 1024;

struct Message {
    std::string source_id;
    std::string destination_id;
    std::string ns;
    nlohmann::json payload;
};

enum class DecodeError {
    Unparsable,
    BinaryPayload,
    NotJson
};

std::string to_string(DecodeError error);

// Header plus body, ready for the socket; nullopt if protobuf refuses it
std::optional<std::string> encode(const std::string& source_id, const std::string& destination_id,
                                  const std::string& ns, const nlohmann::json& payload);

std::uint32_t body_length(const std::array<unsigned char, kHeaderSize>& header);
bool acceptable_length(std::uint32_t length);

// Body only, without the length header
std::expected<Message, DecodeError> decode(const std::string& body);

} // namespace cast_frame

// Matches replies to requests by requestId. Waiters block on a future; the
// reader thread resolves them as frames arrive.
class PendingRequests {
public:
    using Reply = std::expected<nlohmann::json, core::Failure>;

    struct Ticket {
        int request_id = 0;
        std::future<Reply> reply;
    };

    Ticket open();

    // False when nobody waits for this id any more
    bool resolve(int request_id, nlohmann::json payload);

    // A timeout forgets the request and fails with CommandError
    Reply wait(Ticket& ticket, std::chrono::milliseconds timeout, const std::string& what);

    void forget(int request_id);
    void fail_all(core::CastError error, const std::string& reason);
    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    int m_next_id = 1;
    std::unordered_map<int, std::shared_ptr<std::promise<Reply>>> m_waiters;
};

} // namespace castbridge::services
