#pragma once

#include "castbridge/core/models.hpp"
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>

namespace castbridge::services {

namespace cast_ns {
    inline constexpr const char* kConnection = "urn:x-cast:com.google.cast.tp.connection";
    inline constexpr const char* kHeartbeat = "urn:x-cast:com.google.cast.tp.heartbeat";
    inline constexpr const char* kReceiver = "urn:x-cast:com.google.cast.receiver";
    inline constexpr const char* kMedia = "urn:x-cast:com.google.cast.media";
}

inline constexpr const char* kCastSenderId = "sender-0";
inline constexpr const char* kCastReceiverId = "receiver-0";
inline constexpr const char* kDefaultMediaReceiverAppId = "CC1AD845";

// Message-level view of a Cast V2 connection: JSON payloads addressed by
// destination id and namespace. Framing, TLS and keep-alive live below this.
class CastChannel {
public:
    // Unsolicited messages, or replies nobody is waiting for any more
    using MessageHandler = std::function<void(const std::string& ns, const nlohmann::json& payload)>;

    virtual ~CastChannel() = default;

    virtual std::expected<void, core::Failure> open(const std::string& host, std::uint16_t port,
                                                    std::chrono::milliseconds timeout) = 0;

    // Stamps payload with a fresh requestId and waits for the reply that
    // carries it. Timeouts and cancellation surface as CommandError.
    virtual std::expected<nlohmann::json, core::Failure> request(const std::string& destination,
                                                                 const std::string& ns,
                                                                 nlohmann::json payload,
                                                                 std::chrono::milliseconds timeout) = 0;

    virtual std::expected<void, core::Failure> send(const std::string& destination,
                                                    const std::string& ns,
                                                    const nlohmann::json& payload) = 0;

    virtual void set_message_handler(MessageHandler handler) = 0;

    // Fails every outstanding request without closing the connection
    virtual void cancel() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

std::unique_ptr<CastChannel> create_tls_cast_channel();

} // namespace castbridge::services
