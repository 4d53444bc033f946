#include "castbridge/services/adapters/cast_framing.hpp"

#include "cast_channel.pb.h"

namespace castbridge::services {

namespace cast_frame {

std::string to_string(DecodeError error) {
    switch (error) {
        case DecodeError::Unparsable: return "unparsable frame";
        case DecodeError::BinaryPayload: return "binary payload";
        case DecodeError::NotJson: return "payload is not a JSON object";
    }
    return "unknown";
}

std::optional<std::string> encode(const std::string& source_id, const std::string& destination_id,
                                  const std::string& ns, const nlohmann::json& payload) {
    cast_channel::CastMessage message;
    message.set_protocol_version(cast_channel::CastMessage::CASTV2_1_0);
    message.set_source_id(source_id);
    message.set_destination_id(destination_id);
    message.set_namespace_(ns);
    message.set_payload_type(cast_channel::CastMessage::STRING);
    message.set_payload_utf8(payload.dump());

    std::string serialized;
    if (!message.SerializeToString(&serialized) || serialized.empty() || serialized.size() > kMaxFrameSize) {
        return std::nullopt;
    }

    const auto length = static_cast<std::uint32_t>(serialized.size());
    std::string frame;
    frame.reserve(kHeaderSize + serialized.size());
    frame.push_back(static_cast<char>((length >> 24) & 0xFF));
    frame.push_back(static_cast<char>((length >> 16) & 0xFF));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
    frame.append(serialized);
    return frame;
}

std::uint32_t body_length(const std::array<unsigned char, kHeaderSize>& header) {
    return (static_cast<std::uint32_t>(header[0]) << 24) |
           (static_cast<std::uint32_t>(header[1]) << 16) |
           (static_cast<std::uint32_t>(header[2]) << 8) |
           static_cast<std::uint32_t>(header[3]);
}

bool acceptable_length(std::uint32_t length) {
    return length > 0 && length <= kMaxFrameSize;
}

std::expected<Message, DecodeError> decode(const std::string& body) {
    cast_channel::CastMessage message;
    if (!message.ParseFromString(body)) {
        return std::unexpected(DecodeError::Unparsable);
    }
    if (message.payload_type() != cast_channel::CastMessage::STRING) {
        return std::unexpected(DecodeError::BinaryPayload);
    }

    auto payload = nlohmann::json::parse(message.payload_utf8(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return std::unexpected(DecodeError::NotJson);
    }

    return Message{message.source_id(), message.destination_id(), message.namespace_(), std::move(payload)};
}

} // namespace cast_frame

PendingRequests::Ticket PendingRequests::open() {
    auto promise = std::make_shared<std::promise<Reply>>();
    Ticket ticket;
    ticket.reply = promise->get_future();

    std::lock_guard lock(m_mutex);
    ticket.request_id = m_next_id++;
    m_waiters.emplace(ticket.request_id, std::move(promise));
    return ticket;
}

bool PendingRequests::resolve(int request_id, nlohmann::json payload) {
    std::shared_ptr<std::promise<Reply>> waiter;
    {
        std::lock_guard lock(m_mutex);
        auto it = m_waiters.find(request_id);
        if (it == m_waiters.end()) {
            return false;
        }
        waiter = std::move(it->second);
        m_waiters.erase(it);
    }
    waiter->set_value(Reply(std::in_place, std::move(payload)));
    return true;
}

PendingRequests::Reply PendingRequests::wait(Ticket& ticket, std::chrono::milliseconds timeout,
                                             const std::string& what) {
    if (ticket.reply.wait_for(timeout) != std::future_status::ready) {
        forget(ticket.request_id);
        return core::make_failure(core::CastError::CommandError,
                                  "no reply to " + what + " within " + std::to_string(timeout.count()) + "ms");
    }
    return ticket.reply.get();
}

void PendingRequests::forget(int request_id) {
    std::lock_guard lock(m_mutex);
    m_waiters.erase(request_id);
}

void PendingRequests::fail_all(core::CastError error, const std::string& reason) {
    std::unordered_map<int, std::shared_ptr<std::promise<Reply>>> waiters;
    {
        std::lock_guard lock(m_mutex);
        waiters.swap(m_waiters);
    }
    for (auto& [id, waiter] : waiters) {
        waiter->set_value(std::unexpected(core::Failure{error, reason}));
    }
}

std::size_t PendingRequests::size() const {
    std::lock_guard lock(m_mutex);
    return m_waiters.size();
}

} // namespace castbridge::services
