#pragma once

#include "castbridge/services/adapters/cast_channel.hpp"
#include <gmock/gmock.h>

namespace castbridge::services::testing {

class MockCastChannel : public CastChannel {
public:
    MOCK_METHOD((std::expected<void, core::Failure>), open,
                (const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD((std::expected<nlohmann::json, core::Failure>), request,
                (const std::string& destination, const std::string& ns, nlohmann::json payload,
                 std::chrono::milliseconds timeout), (override));
    MOCK_METHOD((std::expected<void, core::Failure>), send,
                (const std::string& destination, const std::string& ns, const nlohmann::json& payload), (override));
    MOCK_METHOD(void, set_message_handler, (MessageHandler handler), (override));
    MOCK_METHOD(void, cancel, (), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(bool, is_open, (), (const, override));
};

} // namespace castbridge::services::testing
