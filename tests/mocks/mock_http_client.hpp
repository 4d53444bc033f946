#pragma once

#include "castbridge/services/network/http_client.hpp"
#include <gmock/gmock.h>

namespace castbridge::services::testing {

class MockHttpClient : public HttpClient {
public:
    MOCK_METHOD((std::expected<HttpResponse, NetworkError>), execute, (const HttpRequest& request), (override));
};

inline HttpResponse http_response(int status, std::string body = {}) {
    HttpResponse response;
    response.status_code = status;
    response.body = std::move(body);
    return response;
}

} // namespace castbridge::services::testing
