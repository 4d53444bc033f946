#pragma once

#include "castbridge/services/network/http_types.hpp"
#include <expected>
#include <memory>

namespace castbridge {
namespace services {

// Blocking HTTP client interface; the Roku adapter and discovery depend on this, not on curl
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) = 0;
};

struct HttpClientConfig {
    std::chrono::seconds connect_timeout{3};
    std::string user_agent = "castbridge/1.0";
};

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config = {});

} // namespace services
} // namespace castbridge
