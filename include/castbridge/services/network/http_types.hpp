#pragma once

#include <chrono>
#include <string>

namespace castbridge {
namespace services {

// ECP and device-info lookups only ever GET a query or POST an empty command
enum class HttpMethod {
    GET,
    POST
};

enum class NetworkError {
    ConnectionFailed,
    Timeout,
    DNSResolutionFailed,
    InvalidUrl,
    BadResponse
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::string body;
    std::chrono::seconds timeout{10};

    bool is_valid() const;
};

struct HttpResponse {
    int status_code = 0;
    std::string body;

    bool is_success() const;
};

std::string to_string(HttpMethod method);
std::string to_string(NetworkError error);

} // namespace services
} // namespace castbridge
