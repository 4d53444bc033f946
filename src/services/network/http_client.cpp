#include "castbridge/services/network/http_types.hpp"
#include "castbridge/utils/url_utils.hpp"

namespace castbridge {
namespace services {

bool HttpRequest::is_valid() const {
    return !url.empty() && utils::UrlUtils::is_valid_url(url) && timeout.count() > 0;
}

bool HttpResponse::is_success() const {
    return status_code >= 200 && status_code < 300;
}

std::string to_string(HttpMethod method) {
    return method == HttpMethod::POST ? "POST" : "GET";
}

std::string to_string(NetworkError error) {
    switch (error) {
        case NetworkError::ConnectionFailed: return "connection failed";
        case NetworkError::Timeout: return "timed out";
        case NetworkError::DNSResolutionFailed: return "DNS resolution failed";
        case NetworkError::InvalidUrl: return "invalid URL";
        case NetworkError::BadResponse: return "bad response";
    }
    return "network error";
}

} // namespace services
} // namespace castbridge
