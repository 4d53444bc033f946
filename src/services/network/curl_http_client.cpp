#include "castbridge/services/network/http_client.hpp"
#include "castbridge/utils/logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>

namespace castbridge {
namespace services {

namespace {

struct EasyHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;

size_t append_body(void* contents, size_t size, size_t nmemb, std::string* body) {
    size_t total_size = size * nmemb;
    body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

NetworkError to_network_error(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
            return NetworkError::DNSResolutionFailed;
        case CURLE_COULDNT_CONNECT:
            return NetworkError::ConnectionFailed;
        case CURLE_OPERATION_TIMEDOUT:
            return NetworkError::Timeout;
        case CURLE_URL_MALFORMAT:
            return NetworkError::InvalidUrl;
        default:
            return NetworkError::BadResponse;
    }
}

} // namespace

// One easy handle per request
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpClientConfig config) : m_config(std::move(config)) {
        ensure_curl_initialized();
    }

    std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) override {
        const std::string what = to_string(request.method) + " " + request.url;
        if (!request.is_valid()) {
            CASTBRIDGE_LOG_ERROR("CurlHttpClient", "Refusing request " + what);
            return std::unexpected(NetworkError::InvalidUrl);
        }

        EasyHandle curl(curl_easy_init());
        if (!curl) {
            CASTBRIDGE_LOG_ERROR("CurlHttpClient", "Failed to initialize curl handle");
            return std::unexpected(NetworkError::ConnectionFailed);
        }

        std::string body;
        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, m_config.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                         static_cast<long>(std::min(m_config.connect_timeout, request.timeout).count()));

        if (request.method == HttpMethod::POST) {
            // An empty POST still needs POSTFIELDS, otherwise curl reads the body from stdin
            curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }

        const auto started = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl.get());
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (res != CURLE_OK) {
            CASTBRIDGE_LOG_DEBUG("CurlHttpClient", what + " failed after " + std::to_string(elapsed.count()) +
                                 "ms: " + curl_easy_strerror(res));
            return std::unexpected(to_network_error(res));
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        CASTBRIDGE_LOG_DEBUG("CurlHttpClient", what + " -> " + std::to_string(status) + " in " +
                             std::to_string(elapsed.count()) + "ms");

        HttpResponse response;
        response.status_code = static_cast<int>(status);
        response.body = std::move(body);
        return response;
    }

private:
    HttpClientConfig m_config;
};

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config) {
    return std::make_unique<CurlHttpClient>(config);
}

} // namespace services
} // namespace castbridge
