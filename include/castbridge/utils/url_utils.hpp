#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace castbridge {
namespace utils {

class UrlUtils {
public:
    // Percent-encodes everything except RFC 3986 unreserved characters
    static std::string encode(const std::string& str);
    static std::string decode(const std::string& str);
    static std::string join_path(const std::string& base, const std::string& path);
    static std::unordered_map<std::string, std::string> parse_query_string(const std::string& query);
    static bool is_valid_url(const std::string& url);
    static std::optional<std::string> get_host(const std::string& url);
    static std::optional<int> get_port(const std::string& url);
    static std::optional<std::string> get_scheme(const std::string& url);

    // Splits "/a/b?x=1" into ("/a/b", "x=1")
    static std::pair<std::string, std::string> split_target(const std::string& target);
    // Last path segment without query, percent-decoded
    static std::string file_name(const std::string& url);
    static std::string build_http_url(const std::string& host, int port, const std::string& path);
};

} // namespace utils
} // namespace castbridge
