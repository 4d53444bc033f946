#include "castbridge/utils/url_utils.hpp"

#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace castbridge {
namespace utils {

namespace {
    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string UrlUtils::encode(const std::string& str) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex;

    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << std::uppercase;
            encoded << '%' << std::setw(2) << static_cast<int>(uc);
            encoded << std::nouppercase;
        }
    }

    return encoded.str();
}

std::string UrlUtils::decode(const std::string& str) {
    std::string decoded;
    decoded.reserve(str.size());
    for (size_t i = 0; i < str.length(); ++i) {
        if (str[i] == '%' && i + 2 < str.length()) {
            int hi = hex_value(str[i + 1]);
            int lo = hex_value(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
            decoded.push_back(str[i]);
        } else if (str[i] == '+') {
            decoded.push_back(' ');
        } else {
            decoded.push_back(str[i]);
        }
    }
    return decoded;
}

std::string UrlUtils::join_path(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;

    bool base_ends_with_slash = base.back() == '/';
    bool path_starts_with_slash = path.front() == '/';

    if (base_ends_with_slash && path_starts_with_slash) {
        return base + path.substr(1);
    } else if (!base_ends_with_slash && !path_starts_with_slash) {
        return base + "/" + path;
    } else {
        return base + path;
    }
}

std::unordered_map<std::string, std::string> UrlUtils::parse_query_string(const std::string& query) {
    std::unordered_map<std::string, std::string> params;
    std::istringstream iss(query);
    std::string pair;

    while (std::getline(iss, pair, '&')) {
        if (pair.empty()) continue;
        size_t pos = pair.find('=');
        if (pos != std::string::npos) {
            params[decode(pair.substr(0, pos))] = decode(pair.substr(pos + 1));
        } else {
            params[decode(pair)] = "";
        }
    }

    return params;
}

bool UrlUtils::is_valid_url(const std::string& url) {
    auto scheme = get_scheme(url);
    if (!scheme || (*scheme != "http" && *scheme != "https")) {
        return false;
    }
    auto host = get_host(url);
    return host.has_value() && !host->empty();
}

std::optional<std::string> UrlUtils::get_host(const std::string& url) {
    size_t scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos) return std::nullopt;

    size_t host_start = scheme_pos + 3;
    size_t host_end = url.find_first_of(":/?#", host_start);
    if (host_end == std::string::npos) host_end = url.length();

    if (host_start >= host_end) return std::nullopt;

    return url.substr(host_start, host_end - host_start);
}

std::optional<int> UrlUtils::get_port(const std::string& url) {
    auto host = get_host(url);
    if (!host) return std::nullopt;

    size_t scheme_pos = url.find("://");
    size_t port_pos = scheme_pos + 3 + host->length();

    if (port_pos >= url.length() || url[port_pos] != ':') {
        std::string scheme = url.substr(0, scheme_pos);
        if (scheme == "http") return 80;
        if (scheme == "https") return 443;
        return std::nullopt;
    }

    size_t port_end = url.find_first_of("/?#", port_pos);
    if (port_end == std::string::npos) port_end = url.length();

    int port = 0;
    const char* first = url.data() + port_pos + 1;
    const char* last = url.data() + port_end;
    auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc{} || ptr != last || port <= 0 || port > 65535) {
        return std::nullopt;
    }
    return port;
}

std::optional<std::string> UrlUtils::get_scheme(const std::string& url) {
    size_t scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos || scheme_pos == 0) {
        return std::nullopt;
    }
    std::string scheme = url.substr(0, scheme_pos);
    for (auto& c : scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return scheme;
}

std::pair<std::string, std::string> UrlUtils::split_target(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return {target, ""};
    }
    return {target.substr(0, pos), target.substr(pos + 1)};
}

std::string UrlUtils::file_name(const std::string& url) {
    auto path = split_target(url).first;
    auto hash = path.find('#');
    if (hash != std::string::npos) path.resize(hash);
    while (!path.empty() && path.back() == '/') path.pop_back();
    auto slash = path.find_last_of('/');
    auto name = slash == std::string::npos ? path : path.substr(slash + 1);
    return decode(name);
}

std::string UrlUtils::build_http_url(const std::string& host, int port, const std::string& path) {
    std::string authority = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return join_path("http://" + authority + ":" + std::to_string(port), path);
}

} // namespace utils
} // namespace castbridge
