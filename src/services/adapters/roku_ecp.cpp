#include "castbridge/services/adapters/roku_ecp.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace castbridge::services::roku {

namespace {
    std::string trim(const std::string& in) {
        auto first = in.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return {};
        }
        auto last = in.find_last_not_of(" \t\r\n");
        return in.substr(first, last - first + 1);
    }

    std::string decode_entities(std::string text) {
        static const std::pair<const char*, const char*> entities[] = {
            {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&apos;", "'"}, {"&amp;", "&"}
        };
        for (const auto& [entity, replacement] : entities) {
            std::string::size_type pos = 0;
            const std::string from(entity);
            while ((pos = text.find(from, pos)) != std::string::npos) {
                text.replace(pos, from.size(), replacement);
                pos += 1;
            }
        }
        return text;
    }

    std::string lowercase(std::string in) {
        std::transform(in.begin(), in.end(), in.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return in;
    }
}

std::optional<std::string> xml_text(const std::string& xml, const std::string& tag) {
    const std::regex pattern("<" + tag + R"((?:\s[^>]*)?>([\s\S]*?)</)" + tag + ">");
    std::smatch match;
    if (!std::regex_search(xml, match, pattern)) {
        return std::nullopt;
    }
    return trim(decode_entities(match[1].str()));
}

std::optional<std::string> xml_attribute(const std::string& xml, const std::string& tag,
                                         const std::string& attribute) {
    const std::regex element("<" + tag + R"((\s[^>]*)?/?>)");
    std::smatch match;
    if (!std::regex_search(xml, match, element)) {
        return std::nullopt;
    }

    const std::string attributes = match[1].str();
    const std::regex attr_pattern(R"((?:^|\s))" + attribute + R"re(\s*=\s*"([^"]*)")re");
    std::smatch attr_match;
    if (!std::regex_search(attributes, attr_match, attr_pattern)) {
        return std::nullopt;
    }
    return decode_entities(attr_match[1].str());
}

DeviceInfo parse_device_info(const std::string& xml, const std::string& host) {
    DeviceInfo info;

    for (const char* tag : {"user-device-name", "friendly-device-name", "default-device-name"}) {
        auto value = xml_text(xml, tag);
        if (value && !value->empty()) {
            info.name = *value;
            break;
        }
    }
    if (info.name.empty()) {
        info.name = "Roku (" + host + ")";
    }

    info.model = xml_text(xml, "model-name").value_or("Roku");
    info.serial = xml_text(xml, "serial-number").value_or("");
    info.is_tv = lowercase(xml_text(xml, "is-tv").value_or("false")) == "true";
    return info;
}

std::optional<double> parse_milliseconds(const std::string& text) {
    static const std::regex number(R"((\d+))");
    std::smatch match;
    if (!std::regex_search(text, match, number)) {
        return std::nullopt;
    }
    try {
        return std::stod(match[1].str()) / 1000.0;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

core::StatusSnapshot parse_media_player(const std::string& xml) {
    core::StatusSnapshot snapshot;

    if (lowercase(xml_attribute(xml, "player", "error").value_or("false")) == "true") {
        snapshot.status = core::PlaybackStatus::Error;
        snapshot.error_message = "Roku player reported an error";
        return snapshot;
    }

    const auto state = lowercase(xml_attribute(xml, "player", "state").value_or(""));
    if (state == "play") {
        snapshot.status = core::PlaybackStatus::Playing;
    } else if (state == "pause") {
        snapshot.status = core::PlaybackStatus::Paused;
    } else if (state == "buffer" || state == "startup" || state == "open") {
        snapshot.status = core::PlaybackStatus::Loading;
    } else if (state == "stop" || state == "close") {
        snapshot.status = core::PlaybackStatus::Stopped;
    } else if (state == "none") {
        snapshot.status = core::PlaybackStatus::Idle;
    }

    if (auto position = xml_text(xml, "position")) {
        snapshot.position = parse_milliseconds(*position);
    }
    if (auto duration = xml_text(xml, "duration")) {
        auto seconds = parse_milliseconds(*duration);
        if (seconds && *seconds > 0) {
            snapshot.duration = seconds;
        }
    }

    return snapshot;
}

std::optional<std::string> parse_ssdp_location(const std::string& response) {
    std::istringstream stream(response);
    std::string line;
    std::optional<std::string> location;
    bool is_ecp = false;

    while (std::getline(stream, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        auto name = lowercase(trim(line.substr(0, colon)));
        auto value = trim(line.substr(colon + 1));

        if (name == "location") {
            location = value;
        } else if ((name == "st" || name == "nt") && lowercase(value) == kSearchTarget) {
            is_ecp = true;
        } else if (name == "server" && lowercase(value).find("roku") != std::string::npos) {
            is_ecp = true;
        }
    }

    if (!is_ecp || !location || location->empty()) {
        return std::nullopt;
    }
    return location;
}

std::string media_type_code(const std::string& content_type) {
    if (content_type.starts_with("audio/")) {
        return "a";
    }
    if (content_type.starts_with("image/")) {
        return "p";
    }
    return "v";
}

} // namespace castbridge::services::roku
