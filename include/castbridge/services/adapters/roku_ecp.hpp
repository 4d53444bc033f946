#pragma once

#include "castbridge/core/models.hpp"
#include <cstdint>
#include <optional>
#include <string>

// Parsers for Roku External Control Protocol payloads. ECP answers are small
// flat XML documents, so tag extraction is done with regular expressions.
namespace castbridge::services::roku {

inline constexpr std::uint16_t kEcpPort = 8060;
inline constexpr const char* kSearchTarget = "roku:ecp";

struct DeviceInfo {
    std::string name;
    std::string model;
    std::string serial;
    bool is_tv = false;
};

// Text of the first <tag>...</tag>, entity-decoded and trimmed
std::optional<std::string> xml_text(const std::string& xml, const std::string& tag);

// Value of attribute on the first <tag ...> element
std::optional<std::string> xml_attribute(const std::string& xml, const std::string& tag,
                                         const std::string& attribute);

// Falls back to "Roku (host)" when the device reports no usable name
DeviceInfo parse_device_info(const std::string& xml, const std::string& host);

// /query/media-player document to a status report
core::StatusSnapshot parse_media_player(const std::string& xml);

// "12345 ms" to seconds
std::optional<double> parse_milliseconds(const std::string& text);

// LOCATION header of an SSDP response, when the response is for an ECP device
std::optional<std::string> parse_ssdp_location(const std::string& response);

// ECP input media type: "v" video, "a" audio, "p" photo
std::string media_type_code(const std::string& content_type);

} // namespace castbridge::services::roku
