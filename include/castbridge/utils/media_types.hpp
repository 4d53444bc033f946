#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace castbridge::utils {

enum class MediaCategory {
    Video,
    Audio,
    Image,
    Other
};

// Lowercased extension including the dot, or empty
std::string extension_of(const std::filesystem::path& path);

// True for the extensions receivers are known to play (.mp4, .mkv, .mp3, .flac, .jpg, ...)
bool is_supported_media(const std::filesystem::path& path);

// MIME type from the file extension; application/octet-stream when unknown
std::string guess_content_type(const std::filesystem::path& path);

// Extension for a MIME type, used when an upload arrives without a usable file name
std::string extension_for_content_type(std::string_view content_type);

MediaCategory category_of(std::string_view content_type);

} // namespace castbridge::utils
