#include "castbridge/utils/media_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace castbridge::utils {

namespace {
    struct TypeEntry {
        std::string_view extension;
        std::string_view mime;
        bool supported;
    };

    constexpr std::array<TypeEntry, 24> kTypes{{
        {".mp4", "video/mp4", true},
        {".m4v", "video/x-m4v", true},
        {".webm", "video/webm", true},
        {".mkv", "video/x-matroska", true},
        {".avi", "video/x-msvideo", true},
        {".mov", "video/quicktime", true},
        {".mp3", "audio/mpeg", true},
        {".flac", "audio/flac", true},
        {".wav", "audio/wav", true},
        {".ogg", "audio/ogg", true},
        {".opus", "audio/opus", true},
        {".aac", "audio/aac", true},
        {".m4a", "audio/mp4", true},
        {".jpg", "image/jpeg", true},
        {".jpeg", "image/jpeg", true},
        {".png", "image/png", true},
        {".gif", "image/gif", true},
        {".webp", "image/webp", true},
        {".bmp", "image/bmp", true},
        {".ts", "video/mp2t", false},
        {".m3u8", "application/vnd.apple.mpegurl", false},
        {".mpd", "application/dash+xml", false},
        {".srt", "text/plain", false},
        {".vtt", "text/vtt", false},
    }};

    std::string lowercase(std::string_view in) {
        std::string out(in);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    const TypeEntry* find_by_extension(const std::string& ext) {
        auto it = std::find_if(kTypes.begin(), kTypes.end(),
                               [&](const TypeEntry& e) { return e.extension == ext; });
        return it == kTypes.end() ? nullptr : &*it;
    }
}

std::string extension_of(const std::filesystem::path& path) {
    return lowercase(path.extension().string());
}

bool is_supported_media(const std::filesystem::path& path) {
    const auto* entry = find_by_extension(extension_of(path));
    return entry != nullptr && entry->supported;
}

std::string guess_content_type(const std::filesystem::path& path) {
    const auto* entry = find_by_extension(extension_of(path));
    return entry ? std::string(entry->mime) : "application/octet-stream";
}

std::string extension_for_content_type(std::string_view content_type) {
    auto mime = lowercase(content_type.substr(0, content_type.find(';')));
    auto it = std::find_if(kTypes.begin(), kTypes.end(),
                           [&](const TypeEntry& e) { return e.mime == mime; });
    return it == kTypes.end() ? std::string() : std::string(it->extension);
}

MediaCategory category_of(std::string_view content_type) {
    auto mime = lowercase(content_type);
    if (mime.starts_with("video/")) return MediaCategory::Video;
    if (mime.starts_with("audio/")) return MediaCategory::Audio;
    if (mime.starts_with("image/")) return MediaCategory::Image;
    return MediaCategory::Other;
}

} // namespace castbridge::utils
