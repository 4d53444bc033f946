#pragma once

#include "castbridge/core/models.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace castbridge::services {

// A file reachable at /media/{token}
struct ServedFile {
    std::string token;
    std::filesystem::path path;
    std::string display_name;
    std::string content_type;
    std::uint64_t size = 0;
    bool owned = false;      // uploaded copy, deleted when the entry goes away
    std::optional<std::chrono::steady_clock::time_point> expires_at;
};

// Maps opaque tokens to local files. Only registered files are served, so
// request paths never touch the filesystem directly.
class MediaLibrary {
public:
    explicit MediaLibrary(std::filesystem::path upload_dir);
    ~MediaLibrary();

    MediaLibrary(const MediaLibrary&) = delete;
    MediaLibrary& operator=(const MediaLibrary&) = delete;

    // Registers a local file. Adding the same path again returns the existing token.
    std::expected<ServedFile, core::Failure> add_file(const std::filesystem::path& path);

    // Takes ownership of a completed upload stored under upload_dir()
    std::expected<ServedFile, core::Failure> adopt_upload(const std::filesystem::path& stored_path,
                                                          std::string display_name,
                                                          std::string content_type,
                                                          std::chrono::seconds ttl);

    // NotFound for unknown or expired tokens, and when the file has vanished
    std::expected<ServedFile, core::Failure> resolve(const std::string& token) const;

    bool remove(const std::string& token);
    std::size_t purge_expired();
    std::size_t size() const;

    // Fresh path inside upload_dir() keeping the original extension when known
    std::filesystem::path reserve_upload_path(const std::string& original_name,
                                              const std::string& content_type) const;
    const std::filesystem::path& upload_dir() const { return m_upload_dir; }

private:
    std::filesystem::path m_upload_dir;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, ServedFile> m_files;

    static void discard(const ServedFile& file);
};

} // namespace castbridge::services
