#include "castbridge/services/media/media_library.hpp"
#include "castbridge/utils/logger.hpp"
#include "castbridge/utils/media_types.hpp"
#include "castbridge/utils/uuid.hpp"

namespace castbridge::services {

namespace fs = std::filesystem;

MediaLibrary::MediaLibrary(fs::path upload_dir)
    : m_upload_dir(std::move(upload_dir)) {
    std::error_code ec;
    fs::create_directories(m_upload_dir, ec);
    if (ec) {
        CASTBRIDGE_LOG_WARNING("MediaLibrary", "Cannot create upload directory " + m_upload_dir.string() +
                               ": " + ec.message());
    }
}

MediaLibrary::~MediaLibrary() {
    std::lock_guard lock(m_mutex);
    for (const auto& [token, file] : m_files) {
        discard(file);
    }
}

std::expected<ServedFile, core::Failure> MediaLibrary::add_file(const fs::path& path) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    if (ec || !fs::exists(canonical, ec)) {
        return core::make_failure(core::CastError::NotFound, "no such file: " + path.string());
    }
    if (!fs::is_regular_file(canonical, ec)) {
        return core::make_failure(core::CastError::InvalidInput, path.string() + " is not a regular file");
    }

    auto size = fs::file_size(canonical, ec);
    if (ec) {
        return core::make_failure(core::CastError::NotFound, "cannot stat " + path.string() + ": " + ec.message());
    }

    std::lock_guard lock(m_mutex);
    for (auto& [token, file] : m_files) {
        if (!file.owned && file.path == canonical) {
            file.size = size;
            return file;
        }
    }

    ServedFile file;
    file.token = utils::Uuid::generate_v4().to_hex();
    file.path = canonical;
    file.display_name = canonical.filename().string();
    file.content_type = utils::guess_content_type(canonical);
    file.size = size;

    CASTBRIDGE_LOG_DEBUG("MediaLibrary", "Serving " + file.display_name + " as " + file.token);
    m_files.emplace(file.token, file);
    return file;
}

std::expected<ServedFile, core::Failure> MediaLibrary::adopt_upload(const fs::path& stored_path,
                                                                    std::string display_name,
                                                                    std::string content_type,
                                                                    std::chrono::seconds ttl) {
    std::error_code ec;
    auto size = fs::file_size(stored_path, ec);
    if (ec) {
        return core::make_failure(core::CastError::NotFound, "upload is missing: " + ec.message());
    }

    ServedFile file;
    file.token = utils::Uuid::generate_v4().to_hex();
    file.path = stored_path;
    file.display_name = display_name.empty() ? stored_path.filename().string() : std::move(display_name);
    file.content_type = content_type.empty() || content_type == "application/octet-stream"
        ? utils::guess_content_type(file.display_name)
        : std::move(content_type);
    file.size = size;
    file.owned = true;
    file.expires_at = std::chrono::steady_clock::now() + ttl;

    CASTBRIDGE_LOG_INFO("MediaLibrary", "Stored upload " + file.display_name + " (" + std::to_string(size) + " bytes)");

    std::lock_guard lock(m_mutex);
    m_files.emplace(file.token, file);
    return file;
}

std::expected<ServedFile, core::Failure> MediaLibrary::resolve(const std::string& token) const {
    std::lock_guard lock(m_mutex);
    auto it = m_files.find(token);
    if (it == m_files.end()) {
        return core::make_failure(core::CastError::NotFound, "unknown media token");
    }

    const auto& file = it->second;
    if (file.expires_at && *file.expires_at <= std::chrono::steady_clock::now()) {
        return core::make_failure(core::CastError::NotFound, "media link expired");
    }

    std::error_code ec;
    if (!fs::is_regular_file(file.path, ec)) {
        return core::make_failure(core::CastError::NotFound, file.display_name + " is no longer available");
    }
    return file;
}

bool MediaLibrary::remove(const std::string& token) {
    std::lock_guard lock(m_mutex);
    auto it = m_files.find(token);
    if (it == m_files.end()) {
        return false;
    }
    discard(it->second);
    m_files.erase(it);
    return true;
}

std::size_t MediaLibrary::purge_expired() {
    const auto now = std::chrono::steady_clock::now();
    std::size_t removed = 0;

    std::lock_guard lock(m_mutex);
    for (auto it = m_files.begin(); it != m_files.end();) {
        if (it->second.expires_at && *it->second.expires_at <= now) {
            discard(it->second);
            it = m_files.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        CASTBRIDGE_LOG_DEBUG("MediaLibrary", "Purged " + std::to_string(removed) + " expired upload(s)");
    }
    return removed;
}

std::size_t MediaLibrary::size() const {
    std::lock_guard lock(m_mutex);
    return m_files.size();
}

fs::path MediaLibrary::reserve_upload_path(const std::string& original_name,
                                           const std::string& content_type) const {
    auto extension = utils::extension_of(fs::path(original_name).filename());
    if (extension.empty()) {
        extension = utils::extension_for_content_type(content_type);
    }
    return m_upload_dir / (utils::Uuid::generate_v4().to_hex() + extension);
}

void MediaLibrary::discard(const ServedFile& file) {
    if (!file.owned) {
        return;
    }
    std::error_code ec;
    fs::remove(file.path, ec);
    if (ec) {
        CASTBRIDGE_LOG_WARNING("MediaLibrary", "Failed to delete " + file.path.string() + ": " + ec.message());
    }
}

} // namespace castbridge::services
