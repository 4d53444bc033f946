#pragma once

#include "castbridge/core/models.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace castbridge::services {

// File part lifted out of a multipart/form-data body
struct MultipartFile {
    std::string filename;
    std::string content_type;
    std::uint64_t size = 0;
};

// Boundary parameter of a "multipart/form-data" Content-Type, if it is one
std::optional<std::string> multipart_boundary(std::string_view content_type);

/**
 * @brief Copy the body of the form field @p field from a stored multipart body
 *
 * Reads @p spool in fixed-size chunks and writes only the part's bytes to
 * @p destination, so the whole upload is never held in memory. The first part
 * named @p field wins. Malformed or truncated bodies, and bodies without the
 * field, fail with InvalidInput; @p destination may then hold partial output
 * and is the caller's to delete.
 */
std::expected<MultipartFile, core::Failure> extract_multipart_file(const std::filesystem::path& spool,
                                                                   const std::string& boundary,
                                                                   const std::string& field,
                                                                   const std::filesystem::path& destination);

} // namespace castbridge::services
