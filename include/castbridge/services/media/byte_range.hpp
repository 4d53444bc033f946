#pragma once

#include "castbridge/core/models.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace castbridge::services {

// Inclusive byte span of a file
struct ByteRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    std::uint64_t length() const { return end - start + 1; }
};

enum class RangeError {
    Malformed,      // 400
    Unsatisfiable   // 416
};

/**
 * @brief Parse a single-range "Range" header against a file of @p file_size bytes
 *
 * Supports "bytes=S-E", "bytes=S-" and "bytes=-N". An end past the file is
 * clamped to the last byte. When several ranges are listed only the first is
 * honoured.
 */
std::expected<ByteRange, RangeError> parse_range_header(std::string_view header, std::uint64_t file_size);

// "bytes S-E/SIZE"
std::string content_range(const ByteRange& range, std::uint64_t file_size);
// "bytes */SIZE"
std::string unsatisfied_range(std::uint64_t file_size);

} // namespace castbridge::services
