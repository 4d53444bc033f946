#include "castbridge/services/media/byte_range.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace castbridge::services {

namespace {
    std::string_view trim(std::string_view value) {
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
            value.remove_prefix(1);
        }
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
            value.remove_suffix(1);
        }
        return value;
    }

    bool parse_number(std::string_view text, std::uint64_t& out) {
        if (text.empty()) {
            return false;
        }
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        return ec == std::errc() && ptr == text.data() + text.size();
    }

    bool starts_with_bytes_unit(std::string_view header) {
        constexpr std::string_view unit = "bytes=";
        if (header.size() < unit.size()) {
            return false;
        }
        for (std::size_t i = 0; i < unit.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(header[i])) != unit[i]) {
                return false;
            }
        }
        return true;
    }
}

std::expected<ByteRange, RangeError> parse_range_header(std::string_view header, std::uint64_t file_size) {
    header = trim(header);
    if (!starts_with_bytes_unit(header)) {
        return std::unexpected(RangeError::Malformed);
    }

    auto range_set = header.substr(6);
    if (auto comma = range_set.find(','); comma != std::string_view::npos) {
        range_set = range_set.substr(0, comma);
    }
    range_set = trim(range_set);

    auto dash = range_set.find('-');
    if (dash == std::string_view::npos) {
        return std::unexpected(RangeError::Malformed);
    }

    auto first = trim(range_set.substr(0, dash));
    auto last = trim(range_set.substr(dash + 1));

    if (first.empty()) {
        // Suffix form: the final N bytes
        std::uint64_t suffix = 0;
        if (!parse_number(last, suffix)) {
            return std::unexpected(RangeError::Malformed);
        }
        if (suffix == 0 || file_size == 0) {
            return std::unexpected(RangeError::Unsatisfiable);
        }
        return ByteRange{file_size > suffix ? file_size - suffix : 0, file_size - 1};
    }

    std::uint64_t start = 0;
    if (!parse_number(first, start)) {
        return std::unexpected(RangeError::Malformed);
    }

    std::uint64_t end = 0;
    if (!last.empty() && !parse_number(last, end)) {
        return std::unexpected(RangeError::Malformed);
    }

    // Start past the file wins over a reversed end
    if (start >= file_size) {
        return std::unexpected(RangeError::Unsatisfiable);
    }

    if (last.empty()) {
        end = file_size - 1;
    } else if (end < start) {
        return std::unexpected(RangeError::Malformed);
    }

    return ByteRange{start, std::min(end, file_size - 1)};
}

std::string content_range(const ByteRange& range, std::uint64_t file_size) {
    return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) + "/" +
           std::to_string(file_size);
}

std::string unsatisfied_range(std::uint64_t file_size) {
    return "bytes */" + std::to_string(file_size);
}

} // namespace castbridge::services
