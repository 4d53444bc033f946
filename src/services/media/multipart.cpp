#include "castbridge/services/media/multipart.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <vector>

namespace castbridge::services {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr std::size_t kMaxPartHeader = 16 * 1024;

struct PartHeaders {
    std::string name;
    std::string filename;
    std::string content_type;
};

std::string lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

std::string unquote(std::string_view value) {
    value = trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return std::string(value);
}

// Splits "type; key=value; key2=\"value\"" into its parameters
std::vector<std::pair<std::string, std::string>> header_parameters(std::string_view value) {
    std::vector<std::pair<std::string, std::string>> params;
    std::size_t pos = value.find(';');
    while (pos != std::string_view::npos) {
        auto next = value.find(';', pos + 1);
        auto item = value.substr(pos + 1, next == std::string_view::npos ? std::string_view::npos : next - pos - 1);
        auto eq = item.find('=');
        if (eq != std::string_view::npos) {
            params.emplace_back(lower(trim(item.substr(0, eq))), unquote(item.substr(eq + 1)));
        }
        pos = next;
    }
    return params;
}

PartHeaders parse_part_headers(std::string_view block) {
    PartHeaders headers;
    while (!block.empty()) {
        auto eol = block.find("\r\n");
        auto line = block.substr(0, eol);
        block = eol == std::string_view::npos ? std::string_view{} : block.substr(eol + 2);

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        auto key = lower(trim(line.substr(0, colon)));
        auto value = trim(line.substr(colon + 1));

        if (key == "content-disposition") {
            for (const auto& [param, param_value] : header_parameters(value)) {
                if (param == "name") {
                    headers.name = param_value;
                } else if (param == "filename") {
                    headers.filename = param_value;
                }
            }
        } else if (key == "content-type") {
            headers.content_type = std::string(trim(value.substr(0, value.find(';'))));
        }
    }
    return headers;
}

class SpoolReader {
public:
    explicit SpoolReader(const std::filesystem::path& path) : m_in(path, std::ios::binary) {}

    bool is_open() const { return m_in.is_open(); }

    // Appends the next chunk; false once the file is exhausted
    bool fill() {
        m_in.read(m_chunk.data(), static_cast<std::streamsize>(m_chunk.size()));
        auto count = m_in.gcount();
        if (count <= 0) {
            return false;
        }
        pending.append(m_chunk.data(), static_cast<std::size_t>(count));
        return true;
    }

    std::string pending;

private:
    std::ifstream m_in;
    std::array<char, kReadChunk> m_chunk{};
};

std::unexpected<core::Failure> malformed(const std::string& why) {
    return core::make_failure(core::CastError::InvalidInput, "multipart body " + why);
}

} // namespace

std::optional<std::string> multipart_boundary(std::string_view content_type) {
    auto type = lower(trim(content_type.substr(0, content_type.find(';'))));
    if (type != "multipart/form-data") {
        return std::nullopt;
    }
    for (const auto& [param, value] : header_parameters(content_type)) {
        if (param == "boundary" && !value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

std::expected<MultipartFile, core::Failure> extract_multipart_file(const std::filesystem::path& spool,
                                                                   const std::string& boundary,
                                                                   const std::string& field,
                                                                   const std::filesystem::path& destination) {
    SpoolReader reader(spool);
    if (!reader.is_open()) {
        return core::make_failure(core::CastError::NotFound, "cannot read " + spool.string());
    }
    auto& pending = reader.pending;

    const std::string opening = "--" + boundary;
    const std::string delimiter = "\r\n--" + boundary;

    // Preamble up to the first boundary is ignored
    std::size_t at = 0;
    while ((at = pending.find(opening)) == std::string::npos) {
        if (pending.size() > opening.size()) {
            pending.erase(0, pending.size() - opening.size());
        }
        if (!reader.fill()) {
            return malformed("has no boundary");
        }
    }
    pending.erase(0, at + opening.size());

    std::optional<MultipartFile> found;
    for (;;) {
        while (pending.size() < 2) {
            if (!reader.fill()) {
                return malformed("is truncated");
            }
        }
        if (pending.starts_with("--")) {
            break;
        }
        if (!pending.starts_with("\r\n")) {
            return malformed("has a malformed boundary line");
        }
        pending.erase(0, 2);

        std::size_t header_end = 0;
        while ((header_end = pending.find("\r\n\r\n")) == std::string::npos) {
            if (pending.size() > kMaxPartHeader) {
                return malformed("has an oversized part header");
            }
            if (!reader.fill()) {
                return malformed("is truncated");
            }
        }
        auto headers = parse_part_headers(std::string_view(pending).substr(0, header_end));
        pending.erase(0, header_end + 4);

        const bool wanted = !found && headers.name == field;
        std::ofstream out;
        if (wanted) {
            out.open(destination, std::ios::binary | std::ios::trunc);
            if (!out) {
                return core::make_failure(core::CastError::InvalidInput, "cannot write " + destination.string());
            }
        }

        std::uint64_t written = 0;
        auto emit = [&](std::size_t count) {
            if (wanted && count > 0) {
                out.write(pending.data(), static_cast<std::streamsize>(count));
                written += count;
            }
            pending.erase(0, count);
        };

        for (;;) {
            auto end = pending.find(delimiter);
            if (end != std::string::npos) {
                emit(end);
                pending.erase(0, delimiter.size());
                break;
            }
            // Keep a tail that could still be the start of the delimiter
            if (pending.size() > delimiter.size()) {
                emit(pending.size() - delimiter.size());
            }
            if (!reader.fill()) {
                return malformed("is truncated");
            }
        }

        if (wanted) {
            out.close();
            if (!out) {
                return core::make_failure(core::CastError::InvalidInput, "failed writing " + destination.string());
            }
            found = MultipartFile{headers.filename, headers.content_type, written};
        }
    }

    if (!found) {
        return malformed("has no \"" + field + "\" field");
    }
    return *found;
}

} // namespace castbridge::services
