#include "castbridge/services/media/media_server.hpp"
#include "castbridge/services/media/byte_range.hpp"
#include "castbridge/services/media/multipart.hpp"
#include "castbridge/services/media/remote_page.hpp"
#include "castbridge/utils/logger.hpp"
#include "castbridge/utils/network_utils.hpp"
#include "castbridge/utils/url_utils.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace castbridge::services {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;
constexpr std::uint64_t kFormBodyLimit = 64 * 1024;
constexpr auto kIdleTimeout = std::chrono::seconds(30);
constexpr const char* kServerName = "castbridge/" CASTBRIDGE_VERSION_STRING;

using StringResponse = http::response<http::string_body>;

struct ServerContext {
    core::MediaServerConfig config;
    std::shared_ptr<MediaLibrary> library;
    std::shared_ptr<RelayBridge> relay;
    std::shared_ptr<SessionController> sessions;
};

std::string to_std(beast::string_view value) {
    return std::string(value.data(), value.size());
}

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool starts_with_icase(std::string_view value, std::string_view prefix) {
    if (value.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), value.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

http::status status_for(core::CastError error) {
    switch (error) {
        case core::CastError::NotFound: return http::status::not_found;
        case core::CastError::InvalidInput: return http::status::bad_request;
        case core::CastError::RangeError: return http::status::range_not_satisfiable;
        case core::CastError::NoActiveSession:
        case core::CastError::ServerNotRunning: return http::status::service_unavailable;
        case core::CastError::Busy: return http::status::conflict;
        case core::CastError::UnsupportedOperation: return http::status::not_implemented;
        case core::CastError::ConnectionError:
        case core::CastError::LoadError:
        case core::CastError::CommandError:
        case core::CastError::StatusError:
            return http::status::bad_gateway;
    }
    return http::status::internal_server_error;
}

template<typename Body>
void decorate(http::response<Body>& response) {
    response.set(http::field::server, kServerName);
    response.set(http::field::access_control_allow_origin, "*");
}

StringResponse json_response(http::status status, const json& body, unsigned version) {
    StringResponse response{status, version};
    decorate(response);
    response.set(http::field::content_type, "application/json");
    response.set(http::field::cache_control, "no-store");
    response.body() = body.dump();
    response.prepare_payload();
    return response;
}

StringResponse error_response(http::status status, const std::string& message, unsigned version) {
    return json_response(status, json{{"ok", false}, {"error", message}}, version);
}

StringResponse failure_response(const core::Failure& failure, unsigned version) {
    return error_response(status_for(failure.error), failure.message, version);
}

json media_json(const core::MediaRef& media) {
    return json{{"ok", true}, {"title", media.title}, {"url", media.url}, {"content_type", media.content_type}};
}

json device_json(const core::Device& device) {
    return json{
        {"id", device.id.get()},
        {"name", device.name},
        {"kind", core::to_string(device.kind)},
        {"model", device.model},
        {"address", device.address()},
        {"capabilities", {
            {"seek", device.capabilities.supports_seek},
            {"volume", device.capabilities.supports_volume},
            {"mute", device.capabilities.supports_mute}
        }}
    };
}

json status_json(const core::PlaybackState& state) {
    json body{
        {"ok", true},
        {"status", core::to_string(state.status)},
        {"position", state.position},
        {"duration", nullptr},
        {"volume", state.volume},
        {"muted", state.muted},
        {"title", nullptr},
        {"url", nullptr},
        {"error", nullptr}
    };
    if (state.duration) {
        body["duration"] = *state.duration;
    }
    if (state.media) {
        body["title"] = state.media->title;
        body["url"] = state.media->url;
    }
    if (state.last_error) {
        body["error"] = state.last_error->message;
    }
    return body;
}

std::string media_url_for(const std::string& base_url, const ServedFile& file) {
    return base_url + "/media/" + file.token + "/" + utils::UrlUtils::encode(file.display_name);
}

// One HTTP/1.1 connection. Reads the header first so that uploads can be
// refused before their body is transferred.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(tcp::socket socket, std::shared_ptr<const ServerContext> context)
        : m_stream(std::move(socket))
        , m_context(std::move(context)) {
        beast::error_code ec;
        auto endpoint = m_stream.socket().remote_endpoint(ec);
        if (!ec) {
            m_origin = endpoint.address().to_string();
        }
    }

    void start() {
        net::dispatch(m_stream.get_executor(),
                      beast::bind_front_handler(&Connection::read_header, shared_from_this()));
    }

private:
    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::shared_ptr<const ServerContext> m_context;
    std::string m_origin;
    bool m_keep_alive = false;

    std::optional<http::request_parser<http::empty_body>> m_header_parser;
    std::optional<http::request_parser<http::string_body>> m_form_parser;
    std::optional<http::request_parser<http::file_body>> m_upload_parser;
    std::filesystem::path m_upload_path;
    std::string m_upload_name;
    std::string m_upload_type;
    std::optional<std::string> m_upload_boundary;

    std::shared_ptr<void> m_response;

    beast::file m_file;
    std::uint64_t m_remaining = 0;
    std::vector<char> m_chunk;

    void read_header() {
        m_header_parser.emplace();
        m_form_parser.reset();
        m_upload_parser.reset();
        m_stream.expires_after(kIdleTimeout);
        http::async_read_header(m_stream, m_buffer, *m_header_parser,
                                beast::bind_front_handler(&Connection::on_header, shared_from_this()));
    }

    void on_header(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return close();
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
                CASTBRIDGE_LOG_DEBUG("MediaServer", "Read failed from " + m_origin + ": " + ec.message());
            }
            return;
        }

        const auto& request = m_header_parser->get();
        // A body nobody reads leaves the stream unusable for the next request
        m_keep_alive = request.keep_alive() && m_header_parser->is_done();

        auto [path, query] = utils::UrlUtils::split_target(to_std(request.target()));
        const auto method = request.method();
        const auto version = request.version();

        CASTBRIDGE_LOG_DEBUG("MediaServer", to_std(request.method_string()) + " " + path + " from " + m_origin);

        if (method == http::verb::options) {
            http::response<http::empty_body> response{http::status::no_content, version};
            decorate(response);
            response.set(http::field::access_control_allow_methods, "GET, HEAD, POST, OPTIONS");
            response.set(http::field::access_control_allow_headers, "Content-Type, Range, X-Filename");
            response.set(http::field::access_control_max_age, "600");
            return send(std::move(response));
        }

        if (path.starts_with("/media/")) {
            if (method != http::verb::get && method != http::verb::head) {
                return send(error_response(http::status::method_not_allowed, "use GET or HEAD", version));
            }
            auto rest = path.substr(7);
            auto token = rest.substr(0, rest.find('/'));
            return serve_media(token, method == http::verb::head);
        }

        if (path == "/remote/upload") {
            if (method != http::verb::post) {
                return send(error_response(http::status::method_not_allowed, "use POST", version));
            }
            return begin_upload(query);
        }

        if (path == "/remote/url" || path == "/remote/control") {
            if (method != http::verb::post) {
                return send(error_response(http::status::method_not_allowed, "use POST", version));
            }
            return read_form(path);
        }

        if (method != http::verb::get) {
            return send(error_response(http::status::not_found, "no such resource", version));
        }

        if (path == "/" || path == "/remote" || path == "/remote/") {
            StringResponse response{http::status::ok, version};
            decorate(response);
            response.set(http::field::content_type, "text/html; charset=utf-8");
            response.body() = remote_page_html();
            response.prepare_payload();
            return send(std::move(response));
        }
        if (path == "/remote/info") {
            return send(json_response(http::status::ok, info_json(), version));
        }
        if (path == "/remote/status") {
            return send(json_response(http::status::ok, status_json(m_context->sessions->playback_state()), version));
        }

        send(error_response(http::status::not_found, "no such resource", version));
    }

    json info_json() const {
        json body{
            {"ok", true},
            {"version", CASTBRIDGE_VERSION_STRING},
            {"accepting", m_context->relay->accepting()},
            {"phase", core::to_string(m_context->sessions->phase())},
            {"device", nullptr},
            {"max_upload_bytes", m_context->config.max_upload_bytes}
        };
        if (auto device = m_context->sessions->bound_device()) {
            body["device"] = device_json(*device);
        }
        return body;
    }

    // ---- /media/{token} ---------------------------------------------------

    void serve_media(const std::string& token, bool head_only) {
        const auto& request = m_header_parser->get();
        const auto version = request.version();

        auto served = m_context->library->resolve(token);
        if (!served) {
            return send(failure_response(served.error(), version));
        }

        beast::error_code ec;
        if (m_file.is_open()) {
            m_file.close(ec);
        }
        m_file.open(served->path.c_str(), beast::file_mode::scan, ec);
        if (ec) {
            CASTBRIDGE_LOG_WARNING("MediaServer", "Cannot open " + served->path.string() + ": " + ec.message());
            return send(error_response(http::status::not_found, served->display_name + " is no longer available", version));
        }
        const auto file_size = m_file.size(ec);
        if (ec) {
            return send(error_response(http::status::internal_server_error, ec.message(), version));
        }

        std::optional<ByteRange> range;
        auto range_header = request.find(http::field::range);
        if (range_header != request.end()) {
            auto parsed = parse_range_header(to_std(range_header->value()), file_size);
            if (!parsed) {
                m_file.close(ec);
                if (parsed.error() == RangeError::Malformed) {
                    return send(error_response(http::status::bad_request, "malformed Range header", version));
                }
                http::response<http::empty_body> response{http::status::range_not_satisfiable, version};
                decorate(response);
                response.set(http::field::content_range, unsatisfied_range(file_size));
                response.set(http::field::content_length, "0");
                return send(std::move(response));
            }
            range = *parsed;
        }

        const std::uint64_t start = range ? range->start : 0;
        const std::uint64_t length = range ? range->length() : file_size;

        auto response = std::make_shared<http::response<http::empty_body>>(
            range ? http::status::partial_content : http::status::ok, version);
        decorate(*response);
        response->set(http::field::content_type, served->content_type);
        response->set(http::field::accept_ranges, "bytes");
        if (range) {
            response->set(http::field::content_range, content_range(*range, file_size));
        }
        response->set(http::field::content_length, std::to_string(length));
        response->keep_alive(m_keep_alive);

        m_remaining = head_only ? 0 : length;
        if (m_remaining > 0) {
            m_file.seek(start, ec);
            if (ec) {
                m_file.close(ec);
                return send(error_response(http::status::internal_server_error, "seek failed", version));
            }
        }

        if (range) {
            CASTBRIDGE_LOG_DEBUG("MediaServer", "Serving " + served->display_name + " " +
                                 content_range(*range, file_size) + " to " + m_origin);
        } else {
            CASTBRIDGE_LOG_DEBUG("MediaServer", "Serving " + served->display_name + " to " + m_origin);
        }

        m_response = response;
        m_stream.expires_after(kIdleTimeout);
        http::async_write(m_stream, *response,
            [self = shared_from_this()](beast::error_code write_ec, std::size_t) {
                self->m_response.reset();
                if (write_ec) {
                    return self->abort_stream(write_ec);
                }
                self->write_next_chunk();
            });
    }

    void write_next_chunk() {
        if (m_remaining == 0) {
            beast::error_code ec;
            m_file.close(ec);
            return finish();
        }

        if (m_chunk.empty()) {
            m_chunk.resize(kChunkSize);
        }
        const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(m_remaining, m_chunk.size()));

        beast::error_code ec;
        const auto got = m_file.read(m_chunk.data(), wanted, ec);
        if (ec || got == 0) {
            CASTBRIDGE_LOG_WARNING("MediaServer", "Short read while streaming: " +
                                   (ec ? ec.message() : std::string("unexpected end of file")));
            return abort_stream(ec);
        }
        m_remaining -= got;

        m_stream.expires_after(kIdleTimeout);
        net::async_write(m_stream, net::buffer(m_chunk.data(), got),
            [self = shared_from_this()](beast::error_code write_ec, std::size_t) {
                if (write_ec) {
                    return self->abort_stream(write_ec);
                }
                self->write_next_chunk();
            });
    }

    void abort_stream(beast::error_code ec) {
        if (ec && ec != net::error::broken_pipe && ec != net::error::connection_reset) {
            CASTBRIDGE_LOG_DEBUG("MediaServer", "Stream to " + m_origin + " ended: " + ec.message());
        }
        beast::error_code ignored;
        m_file.close(ignored);
        m_stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    }

    // ---- /remote/upload -------------------------------------------------------

    void begin_upload(const std::string& query) {
        const auto& request = m_header_parser->get();
        const auto version = request.version();
        const auto& config = m_context->config;

        if (!m_context->relay->accepting()) {
            m_keep_alive = false;
            return send(error_response(http::status::service_unavailable, "no device is bound", version));
        }

        auto declared = m_header_parser->content_length();
        if (declared && *declared > config.max_upload_bytes) {
            m_keep_alive = false;
            return send(error_response(http::status::payload_too_large, "upload exceeds the size limit", version));
        }
        if (m_header_parser->is_done()) {
            return send(error_response(http::status::bad_request, "empty upload", version));
        }

        m_upload_name.clear();
        auto filename_header = request.find("X-Filename");
        if (filename_header != request.end()) {
            m_upload_name = utils::UrlUtils::decode(to_std(filename_header->value()));
        }
        if (m_upload_name.empty()) {
            auto params = utils::UrlUtils::parse_query_string(query);
            auto it = params.find("name");
            if (it != params.end()) {
                m_upload_name = it->second;
            }
        }
        // Path components from the client never reach the filesystem
        m_upload_name = std::filesystem::path(m_upload_name).filename().string();
        if (m_upload_name.empty()) {
            m_upload_name = "upload";
        }

        m_upload_type = to_std(request[http::field::content_type]);
        m_upload_boundary = multipart_boundary(m_upload_type);
        if (!m_upload_boundary && starts_with_icase(m_upload_type, "multipart/")) {
            m_keep_alive = false;
            return send(error_response(http::status::bad_request, "multipart upload without a boundary", version));
        }
        if (m_upload_boundary) {
            m_upload_type.clear();
        }
        auto separator = m_upload_type.find(';');
        if (separator != std::string::npos) {
            m_upload_type = trim(m_upload_type.substr(0, separator));
        }

        const bool expects_continue = starts_with_icase(to_std(request[http::field::expect]), "100-continue");

        m_upload_path = m_context->library->reserve_upload_path(m_upload_name, m_upload_type);
        m_upload_parser.emplace(std::move(*m_header_parser));
        m_upload_parser->body_limit(config.max_upload_bytes);

        beast::error_code ec;
        m_upload_parser->get().body().open(m_upload_path.c_str(), beast::file_mode::write, ec);
        if (ec) {
            CASTBRIDGE_LOG_ERROR("MediaServer", "Cannot create " + m_upload_path.string() + ": " + ec.message());
            m_keep_alive = false;
            return send(error_response(http::status::internal_server_error, "cannot store upload", version));
        }

        CASTBRIDGE_LOG_INFO("MediaServer", "Receiving " + m_upload_name + " from " + m_origin);

        if (expects_continue) {
            return send_continue(version, [this] { read_upload_body(); });
        }
        read_upload_body();
    }

    void read_upload_body() {
        // Large files over Wi-Fi take longer than any sensible idle timeout
        m_stream.expires_never();
        http::async_read(m_stream, m_buffer, *m_upload_parser,
                         beast::bind_front_handler(&Connection::on_upload, shared_from_this()));
    }

    void on_upload(beast::error_code ec, std::size_t bytes) {
        auto& parser = *m_upload_parser;
        const auto version = parser.get().version();
        std::error_code fs_ec;
        parser.get().body().close();

        if (ec) {
            std::filesystem::remove(m_upload_path, fs_ec);
            if (ec == http::error::body_limit) {
                m_keep_alive = false;
                return send(error_response(http::status::payload_too_large, "upload exceeds the size limit", version));
            }
            CASTBRIDGE_LOG_WARNING("MediaServer", "Upload from " + m_origin + " failed: " + ec.message());
            return;
        }
        m_keep_alive = parser.get().keep_alive();

        CASTBRIDGE_LOG_DEBUG("MediaServer", "Upload of " + std::to_string(bytes) + " bytes finished");

        if (m_upload_boundary) {
            if (auto unpacked = unpack_form_upload(); !unpacked) {
                return send(failure_response(unpacked.error(), version));
            }
        }

        auto stored = m_context->library->adopt_upload(m_upload_path, m_upload_name, m_upload_type,
                                                       m_context->config.upload_ttl);
        if (!stored) {
            std::filesystem::remove(m_upload_path, fs_ec);
            return send(failure_response(stored.error(), version));
        }

        auto media = m_context->relay->relay_upload(*stored, m_origin);
        if (!media) {
            m_context->library->remove(stored->token);
            CASTBRIDGE_LOG_WARNING("MediaServer", "Upload " + stored->display_name + " not cast: " + media.error().message);
            return send(failure_response(media.error(), version));
        }
        send(json_response(http::status::ok, media_json(*media), version));
    }

    // The spooled body is a form; keep only its "file" part
    std::expected<void, core::Failure> unpack_form_upload() {
        std::error_code fs_ec;
        const auto spool = m_upload_path;
        const auto destination = m_context->library->reserve_upload_path(m_upload_name, {});

        auto part = extract_multipart_file(spool, *m_upload_boundary, "file", destination);
        std::filesystem::remove(spool, fs_ec);
        if (!part) {
            std::filesystem::remove(destination, fs_ec);
            CASTBRIDGE_LOG_WARNING("MediaServer", "Form upload from " + m_origin + " rejected: " + part.error().message);
            return std::unexpected(part.error());
        }

        auto name = std::filesystem::path(part->filename).filename().string();
        if (!name.empty()) {
            m_upload_name = name;
        }
        m_upload_type = part->content_type;

        // The extension was picked before the part's own name was known
        m_upload_path = m_context->library->reserve_upload_path(m_upload_name, m_upload_type);
        std::filesystem::rename(destination, m_upload_path, fs_ec);
        if (fs_ec) {
            std::filesystem::remove(destination, fs_ec);
            return core::make_failure(core::CastError::InvalidInput, "cannot store form upload");
        }
        CASTBRIDGE_LOG_DEBUG("MediaServer", "Form upload part " + m_upload_name + " is " +
                             std::to_string(part->size) + " bytes");
        return {};
    }

    // ---- /remote/url and /remote/control -------------------------------------

    void read_form(const std::string& path) {
        m_form_parser.emplace(std::move(*m_header_parser));
        m_form_parser->body_limit(kFormBodyLimit);
        m_stream.expires_after(kIdleTimeout);
        http::async_read(m_stream, m_buffer, *m_form_parser,
            [self = shared_from_this(), path](beast::error_code ec, std::size_t) {
                self->on_form(ec, path);
            });
    }

    void on_form(beast::error_code ec, const std::string& path) {
        const auto& request = m_form_parser->get();
        const auto version = request.version();
        if (ec == http::error::body_limit) {
            m_keep_alive = false;
            return send(error_response(http::status::payload_too_large, "request body too large", version));
        }
        if (ec) {
            CASTBRIDGE_LOG_DEBUG("MediaServer", "Read failed from " + m_origin + ": " + ec.message());
            return;
        }
        m_keep_alive = request.keep_alive();

        if (path == "/remote/url") {
            return send(handle_url(request));
        }
        send(handle_control(request));
    }

    StringResponse handle_url(const http::request<http::string_body>& request) {
        const auto version = request.version();
        const auto& body = request.body();
        std::string url;
        std::string title;

        const auto content_type = to_std(request[http::field::content_type]);
        if (starts_with_icase(content_type, "application/json") || trim(body).starts_with("{")) {
            try {
                auto payload = json::parse(body);
                url = trim(payload.value("url", std::string()));
                title = trim(payload.value("title", std::string()));
            } catch (const json::exception& e) {
                return error_response(http::status::bad_request, std::string("invalid JSON: ") + e.what(), version);
            }
        } else {
            url = trim(body);
        }

        if (url.empty()) {
            return error_response(http::status::bad_request, "missing url", version);
        }

        auto media = m_context->relay->relay_url(url, title, m_origin);
        if (!media) {
            return failure_response(media.error(), version);
        }
        return json_response(http::status::ok, media_json(*media), version);
    }

    StringResponse handle_control(const http::request<http::string_body>& request) {
        const auto version = request.version();
        auto& sessions = *m_context->sessions;

        std::string action;
        std::expected<void, core::Failure> result;
        try {
            auto payload = json::parse(request.body());
            action = payload.value("action", std::string());

            if (action == "play_pause") {
                result = sessions.play_pause();
            } else if (action == "stop") {
                result = sessions.stop();
            } else if (action == "seek") {
                if (payload.contains("position")) {
                    result = sessions.seek_to(payload.at("position").get<double>());
                } else {
                    result = sessions.seek(payload.value("delta", 0.0));
                }
            } else if (action == "volume") {
                if (!payload.contains("level")) {
                    return error_response(http::status::bad_request, "volume needs a level", version);
                }
                result = sessions.set_volume(payload.at("level").get<int>());
            } else if (action == "mute") {
                result = sessions.toggle_mute();
            } else {
                return error_response(http::status::bad_request, "unknown action '" + action + "'", version);
            }
        } catch (const json::exception& e) {
            return error_response(http::status::bad_request, std::string("invalid JSON: ") + e.what(), version);
        }

        if (!result) {
            return failure_response(result.error(), version);
        }
        return json_response(http::status::ok, status_json(sessions.playback_state()), version);
    }

    // ---- writing ---------------------------------------------------------------

    template<typename Body>
    void send(http::response<Body>&& response) {
        response.keep_alive(m_keep_alive);
        auto message = std::make_shared<http::response<Body>>(std::move(response));
        m_response = message;
        m_stream.expires_after(kIdleTimeout);
        http::async_write(m_stream, *message,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->m_response.reset();
                if (ec) {
                    CASTBRIDGE_LOG_DEBUG("MediaServer", "Write to " + self->m_origin + " failed: " + ec.message());
                    return;
                }
                self->finish();
            });
    }

    template<typename Next>
    void send_continue(unsigned version, Next next) {
        auto message = std::make_shared<http::response<http::empty_body>>(http::status::continue_, version);
        m_response = message;
        m_stream.expires_after(kIdleTimeout);
        http::async_write(m_stream, *message,
            [self = shared_from_this(), next = std::move(next)](beast::error_code ec, std::size_t) {
                self->m_response.reset();
                if (ec) {
                    std::error_code ignored;
                    self->m_upload_parser->get().body().close();
                    std::filesystem::remove(self->m_upload_path, ignored);
                    return;
                }
                next();
            });
    }

    void finish() {
        if (!m_keep_alive) {
            return close();
        }
        read_header();
    }

    void close() {
        beast::error_code ec;
        m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

} // namespace

class MediaServer::Impl {
public:
    Impl(core::MediaServerConfig config,
         std::shared_ptr<MediaLibrary> library,
         std::shared_ptr<RelayBridge> relay,
         std::shared_ptr<SessionController> sessions)
        : m_context(std::make_shared<ServerContext>(ServerContext{
              std::move(config), std::move(library), std::move(relay), std::move(sessions)})) {}

    ~Impl() { stop(); }

    std::expected<void, core::Failure> start() {
        std::lock_guard lock(m_mutex);
        if (m_running) {
            return {};
        }

        const auto& config = m_context->config;
        beast::error_code ec;
        auto address = net::ip::make_address(config.bind_address, ec);
        if (ec) {
            return core::make_failure(core::CastError::InvalidInput,
                                      "invalid bind address '" + config.bind_address + "'");
        }

        const int threads = std::max(1, config.worker_threads);
        m_ioc = std::make_unique<net::io_context>(threads);
        m_acceptor = std::make_unique<tcp::acceptor>(net::make_strand(*m_ioc));

        tcp::endpoint endpoint{address, config.port};
        auto fail = [this, &endpoint](const std::string& what, const beast::error_code& error) {
            m_acceptor.reset();
            m_ioc.reset();
            auto message = what + " " + endpoint.address().to_string() + ":" +
                           std::to_string(endpoint.port()) + ": " + error.message();
            CASTBRIDGE_LOG_ERROR("MediaServer", message);
            return core::make_failure(core::CastError::ConnectionError, message);
        };

        m_acceptor->open(endpoint.protocol(), ec);
        if (ec) {
            return fail("Cannot open", ec);
        }
        m_acceptor->set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            return fail("Cannot configure", ec);
        }
        m_acceptor->bind(endpoint, ec);
        if (ec) {
            return fail("Cannot bind", ec);
        }
        m_acceptor->listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            return fail("Cannot listen on", ec);
        }

        m_port = m_acceptor->local_endpoint(ec).port();
        const auto host = config.advertised_host.empty() ? utils::detect_lan_address() : config.advertised_host;
        m_base_url = "http://" + host + ":" + std::to_string(m_port);

        m_context->relay->set_media_url_builder([base = m_base_url](const ServedFile& file) {
            return media_url_for(base, file);
        });

        do_accept();
        m_workers.reserve(static_cast<std::size_t>(threads));
        for (int i = 0; i < threads; ++i) {
            m_workers.emplace_back([ioc = m_ioc.get()] { run_worker(*ioc); });
        }

        m_running = true;
        CASTBRIDGE_LOG_INFO("MediaServer", "Listening on " + config.bind_address + ":" + std::to_string(m_port) +
                            ", reachable at " + m_base_url);
        return {};
    }

    void stop() {
        std::lock_guard lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;

        m_context->relay->set_media_url_builder({});
        m_ioc->stop();
        m_workers.clear();

        beast::error_code ec;
        m_acceptor->close(ec);
        m_acceptor.reset();
        // Destroys the pending handlers and with them every open connection
        m_ioc.reset();

        m_port = 0;
        CASTBRIDGE_LOG_INFO("MediaServer", "Stopped");
    }

    bool is_running() const {
        std::lock_guard lock(m_mutex);
        return m_running;
    }

    std::uint16_t port() const {
        std::lock_guard lock(m_mutex);
        return m_port;
    }

    std::string base_url() const {
        std::lock_guard lock(m_mutex);
        return m_base_url;
    }

private:
    std::shared_ptr<ServerContext> m_context;

    mutable std::mutex m_mutex;
    bool m_running = false;
    std::uint16_t m_port = 0;
    std::string m_base_url;

    std::unique_ptr<net::io_context> m_ioc;
    std::unique_ptr<tcp::acceptor> m_acceptor;
    std::vector<std::jthread> m_workers;

    void do_accept() {
        m_acceptor->async_accept(net::make_strand(*m_ioc),
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec == net::error::operation_aborted) {
                    return;
                }
                if (ec) {
                    CASTBRIDGE_LOG_WARNING("MediaServer", "Accept failed: " + ec.message());
                } else {
                    std::make_shared<Connection>(std::move(socket), m_context)->start();
                }
                do_accept();
            });
    }

    static void run_worker(net::io_context& ioc) {
        for (;;) {
            try {
                ioc.run();
                return;
            } catch (const std::exception& e) {
                CASTBRIDGE_LOG_ERROR("MediaServer", std::string("Handler failed: ") + e.what());
            }
        }
    }
};

MediaServer::MediaServer(core::MediaServerConfig config,
                         std::shared_ptr<MediaLibrary> library,
                         std::shared_ptr<RelayBridge> relay,
                         std::shared_ptr<SessionController> sessions)
    : m_impl(std::make_unique<Impl>(std::move(config), std::move(library), std::move(relay), std::move(sessions))) {}

MediaServer::~MediaServer() = default;

std::expected<void, core::Failure> MediaServer::start() {
    return m_impl->start();
}

void MediaServer::stop() {
    m_impl->stop();
}

bool MediaServer::is_running() const {
    return m_impl->is_running();
}

std::uint16_t MediaServer::port() const {
    return m_impl->port();
}

std::string MediaServer::base_url() const {
    return m_impl->base_url();
}

std::string MediaServer::media_url(const ServedFile& file) const {
    return media_url_for(base_url(), file);
}

std::string MediaServer::remote_url() const {
    return base_url() + "/remote";
}

} // namespace castbridge::services
