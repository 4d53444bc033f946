#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "castbridge/core/event_bus.hpp"
#include "castbridge/services/media/media_server.hpp"
#include "castbridge/utils/uuid.hpp"
#include "mocks/mock_session_controller.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <fstream>

using namespace castbridge;
using namespace castbridge::services;
using namespace castbridge::services::testing;
using ::testing::_;
using ::testing::Return;
using namespace std::chrono_literals;

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;
namespace fs = std::filesystem;

class MediaServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / ("castbridge-server-" + utils::Uuid::generate_v4().to_hex());
        fs::create_directories(root);

        content.resize(200003);
        for (std::size_t i = 0; i < content.size(); ++i) {
            content[i] = static_cast<char>((i * 31 + 7) % 251);
        }
        auto movie = root / "movie.mp4";
        {
            std::ofstream out(movie, std::ios::binary);
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
        }

        sessions = std::make_shared<::testing::NiceMock<MockSessionController>>();
        ON_CALL(*sessions, has_session()).WillByDefault(Return(false));

        library = std::make_shared<MediaLibrary>(root / "uploads");
        relay = std::make_shared<RelayBridge>(sessions, std::make_shared<core::EventBus>(), 60s);

        auto served = library->add_file(movie);
        ASSERT_TRUE(served);
        token = served->token;

        core::MediaServerConfig config;
        config.bind_address = "127.0.0.1";
        config.port = 0;
        config.advertised_host = "127.0.0.1";
        config.worker_threads = 2;
        config.max_upload_bytes = 1024 * 1024;

        server = std::make_unique<MediaServer>(config, library, relay, sessions);
        ASSERT_TRUE(server->start());
        ASSERT_NE(server->port(), 0);
    }

    void TearDown() override {
        server.reset();
        relay.reset();
        library.reset();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    tcp::socket connect(net::io_context& ioc) {
        tcp::socket socket(ioc);
        socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), server->port()));
        return socket;
    }

    http::response<http::string_body> exchange(http::request<http::string_body> request) {
        net::io_context ioc;
        auto socket = connect(ioc);

        request.set(http::field::host, "127.0.0.1");
        request.prepare_payload();
        http::write(socket, request);

        beast::flat_buffer buffer;
        http::response<http::string_body> response;
        http::read(socket, buffer, response);

        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    http::response<http::string_body> get(const std::string& target, const std::string& range = {}) {
        http::request<http::string_body> request{http::verb::get, target, 11};
        if (!range.empty()) {
            request.set(http::field::range, range);
        }
        return exchange(std::move(request));
    }

    http::response<http::string_body> post(const std::string& target, const std::string& body,
                                           const std::string& content_type) {
        http::request<http::string_body> request{http::verb::post, target, 11};
        request.set(http::field::content_type, content_type);
        request.body() = body;
        return exchange(std::move(request));
    }

    std::string media_target() const {
        return "/media/" + token;
    }

    static std::expected<void, core::Failure> ok() {
        return {};
    }

    fs::path root;
    std::string content;
    std::string token;
    std::shared_ptr<::testing::NiceMock<MockSessionController>> sessions;
    std::shared_ptr<MediaLibrary> library;
    std::shared_ptr<RelayBridge> relay;
    std::unique_ptr<MediaServer> server;
};

TEST_F(MediaServerTest, FullFileWithoutRange) {
    auto response = get(media_target());

    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(response[http::field::content_type], "video/mp4");
    EXPECT_EQ(response[http::field::accept_ranges], "bytes");
    EXPECT_EQ(response.body().size(), content.size());
    EXPECT_TRUE(response.body() == content);
}

TEST_F(MediaServerTest, RangeRequestsReassembleFile) {
    constexpr std::size_t chunk = 65536;
    std::string assembled;

    for (std::size_t start = 0; start < content.size(); start += chunk) {
        const auto end = std::min(start + chunk, content.size()) - 1;
        auto response = get(media_target(), "bytes=" + std::to_string(start) + "-" + std::to_string(end));

        ASSERT_EQ(response.result(), http::status::partial_content);
        EXPECT_EQ(response[http::field::content_range],
                  "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(content.size()));
        EXPECT_EQ(response.body().size(), end - start + 1);
        assembled += response.body();
    }

    EXPECT_TRUE(assembled == content);
}

TEST_F(MediaServerTest, SuffixAndOpenRanges) {
    auto tail = get(media_target(), "bytes=-100");
    ASSERT_EQ(tail.result(), http::status::partial_content);
    EXPECT_TRUE(tail.body() == content.substr(content.size() - 100));

    auto open = get(media_target(), "bytes=200000-");
    ASSERT_EQ(open.result(), http::status::partial_content);
    EXPECT_EQ(open.body().size(), 3u);
    EXPECT_EQ(open[http::field::content_range], "bytes 200000-200002/200003");
}

TEST_F(MediaServerTest, UnsatisfiableRangeIs416) {
    auto response = get(media_target(), "bytes=300000-400000");

    EXPECT_EQ(response.result(), http::status::range_not_satisfiable);
    EXPECT_EQ(response[http::field::content_range], "bytes */200003");
    EXPECT_TRUE(response.body().empty());

    auto reversed = get(media_target(), "bytes=300000-250000");
    EXPECT_EQ(reversed.result(), http::status::range_not_satisfiable);
    EXPECT_EQ(reversed[http::field::content_range], "bytes */200003");
    EXPECT_TRUE(reversed.body().empty());
}

TEST_F(MediaServerTest, UnknownTokenIs404) {
    auto response = get("/media/0123456789abcdef");
    EXPECT_EQ(response.result(), http::status::not_found);

    auto outside = get("/etc/passwd");
    EXPECT_EQ(outside.result(), http::status::not_found);
}

TEST_F(MediaServerTest, HeadSendsHeadersOnly) {
    net::io_context ioc;
    auto socket = connect(ioc);

    http::request<http::empty_body> request{http::verb::head, media_target(), 11};
    request.set(http::field::host, "127.0.0.1");
    http::write(socket, request);

    beast::flat_buffer buffer;
    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    http::read(socket, buffer, parser);

    EXPECT_EQ(parser.get().result(), http::status::ok);
    EXPECT_EQ(parser.get()[http::field::content_length], std::to_string(content.size()));
}

TEST_F(MediaServerTest, UploadWithoutSessionIs503) {
    net::io_context ioc;
    auto socket = connect(ioc);

    http::request<http::string_body> request{http::verb::post, "/remote/upload", 11};
    request.set(http::field::host, "127.0.0.1");
    request.set(http::field::content_type, "video/mp4");
    request.set(http::field::expect, "100-continue");
    request.set("X-Filename", "clip.mp4");
    request.body() = std::string(4096, 'x');
    request.prepare_payload();

    // Only the header goes out; the server must answer before any body arrives
    http::request_serializer<http::string_body> serializer{request};
    http::write_header(socket, serializer);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);

    EXPECT_EQ(response.result(), http::status::service_unavailable);
    EXPECT_EQ(relay->pending_tickets(), 0u);
    EXPECT_EQ(library->size(), 1u);
    EXPECT_TRUE(fs::is_empty(root / "uploads"));
}

TEST_F(MediaServerTest, UploadIsServedAndCast) {
    ON_CALL(*sessions, has_session()).WillByDefault(Return(true));
    EXPECT_CALL(*sessions, cast(_)).WillOnce(Return(ok()));

    const std::string upload(5000, 'u');
    http::request<http::string_body> request{http::verb::post, "/remote/upload?name=..%2F..%2Fholiday.mov", 11};
    request.set(http::field::content_type, "video/quicktime");
    request.body() = upload;
    auto response = exchange(std::move(request));

    ASSERT_EQ(response.result(), http::status::ok) << response.body();
    auto body = nlohmann::json::parse(response.body());
    EXPECT_EQ(body["title"], "holiday.mov");
    EXPECT_EQ(body["content_type"], "video/quicktime");

    const auto url = body["url"].get<std::string>();
    const auto base = server->base_url();
    ASSERT_EQ(url.rfind(base + "/media/", 0), 0u);
    EXPECT_EQ(relay->pending_tickets(), 0u);

    auto served = get(url.substr(base.size()));
    ASSERT_EQ(served.result(), http::status::ok);
    EXPECT_TRUE(served.body() == upload);
}

TEST_F(MediaServerTest, FormUploadKeepsOnlyTheFilePart) {
    ON_CALL(*sessions, has_session()).WillByDefault(Return(true));
    core::MediaRef cast_media;
    EXPECT_CALL(*sessions, cast(_)).WillOnce([&](const core::MediaRef& media) {
        cast_media = media;
        return ok();
    });

    const std::string boundary = "------------------------d74496d66958873e";
    const std::string clip(70000, 'c');
    std::string body;
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"note\"\r\n\r\nfrom the phone\r\n";
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"file\"; filename=\"clip.webm\"\r\n";
    body += "Content-Type: video/webm\r\n\r\n";
    body += clip + "\r\n";
    body += "--" + boundary + "--\r\n";

    auto response = post("/remote/upload", body, "multipart/form-data; boundary=" + boundary);

    ASSERT_EQ(response.result(), http::status::ok) << response.body();
    auto json = nlohmann::json::parse(response.body());
    EXPECT_EQ(json["title"], "clip.webm");
    EXPECT_EQ(json["content_type"], "video/webm");
    EXPECT_EQ(cast_media.content_type, "video/webm");

    const auto url = json["url"].get<std::string>();
    auto served = get(url.substr(server->base_url().size()));
    ASSERT_EQ(served.result(), http::status::ok);
    EXPECT_TRUE(served.body() == clip);
    EXPECT_EQ(std::distance(fs::directory_iterator(root / "uploads"), fs::directory_iterator{}), 1);
}

TEST_F(MediaServerTest, FormUploadWithoutFileFieldIs400) {
    ON_CALL(*sessions, has_session()).WillByDefault(Return(true));
    EXPECT_CALL(*sessions, cast(_)).Times(0);

    const std::string body = "--xyz\r\nContent-Disposition: form-data; name=\"note\"\r\n\r\nhello\r\n--xyz--\r\n";
    auto response = post("/remote/upload", body, "multipart/form-data; boundary=xyz");

    EXPECT_EQ(response.result(), http::status::bad_request);
    EXPECT_EQ(relay->pending_tickets(), 0u);
    EXPECT_TRUE(fs::is_empty(root / "uploads"));
}

TEST_F(MediaServerTest, FailedCastDiscardsUpload) {
    ON_CALL(*sessions, has_session()).WillByDefault(Return(true));
    EXPECT_CALL(*sessions, cast(_)).WillOnce(Return(std::expected<void, core::Failure>(
        core::make_failure(core::CastError::LoadError, "receiver refused"))));

    auto response = post("/remote/upload", std::string(100, 'v'), "video/mp4");

    EXPECT_EQ(response.result(), http::status::bad_gateway);
    EXPECT_EQ(library->size(), 1u);
    EXPECT_TRUE(fs::is_empty(root / "uploads"));
}

TEST_F(MediaServerTest, OversizedUploadIs413) {
    ON_CALL(*sessions, has_session()).WillByDefault(Return(true));
    EXPECT_CALL(*sessions, cast(_)).Times(0);

    net::io_context ioc;
    auto socket = connect(ioc);

    http::request<http::string_body> request{http::verb::post, "/remote/upload", 11};
    request.set(http::field::host, "127.0.0.1");
    request.set(http::field::expect, "100-continue");
    request.content_length(2 * 1024 * 1024);

    http::request_serializer<http::string_body> serializer{request};
    http::write_header(socket, serializer);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);
    EXPECT_EQ(response.result(), http::status::payload_too_large);
}

TEST_F(MediaServerTest, RemoteUrl) {
    auto unbound = post("/remote/url", R"({"url":"http://example.com/a.mp4"})", "application/json");
    EXPECT_EQ(unbound.result(), http::status::service_unavailable);

    ON_CALL(*sessions, has_session()).WillByDefault(Return(true));
    EXPECT_CALL(*sessions, cast(_)).WillOnce(Return(ok()));

    auto cast = post("/remote/url", R"({"url":"http://example.com/a.mp4","title":"Clip A"})", "application/json");
    ASSERT_EQ(cast.result(), http::status::ok) << cast.body();
    auto body = nlohmann::json::parse(cast.body());
    EXPECT_EQ(body["title"], "Clip A");
    EXPECT_EQ(body["url"], "http://example.com/a.mp4");

    auto invalid = post("/remote/url", "ftp://example.com/a.mp4", "text/plain");
    EXPECT_EQ(invalid.result(), http::status::bad_request);

    auto broken = post("/remote/url", "{not json", "application/json");
    EXPECT_EQ(broken.result(), http::status::bad_request);
}

TEST_F(MediaServerTest, ControlMapsErrorsToStatus) {
    EXPECT_CALL(*sessions, play_pause())
        .WillOnce(Return(std::expected<void, core::Failure>(
            core::make_failure(core::CastError::Busy, "another command is in progress"))))
        .WillOnce(Return(ok()));
    EXPECT_CALL(*sessions, seek(_))
        .WillOnce(Return(std::expected<void, core::Failure>(
            core::make_failure(core::CastError::UnsupportedOperation, "cannot seek"))));

    EXPECT_EQ(post("/remote/control", R"({"action":"play_pause"})", "application/json").result(),
              http::status::conflict);
    EXPECT_EQ(post("/remote/control", R"({"action":"play_pause"})", "application/json").result(),
              http::status::ok);
    EXPECT_EQ(post("/remote/control", R"({"action":"seek","delta":30})", "application/json").result(),
              http::status::not_implemented);
    EXPECT_EQ(post("/remote/control", R"({"action":"dance"})", "application/json").result(),
              http::status::bad_request);
}

TEST_F(MediaServerTest, RemotePageAndInfo) {
    auto page = get("/remote");
    EXPECT_EQ(page.result(), http::status::ok);
    EXPECT_NE(page[http::field::content_type].find("text/html"), beast::string_view::npos);
    EXPECT_FALSE(page.body().empty());

    auto info = get("/remote/info");
    ASSERT_EQ(info.result(), http::status::ok);
    auto body = nlohmann::json::parse(info.body());
    EXPECT_EQ(body["accepting"], false);
    EXPECT_EQ(body["phase"], "unbound");
    EXPECT_TRUE(body["device"].is_null());
}

TEST_F(MediaServerTest, StopReleasesPortAndMediaLinks) {
    const auto base = server->base_url();
    EXPECT_EQ(server->remote_url(), base + "/remote");

    server->stop();
    EXPECT_FALSE(server->is_running());
    EXPECT_EQ(server->port(), 0);

    ON_CALL(*sessions, has_session()).WillByDefault(Return(true));
    ServedFile file;
    file.token = "t";
    auto relayed = relay->relay_upload(file, "phone");
    ASSERT_FALSE(relayed);
    EXPECT_EQ(relayed.error().error, core::CastError::NotFound);
}
