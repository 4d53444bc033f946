#include "castbridge/services/adapters/cast_channel.hpp"
#include "castbridge/services/adapters/cast_framing.hpp"
#include "castbridge/utils/logger.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <array>
#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace castbridge::services {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace {
    constexpr std::chrono::seconds kHeartbeatInterval{5};
    constexpr std::chrono::seconds kCloseGrace{1};
}

class TlsCastChannel : public CastChannel {
public:
    TlsCastChannel()
        : m_ssl_ctx(ssl::context::tlsv12_client)
        , m_heartbeat(m_ioc)
        , m_close_deadline(m_ioc) {
        // Receivers present self-signed certificates
        m_ssl_ctx.set_verify_mode(ssl::verify_none);
    }

    ~TlsCastChannel() override {
        close();
    }

    std::expected<void, core::Failure> open(const std::string& host, std::uint16_t port,
                                            std::chrono::milliseconds timeout) override {
        close();

        CASTBRIDGE_LOG_DEBUG("CastChannel", "Connecting to " + host + ":" + std::to_string(port));

        m_ioc.restart();
        m_stream = std::make_unique<ssl::stream<tcp::socket>>(m_ioc, m_ssl_ctx);

        boost::system::error_code ec;
        tcp::resolver resolver(m_ioc);
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            m_stream.reset();
            return core::make_failure(core::CastError::ConnectionError,
                                      "cannot resolve " + host + ": " + ec.message());
        }

        bool done = false;
        boost::system::error_code result = net::error::timed_out;

        net::async_connect(m_stream->lowest_layer(), endpoints,
            [&](const boost::system::error_code& connect_ec, const tcp::endpoint&) {
                if (connect_ec) {
                    result = connect_ec;
                    done = true;
                    return;
                }
                m_stream->async_handshake(ssl::stream_base::client,
                    [&](const boost::system::error_code& handshake_ec) {
                        result = handshake_ec;
                        done = true;
                    });
            });

        m_ioc.run_for(timeout);

        if (!done) {
            // Drain the aborted handlers; they reference this frame
            m_stream->lowest_layer().close(ec);
            m_ioc.restart();
            m_ioc.run();
            m_stream.reset();
            return core::make_failure(core::CastError::ConnectionError,
                                      "timed out connecting to " + host + ":" + std::to_string(port));
        }

        if (result) {
            m_stream.reset();
            return core::make_failure(core::CastError::ConnectionError,
                                      "cannot connect to " + host + ":" + std::to_string(port) +
                                      ": " + result.message());
        }

        m_ioc.restart();
        m_closing = false;
        m_open = true;
        m_work.emplace(net::make_work_guard(m_ioc));

        net::post(m_ioc, [this] {
            do_read_header();
            schedule_heartbeat();
        });
        m_io_thread = std::thread([this] { m_ioc.run(); });

        CASTBRIDGE_LOG_INFO("CastChannel", "TLS channel open to " + host + ":" + std::to_string(port));
        return send(kCastReceiverId, cast_ns::kConnection, {{"type", "CONNECT"}});
    }

    std::expected<nlohmann::json, core::Failure> request(const std::string& destination,
                                                         const std::string& ns,
                                                         nlohmann::json payload,
                                                         std::chrono::milliseconds timeout) override {
        auto ticket = m_pending.open();
        payload["requestId"] = ticket.request_id;
        const std::string type = payload.value("type", "?");

        if (auto sent = send(destination, ns, payload); !sent) {
            m_pending.forget(ticket.request_id);
            return std::unexpected(sent.error());
        }

        return m_pending.wait(ticket, timeout, type);
    }

    std::expected<void, core::Failure> send(const std::string& destination,
                                            const std::string& ns,
                                            const nlohmann::json& payload) override {
        if (!m_open) {
            return core::make_failure(core::CastError::ConnectionError, "channel is not open");
        }

        auto frame = cast_frame::encode(kCastSenderId, destination, ns, payload);
        if (!frame) {
            return core::make_failure(core::CastError::CommandError, "failed to serialise message");
        }

        net::post(m_ioc, [this, data = std::move(*frame)]() mutable {
            enqueue(std::move(data));
        });
        return {};
    }

    void set_message_handler(MessageHandler handler) override {
        std::lock_guard lock(m_handler_mutex);
        m_handler = std::move(handler);
    }

    void cancel() override {
        m_pending.fail_all(core::CastError::CommandError, "request cancelled");
    }

    void close() override {
        if (!m_io_thread.joinable()) {
            m_open = false;
            return;
        }

        net::post(m_ioc, [this] {
            m_closing = true;
            m_heartbeat.cancel();
            if (m_open) {
                if (auto frame = cast_frame::encode(kCastSenderId, kCastReceiverId, cast_ns::kConnection,
                                                    {{"type", "CLOSE"}})) {
                    enqueue(std::move(*frame));
                }
            }
            if (m_write_queue.empty()) {
                shutdown_socket();
            } else {
                m_close_deadline.expires_after(kCloseGrace);
                m_close_deadline.async_wait([this](const boost::system::error_code& ec) {
                    if (!ec) {
                        shutdown_socket();
                    }
                });
            }
        });

        m_work.reset();
        m_io_thread.join();
        m_open = false;
        m_write_queue.clear();
        m_stream.reset();

        m_pending.fail_all(core::CastError::ConnectionError, "channel closed");
        CASTBRIDGE_LOG_DEBUG("CastChannel", "Channel closed");
    }

    bool is_open() const override {
        return m_open;
    }

private:
    net::io_context m_ioc;
    ssl::context m_ssl_ctx;
    std::unique_ptr<ssl::stream<tcp::socket>> m_stream;
    net::steady_timer m_heartbeat;
    net::steady_timer m_close_deadline;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> m_work;

    std::atomic<bool> m_open{false};

    // Touched on the io thread only
    bool m_closing = false;
    std::deque<std::string> m_write_queue;
    std::array<unsigned char, cast_frame::kHeaderSize> m_header{};
    std::string m_body;

    PendingRequests m_pending;

    std::mutex m_handler_mutex;
    MessageHandler m_handler;

    std::thread m_io_thread;

    void enqueue(std::string frame) {
        if (!m_stream || !m_open) {
            return;
        }
        bool idle = m_write_queue.empty();
        m_write_queue.push_back(std::move(frame));
        if (idle) {
            do_write();
        }
    }

    void do_write() {
        net::async_write(*m_stream, net::buffer(m_write_queue.front()),
            [this](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    on_error(ec);
                    return;
                }
                m_write_queue.pop_front();
                if (!m_write_queue.empty()) {
                    do_write();
                } else if (m_closing) {
                    m_close_deadline.cancel();
                    shutdown_socket();
                }
            });
    }

    void do_read_header() {
        net::async_read(*m_stream, net::buffer(m_header),
            [this](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    on_error(ec);
                    return;
                }

                const auto length = cast_frame::body_length(m_header);
                if (!cast_frame::acceptable_length(length)) {
                    CASTBRIDGE_LOG_WARNING("CastChannel", "Invalid frame length " + std::to_string(length));
                    on_error(net::error::message_size);
                    return;
                }

                m_body.resize(length);
                do_read_body();
            });
    }

    void do_read_body() {
        net::async_read(*m_stream, net::buffer(m_body),
            [this](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    on_error(ec);
                    return;
                }
                handle_frame(m_body);
                do_read_header();
            });
    }

    void handle_frame(const std::string& data) {
        auto decoded = cast_frame::decode(data);
        if (!decoded) {
            CASTBRIDGE_LOG_DEBUG("CastChannel", "Dropping frame: " + cast_frame::to_string(decoded.error()));
            return;
        }
        auto& message = *decoded;
        const std::string type = message.payload.value("type", "");

        if (message.ns == cast_ns::kHeartbeat) {
            if (type == "PING") {
                if (auto pong = cast_frame::encode(kCastSenderId, message.source_id, cast_ns::kHeartbeat,
                                                   {{"type", "PONG"}})) {
                    enqueue(std::move(*pong));
                }
            }
            return;
        }

        if (message.ns == cast_ns::kConnection && type == "CLOSE") {
            CASTBRIDGE_LOG_INFO("CastChannel", "Receiver closed virtual connection " + message.source_id);
        }

        auto request_id = message.payload.find("requestId");
        if (request_id != message.payload.end() && request_id->is_number_integer() &&
            m_pending.resolve(request_id->get<int>(), message.payload)) {
            return;
        }

        MessageHandler handler;
        {
            std::lock_guard lock(m_handler_mutex);
            handler = m_handler;
        }
        if (handler) {
            handler(message.ns, message.payload);
        }
    }

    void schedule_heartbeat() {
        m_heartbeat.expires_after(kHeartbeatInterval);
        m_heartbeat.async_wait([this](const boost::system::error_code& ec) {
            if (ec || m_closing) {
                return;
            }
            if (auto ping = cast_frame::encode(kCastSenderId, kCastReceiverId, cast_ns::kHeartbeat,
                                               {{"type", "PING"}})) {
                enqueue(std::move(*ping));
            }
            schedule_heartbeat();
        });
    }

    void on_error(const boost::system::error_code& ec) {
        if (m_closing) {
            return;
        }
        if (ec != net::error::operation_aborted) {
            CASTBRIDGE_LOG_WARNING("CastChannel", "Connection lost: " + ec.message());
        }
        m_open = false;
        m_heartbeat.cancel();
        shutdown_socket();
        m_pending.fail_all(core::CastError::ConnectionError, "connection lost: " + ec.message());
    }

    void shutdown_socket() {
        if (!m_stream) {
            return;
        }
        boost::system::error_code ec;
        m_stream->lowest_layer().shutdown(tcp::socket::shutdown_both, ec);
        m_stream->lowest_layer().close(ec);
    }
};

std::unique_ptr<CastChannel> create_tls_cast_channel() {
    return std::make_unique<TlsCastChannel>();
}

} // namespace castbridge::services
