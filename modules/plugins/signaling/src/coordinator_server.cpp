#include "coordinator_server.h"
#include "logger.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <deque>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr std::size_t kMaxRequestBody = 8 * 1024 * 1024;
constexpr auto kHttpTimeout = std::chrono::seconds(30);
constexpr const char* kServerName = "droproom-coordinator";

class WsSession : public PushSink, public std::enable_shared_from_this<WsSession> {
public:
    WsSession(tcp::socket&& socket, PushGateway& gateway)
        : m_ws(std::move(socket)), m_gateway(gateway) {}

    void run(http::request<http::string_body> req) {
        m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        m_ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, kServerName);
        }));
        m_ws.async_accept(req, beast::bind_front_handler(&WsSession::onAccept, shared_from_this()));
    }

    void send(const std::string& frame) override {
        net::post(m_ws.get_executor(), [self = shared_from_this(), frame]() {
            self->m_queue.push_back(frame);
            if (self->m_queue.size() == 1) {
                self->doWrite();
            }
        });
    }

private:
    void onAccept(beast::error_code ec) {
        if (ec) {
            LOG_WARN("WS: Handshake failed: " + ec.message());
            return;
        }
        m_id = m_gateway.attach(shared_from_this());
        m_attached = true;
        doRead();
    }

    void doRead() {
        m_ws.async_read(m_buffer, beast::bind_front_handler(&WsSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed) {
                LOG_DEBUG("WS: Connection " + std::to_string(m_id) + " read ended: " + ec.message());
            }
            if (m_attached) {
                m_attached = false;
                m_gateway.detach(m_id);
            }
            return;
        }
        const std::string frame = beast::buffers_to_string(m_buffer.data());
        m_buffer.consume(m_buffer.size());
        m_gateway.handleFrame(m_id, frame);
        doRead();
    }

    void doWrite() {
        m_ws.text(true);
        m_ws.async_write(net::buffer(m_queue.front()),
                         beast::bind_front_handler(&WsSession::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_DEBUG("WS: Write failed on connection " + std::to_string(m_id) + ": " + ec.message());
            m_queue.clear();
            return;
        }
        m_queue.pop_front();
        if (!m_queue.empty()) {
            doWrite();
        }
    }

    websocket::stream<beast::tcp_stream> m_ws;
    PushGateway& m_gateway;
    beast::flat_buffer m_buffer;
    std::deque<std::string> m_queue;
    PushGateway::ConnectionId m_id = 0;
    bool m_attached = false;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, PollGateway& poll, PushGateway& push)
        : m_stream(std::move(socket)), m_poll(poll), m_push(push) {}

    void run() {
        net::dispatch(m_stream.get_executor(),
                      beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
    }

private:
    void doRead() {
        m_parser.emplace();
        m_parser->body_limit(kMaxRequestBody);
        m_stream.expires_after(kHttpTimeout);
        http::async_read(m_stream, m_buffer, *m_parser,
                         beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            doClose();
            return;
        }
        if (ec) {
            LOG_DEBUG("HTTP: Read failed: " + ec.message());
            return;
        }

        if (websocket::is_upgrade(m_parser->get())) {
            m_stream.expires_never();
            std::make_shared<WsSession>(m_stream.release_socket(), m_push)->run(m_parser->release());
            return;
        }

        http::request<http::string_body> req = m_parser->release();
        m_response = std::make_shared<http::response<http::string_body>>(respond(req));
        http::async_write(m_stream, *m_response,
                          beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                                    m_response->keep_alive()));
    }

    http::response<http::string_body> respond(const http::request<http::string_body>& req) {
        http::response<http::string_body> res;
        res.version(req.version());
        res.keep_alive(req.keep_alive());
        res.set(http::field::server, kServerName);
        res.set(http::field::access_control_allow_origin, "*");

        if (req.method() == http::verb::options) {
            res.result(http::status::no_content);
            res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
            res.set(http::field::access_control_allow_headers, "Content-Type");
            res.prepare_payload();
            return res;
        }

        const std::string method(req.method_string());
        const std::string target(req.target());
        GatewayResponse out = m_poll.handle(method, target, req.body());
        res.result(static_cast<http::status>(out.status));
        res.set(http::field::content_type, "application/json");
        res.body() = out.body.dump();
        res.prepare_payload();
        LOG_DEBUG("HTTP: " + method + " " + target + " -> " + std::to_string(out.status));
        return res;
    }

    void onWrite(bool keep_alive, beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_DEBUG("HTTP: Write failed: " + ec.message());
            return;
        }
        m_response.reset();
        if (!keep_alive) {
            doClose();
            return;
        }
        doRead();
    }

    void doClose() {
        beast::error_code ec;
        m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    std::shared_ptr<http::response<http::string_body>> m_response;
    PollGateway& m_poll;
    PushGateway& m_push;
};

} // namespace

CoordinatorServer::CoordinatorServer(PollGateway& poll, PushGateway& push)
    : m_poll(poll), m_push(push) {}

CoordinatorServer::~CoordinatorServer() {
    stop();
}

bool CoordinatorServer::start(const std::string& address, uint16_t port, int io_threads, std::string* error) {
    if (m_running.load()) {
        if (error) *error = "server already running";
        return false;
    }

    beast::error_code ec;
    const net::ip::address bind_address = net::ip::make_address(address, ec);
    if (ec) {
        if (error) *error = "invalid listen address '" + address + "': " + ec.message();
        return false;
    }
    const tcp::endpoint endpoint{bind_address, port};

    m_acceptor = std::make_unique<tcp::acceptor>(net::make_strand(m_ioc));
    m_acceptor->open(endpoint.protocol(), ec);
    if (!ec) m_acceptor->set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) m_acceptor->bind(endpoint, ec);
    if (!ec) m_acceptor->listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        if (error) *error = "cannot listen on " + address + ":" + std::to_string(port) + ": " + ec.message();
        m_acceptor.reset();
        return false;
    }
    m_port = m_acceptor->local_endpoint().port();
    m_running = true;
    doAccept();

    const int threads = std::max(1, io_threads);
    for (int i = 0; i < threads; ++i) {
        m_threads.emplace_back([this]() {
            try {
                m_ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("HTTP: io thread terminated: ") + e.what());
            }
        });
    }
    LOG_INFO("HTTP: Coordinator listening on " + address + ":" + std::to_string(m_port) +
             " (" + std::to_string(threads) + " io threads)");
    return true;
}

void CoordinatorServer::doAccept() {
    m_acceptor->async_accept(net::make_strand(m_ioc), [this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (!m_running.load()) return;
            LOG_WARN("HTTP: Accept failed: " + ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), m_poll, m_push)->run();
        }
        if (m_running.load()) {
            doAccept();
        }
    });
}

void CoordinatorServer::stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    net::post(m_acceptor->get_executor(), [this]() {
        beast::error_code ec;
        m_acceptor->close(ec);
    });
    m_ioc.stop();
    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();
    m_push.detachAll();
    LOG_INFO("HTTP: Coordinator stopped");
}
