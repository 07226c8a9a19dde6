#include "http_poll_transport.h"
#include "logger.h"
#include "signal_codec.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kUserAgent = "droproom-peer";

std::string error_text(const nlohmann::json& body, const std::string& fallback) {
    const std::string text = signal_codec::string_field(body, "error");
    return text.empty() ? fallback : text;
}

void append_signals(const nlohmann::json& body, std::vector<TransportEvent>* events) {
    auto it = body.find("signals");
    if (it == body.end() || !it->is_array()) return;
    for (const auto& item : *it) {
        Signal signal;
        std::string parse_error;
        if (!signal_codec::signal_from_json(item, &signal, &parse_error)) {
            LOG_WARN("AGENT: Skipping malformed signal: " + parse_error);
            continue;
        }
        events->push_back(event_from_signal(signal));
    }
}

} // namespace

HttpPollTransport::HttpPollTransport(ServerEndpoint server, std::chrono::milliseconds request_timeout)
    : m_server(std::move(server)), m_timeout(request_timeout) {}

std::string HttpPollTransport::roomPath(const std::string& roomId) {
    return "/api/rooms/" + roomId;
}

bool HttpPollTransport::request(const std::string& method, const std::string& target, const json* body,
                                Reply* reply, std::string* error) const {
    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);

        beast::error_code ec;
        const auto results = resolver.resolve(m_server.host, m_server.port, ec);
        if (ec) {
            if (error) *error = "cannot resolve " + m_server.host + ": " + ec.message();
            return false;
        }

        http::request<http::string_body> req{http::string_to_verb(method), target, 11};
        req.set(http::field::host, m_server.host);
        req.set(http::field::user_agent, kUserAgent);
        if (body) {
            req.set(http::field::content_type, "application/json");
            req.body() = body->dump();
        }
        req.prepare_payload();

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        beast::error_code result;

        // Async chain so every step honours the stream timeout.
        stream.expires_after(m_timeout);
        stream.async_connect(results, [&](beast::error_code connect_ec, const tcp::endpoint&) {
            if (connect_ec) {
                result = connect_ec;
                return;
            }
            stream.expires_after(m_timeout);
            http::async_write(stream, req, [&](beast::error_code write_ec, std::size_t) {
                if (write_ec) {
                    result = write_ec;
                    return;
                }
                stream.expires_after(m_timeout);
                http::async_read(stream, buffer, res, [&](beast::error_code read_ec, std::size_t) {
                    result = read_ec;
                });
            });
        });
        ioc.run();

        if (result) {
            if (error) *error = method + " " + target + " failed: " + result.message();
            return false;
        }
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);

        reply->status = static_cast<int>(res.result_int());
        reply->body = json::parse(res.body(), nullptr, false);
        if (reply->body.is_discarded() || !reply->body.is_object()) {
            reply->body = json::object();
        }
        return true;
    } catch (const std::exception& e) {
        if (error) *error = method + " " + target + " failed: " + e.what();
        return false;
    }
}

bool HttpPollTransport::call(const std::string& method, const std::string& target, const json* body, Reply* reply,
                             std::string* error) const {
    if (!request(method, target, body, reply, error)) {
        return false;
    }
    if (reply->status < 200 || reply->status >= 300) {
        if (error) *error = error_text(reply->body, "HTTP " + std::to_string(reply->status));
        return false;
    }
    return true;
}

bool HttpPollTransport::currentRoom(std::string* roomId, std::string* peerId, bool* isHost,
                                    std::string* error) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_room_id.empty()) {
        if (error) *error = "not in a room";
        return false;
    }
    *roomId = m_room_id;
    *peerId = m_peer_id;
    *isHost = m_is_host;
    return true;
}

bool HttpPollTransport::connect(const std::string& peerId, std::string* error) {
    if (peerId.empty()) {
        if (error) *error = "peer id required";
        return false;
    }
    Reply reply;
    if (!call("GET", "/health", nullptr, &reply, error)) {
        LOG_WARN("AGENT: Coordinator at " + m_server.host + ":" + m_server.port + " unreachable");
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_peer_id = peerId;
    LOG_INFO("AGENT: Polling coordinator at " + m_server.host + ":" + m_server.port);
    return true;
}

void HttpPollTransport::disconnect() {
    leave();
}

bool HttpPollTransport::createRoom(std::string* roomId, std::string* error) {
    Reply reply;
    if (!call("POST", "/api/rooms", nullptr, &reply, error)) return false;
    *roomId = signal_codec::string_field(reply.body, "roomId");
    if (roomId->empty()) {
        if (error) *error = "coordinator returned no room id";
        return false;
    }
    return true;
}

bool HttpPollTransport::hostRoom(const std::string& roomId, std::string* error) {
    std::string peerId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        peerId = m_peer_id;
    }
    const json body{{"hostId", peerId}};
    Reply reply;
    if (!call("POST", roomPath(roomId) + "/host", &body, &reply, error)) return false;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_room_id = roomId;
    m_is_host = true;
    return true;
}

bool HttpPollTransport::joinRoom(const std::string& roomId, JoinReply* reply, std::string* error) {
    std::string peerId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        peerId = m_peer_id;
    }
    const json body{{"clientId", peerId}};
    Reply res;
    if (!call("POST", roomPath(roomId) + "/join", &body, &res, error)) return false;

    if (reply) {
        auto files = res.body.find("files");
        std::string parse_error;
        if (files != res.body.end() && !signal_codec::files_from_json(*files, &reply->files, &parse_error)) {
            LOG_WARN("AGENT: Ignoring malformed file list: " + parse_error);
            reply->files.clear();
        }
        auto version = res.body.find("filesVersion");
        reply->files_version = (version != res.body.end() && version->is_number_unsigned())
            ? version->get<uint64_t>() : 0;
        reply->host_id = signal_codec::string_field(res.body, "hostId");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_room_id = roomId;
    m_is_host = false;
    return true;
}

bool HttpPollTransport::updateFiles(const std::vector<FileDescriptor>& files, std::string* error) {
    std::string roomId, peerId;
    bool isHost = false;
    if (!currentRoom(&roomId, &peerId, &isHost, error)) return false;
    const json body{{"files", signal_codec::files_to_json(files)}};
    Reply reply;
    return call("POST", roomPath(roomId) + "/files", &body, &reply, error);
}

bool HttpPollTransport::sendSignal(const std::string& toId, SignalKind kind, const OpaquePayload& payload,
                                   const std::string& fileId, std::string* error) {
    std::string roomId, peerId;
    bool isHost = false;
    if (!currentRoom(&roomId, &peerId, &isHost, error)) return false;
    const json body{
        {"fromId", peerId},
        {"toId", toId},
        {"type", signal_codec::kind_to_string(kind)},
        {"data", signal_codec::payload_to_json(payload)},
        {"fileId", fileId}
    };
    Reply reply;
    return call("POST", roomPath(roomId) + "/signal", &body, &reply, error);
}

bool HttpPollTransport::requestFile(const std::string& fileId, std::string* error) {
    std::string roomId, peerId;
    bool isHost = false;
    if (!currentRoom(&roomId, &peerId, &isHost, error)) return false;
    const json body{{"clientId", peerId}, {"fileId", fileId}};
    Reply reply;
    return call("POST", roomPath(roomId) + "/request-file", &body, &reply, error);
}

bool HttpPollTransport::downloadComplete(const std::string& fileId, std::string* error) {
    std::string roomId, peerId;
    bool isHost = false;
    if (!currentRoom(&roomId, &peerId, &isHost, error)) return false;
    const json body{{"clientId", peerId}, {"fileId", fileId}};
    Reply reply;
    return call("POST", roomPath(roomId) + "/download-complete", &body, &reply, error);
}

bool HttpPollTransport::heartbeat(std::string* error) {
    std::string roomId, peerId;
    bool isHost = false;
    if (!currentRoom(&roomId, &peerId, &isHost, error)) return false;
    if (!isHost) {
        // A client's poll is its heartbeat.
        return true;
    }
    const json body{{"hostId", peerId}};
    Reply reply;
    return call("POST", roomPath(roomId) + "/host", &body, &reply, error);
}

bool HttpPollTransport::poll(std::vector<TransportEvent>* events, std::string* error) {
    std::string roomId, peerId;
    bool isHost = false;
    if (!currentRoom(&roomId, &peerId, &isHost, error)) return false;

    Reply reply;
    const std::string target = isHost ? roomPath(roomId) + "/host/poll"
                                      : roomPath(roomId) + "/client/" + peerId + "/poll";
    if (!request("GET", target, nullptr, &reply, error)) {
        return false;
    }

    if (reply.status == 404) {
        events->push_back(HostDisconnectedEvent{roomId, true});
        return true;
    }
    if (reply.status < 200 || reply.status >= 300) {
        if (error) *error = error_text(reply.body, "HTTP " + std::to_string(reply.status));
        return false;
    }

    const json& body = reply.body;
    if (isHost) {
        append_signals(body, events);
        auto counts = body.find("peerCounts");
        events->push_back(PeerCountsEvent{counts != body.end() ? signal_codec::counts_from_json(*counts)
                                                               : DownloadCounts()});
        auto count = body.find("clientCount");
        events->push_back(ClientCountEvent{(count != body.end() && count->is_number_unsigned())
                                               ? count->get<size_t>() : 0});
        ClientListEvent list;
        auto clients = body.find("clients");
        if (clients != body.end() && clients->is_array()) {
            for (const auto& c : *clients) {
                if (c.is_string()) list.clients.push_back(c.get<std::string>());
            }
        }
        events->push_back(std::move(list));
        return true;
    }

    auto online = body.find("hostOnline");
    if (online == body.end() || !online->is_boolean() || !online->get<bool>()) {
        events->push_back(HostDisconnectedEvent{roomId, false});
        return true;
    }
    append_signals(body, events);

    FilesUpdatedEvent files;
    auto list = body.find("files");
    std::string parse_error;
    if (list != body.end() && !signal_codec::files_from_json(*list, &files.files, &parse_error)) {
        LOG_WARN("AGENT: Ignoring malformed file list: " + parse_error);
        return true;
    }
    auto version = body.find("filesVersion");
    files.files_version = (version != body.end() && version->is_number_unsigned()) ? version->get<uint64_t>() : 0;
    auto stamp = body.find("filesUpdatedAt");
    files.files_updated_at_ms = (stamp != body.end() && stamp->is_number_integer()) ? stamp->get<int64_t>() : 0;
    events->push_back(std::move(files));
    return true;
}

void HttpPollTransport::leave() {
    std::string roomId, peerId;
    bool isHost = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        roomId.swap(m_room_id);
        peerId = m_peer_id;
        isHost = m_is_host;
        m_is_host = false;
    }
    if (roomId.empty()) return;

    Reply reply;
    std::string error;
    bool ok;
    if (isHost) {
        ok = call("POST", roomPath(roomId) + "/close", nullptr, &reply, &error);
    } else {
        const json body{{"clientId", peerId}};
        ok = call("POST", roomPath(roomId) + "/leave", &body, &reply, &error);
    }
    if (!ok) {
        // The coordinator evicts the peer on its own once liveness lapses.
        LOG_WARN("AGENT: Leaving room " + roomId + " failed: " + error);
    }
}
