#include "ws_push_transport.h"
#include "logger.h"
#include "signal_codec.h"

#include <boost/asio/post.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

const char* negotiation_event(SignalKind kind) {
    switch (kind) {
        case SignalKind::OFFER: return "webrtc-offer";
        case SignalKind::ANSWER: return "webrtc-answer";
        case SignalKind::ICE_CANDIDATE: return "webrtc-ice-candidate";
        case SignalKind::FILE_REQUEST: return "request-file";
    }
    return "webrtc-offer";
}

} // namespace

WsPushTransport::WsPushTransport(ServerEndpoint server, std::chrono::milliseconds request_timeout)
    : m_server(std::move(server)), m_timeout(request_timeout) {}

WsPushTransport::~WsPushTransport() {
    disconnect();
}

bool WsPushTransport::isConnected() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_connected;
}

bool WsPushTransport::connect(const std::string& peerId, std::string* error) {
    if (peerId.empty()) {
        if (error) *error = "peer id required";
        return false;
    }
    if (isConnected()) return true;
    if (m_thread.joinable()) {
        disconnect();
    }

    m_ioc.restart();
    m_write_queue.clear();
    m_read_buffer.clear();
    m_close_requested = false;
    m_closing = false;
    m_close_done.reset();

    beast::error_code ec;
    tcp::resolver resolver(m_ioc);
    const auto results = resolver.resolve(m_server.host, m_server.port, ec);
    if (ec) {
        if (error) *error = "cannot resolve " + m_server.host + ": " + ec.message();
        return false;
    }

    m_ws = std::make_unique<WebSocket>(m_ioc);
    beast::get_lowest_layer(*m_ws).connect(results, ec);
    if (ec) {
        if (error) *error = "cannot connect to " + m_server.host + ":" + m_server.port + ": " + ec.message();
        m_ws.reset();
        return false;
    }
    m_ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    m_ws->handshake(m_server.host + ":" + m_server.port, "/", ec);
    if (ec) {
        if (error) *error = "websocket handshake failed: " + ec.message();
        m_ws.reset();
        return false;
    }
    m_ws->text(true);

    const std::string hello = json{{"event", "hello"}, {"data", {{"peerId", peerId}}}}.dump();
    m_ws->write(net::buffer(hello), ec);
    if (ec) {
        if (error) *error = "hello failed: " + ec.message();
        m_ws.reset();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        m_connected = true;
        m_peer_id = peerId;
    }
    m_work = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(m_ioc));
    net::post(m_ioc, [this]() { doRead(); });
    m_thread = std::thread([this]() {
        try {
            m_ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("AGENT: Push io thread terminated: ") + e.what());
        }
    });
    LOG_INFO("AGENT: Connected to coordinator at ws://" + m_server.host + ":" + m_server.port);
    return true;
}

void WsPushTransport::disconnect() {
    leave();

    bool was_connected;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        was_connected = m_connected;
        m_connected = false;
    }
    m_reply_cv.notify_all();

    if (m_thread.joinable()) {
        if (was_connected && m_ws) {
            auto done = std::make_shared<std::promise<void>>();
            auto finished = done->get_future();
            net::post(m_ioc, [this, done]() {
                m_close_done = done;
                m_close_requested = true;
                if (m_write_queue.empty()) doWrite();
            });
            if (finished.wait_for(m_timeout) != std::future_status::ready) {
                LOG_WARN("AGENT: Push connection did not close in time");
            }
        }
        m_work.reset();
        m_ioc.stop();
        m_thread.join();
    }
    m_ws.reset();
}

// ============================================================================
// IO THREAD
// ============================================================================

void WsPushTransport::doRead() {
    m_ws->async_read(m_read_buffer, [this](beast::error_code ec, std::size_t) {
        if (ec) {
            onConnectionLost(ec.message());
            return;
        }
        const std::string text = beast::buffers_to_string(m_read_buffer.data());
        m_read_buffer.consume(m_read_buffer.size());
        onFrame(text);
        doRead();
    });
}

void WsPushTransport::doWrite() {
    if (m_write_queue.empty()) {
        if (m_close_requested && !m_closing) {
            m_closing = true;
            m_ws->async_close(websocket::close_code::normal, [this](beast::error_code) { finishClose(); });
        }
        return;
    }
    m_ws->async_write(net::buffer(m_write_queue.front()), [this](beast::error_code ec, std::size_t) {
        if (ec) {
            m_write_queue.clear();
            finishClose();
            onConnectionLost("write failed: " + ec.message());
            return;
        }
        m_write_queue.pop_front();
        doWrite();
    });
}

void WsPushTransport::finishClose() {
    if (m_close_done) {
        m_close_done->set_value();
        m_close_done.reset();
    }
}

void WsPushTransport::onConnectionLost(const std::string& reason) {
    std::string room;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (!m_connected) return;
        m_connected = false;
        room.swap(m_room_id);
    }
    m_reply_cv.notify_all();
    LOG_WARN("AGENT: Push connection lost: " + reason);
    if (!room.empty()) {
        emitEvent(HostDisconnectedEvent{room, false});
    }
}

void WsPushTransport::onFrame(const std::string& text) {
    json message = json::parse(text, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        LOG_WARN("AGENT: Malformed frame from coordinator");
        return;
    }
    const std::string event = signal_codec::string_field(message, "event");
    const json data = message.contains("data") && message["data"].is_object() ? message["data"] : json::object();

    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (!m_expected.empty() && (m_expected.count(event) > 0 || event == "room-error")) {
            m_reply_event = event;
            m_reply_data = data;
            m_has_reply = true;
            m_expected.clear();
            m_reply_cv.notify_all();
            return;
        }
    }

    if (event == "files-updated") {
        FilesUpdatedEvent files;
        std::string parse_error;
        auto list = data.find("files");
        if (list == data.end() || !signal_codec::files_from_json(*list, &files.files, &parse_error)) {
            LOG_WARN("AGENT: Ignoring malformed files-updated: " + parse_error);
            return;
        }
        auto version = data.find("filesVersion");
        files.files_version = (version != data.end() && version->is_number_unsigned()) ? version->get<uint64_t>() : 0;
        emitEvent(files);
    } else if (event == "file-requested") {
        emitEvent(FileRequestedEvent{signal_codec::string_field(data, "clientId"),
                                     signal_codec::string_field(data, "fileId")});
    } else if (event == "webrtc-offer" || event == "webrtc-answer" || event == "webrtc-ice-candidate") {
        NegotiationSignalEvent signal;
        signal.sender_id = signal_codec::string_field(data, "senderId");
        signal.kind = event == "webrtc-offer" ? SignalKind::OFFER
                    : event == "webrtc-answer" ? SignalKind::ANSWER
                    : SignalKind::ICE_CANDIDATE;
        auto payload = data.find("payload");
        if (payload != data.end()) signal.payload = signal_codec::payload_from_json(*payload);
        signal.file_id = signal_codec::string_field(data, "fileId");
        emitEvent(signal);
    } else if (event == "peer-counts-updated") {
        auto counts = data.find("counts");
        emitEvent(PeerCountsEvent{counts != data.end() ? signal_codec::counts_from_json(*counts) : DownloadCounts()});
    } else if (event == "client-count") {
        auto count = data.find("count");
        emitEvent(ClientCountEvent{(count != data.end() && count->is_number_unsigned()) ? count->get<size_t>() : 0});
    } else if (event == "client-left") {
        emitEvent(ClientLeftEvent{signal_codec::string_field(data, "clientId")});
    } else if (event == "host-disconnected") {
        std::string room;
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            room.swap(m_room_id);
            m_is_host = false;
        }
        const std::string named = signal_codec::string_field(data, "roomId");
        emitEvent(HostDisconnectedEvent{named.empty() ? room : named, false});
    } else if (event == "room-closed") {
        std::string room;
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            room.swap(m_room_id);
            m_is_host = false;
        }
        const std::string named = signal_codec::string_field(data, "roomId");
        emitEvent(HostDisconnectedEvent{named.empty() ? room : named, true});
    } else if (event == "room-error") {
        emitEvent(RoomErrorEvent{signal_codec::string_field(data, "message")});
    } else {
        LOG_DEBUG("AGENT: Ignoring unsolicited '" + event + "' frame");
    }
}

// ============================================================================
// CALLER THREADS
// ============================================================================

bool WsPushTransport::send(const std::string& event, const json& data, std::string* error) {
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (!m_connected) {
            if (error) *error = "not connected";
            return false;
        }
    }
    std::string frame = json{{"event", event}, {"data", data}}.dump();
    net::post(m_ioc, [this, frame = std::move(frame)]() mutable {
        if (m_close_requested) return;
        m_write_queue.push_back(std::move(frame));
        if (m_write_queue.size() == 1) doWrite();
    });
    return true;
}

bool WsPushTransport::awaitReply(const std::string& event, const json& data, const std::set<std::string>& expected,
                                 json* reply, std::string* error) {
    std::lock_guard<std::mutex> call(m_call_mutex);
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        m_expected = expected;
        m_has_reply = false;
        m_reply_event.clear();
        m_reply_data = json();
    }
    if (!send(event, data, error)) {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        m_expected.clear();
        return false;
    }

    std::unique_lock<std::mutex> lock(m_state_mutex);
    m_reply_cv.wait_for(lock, m_timeout, [this]() { return m_has_reply || !m_connected; });
    m_expected.clear();
    if (!m_has_reply) {
        if (error) *error = m_connected ? "timed out waiting for reply to " + event : "connection lost";
        return false;
    }
    if (m_reply_event == "room-error") {
        if (error) *error = signal_codec::string_field(m_reply_data, "message");
        return false;
    }
    if (reply) *reply = m_reply_data;
    return true;
}

bool WsPushTransport::createRoom(std::string* roomId, std::string* error) {
    json reply;
    if (!awaitReply("create-room", json::object(), {"room-created"}, &reply, error)) return false;
    *roomId = signal_codec::string_field(reply, "roomId");
    if (roomId->empty()) {
        if (error) *error = "coordinator returned no room id";
        return false;
    }
    // create-room also registers this connection as the host.
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_room_id = *roomId;
    m_is_host = true;
    return true;
}

bool WsPushTransport::hostRoom(const std::string& roomId, std::string* error) {
    json reply;
    if (!awaitReply("host-room", json{{"roomId", roomId}}, {"room-created"}, &reply, error)) return false;
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_room_id = roomId;
    m_is_host = true;
    return true;
}

bool WsPushTransport::joinRoom(const std::string& roomId, JoinReply* reply, std::string* error) {
    json data;
    if (!awaitReply("join-room", json{{"roomId", roomId}}, {"room-joined"}, &data, error)) return false;

    if (reply) {
        auto files = data.find("files");
        std::string parse_error;
        if (files != data.end() && !signal_codec::files_from_json(*files, &reply->files, &parse_error)) {
            LOG_WARN("AGENT: Ignoring malformed file list: " + parse_error);
            reply->files.clear();
        }
        auto version = data.find("filesVersion");
        reply->files_version = (version != data.end() && version->is_number_unsigned()) ? version->get<uint64_t>() : 0;
        reply->host_id = signal_codec::string_field(data, "hostId");
    }
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_room_id = roomId;
    m_is_host = false;
    return true;
}

bool WsPushTransport::updateFiles(const std::vector<FileDescriptor>& files, std::string* error) {
    return send("update-files", json{{"files", signal_codec::files_to_json(files)}}, error);
}

bool WsPushTransport::sendSignal(const std::string& toId, SignalKind kind, const OpaquePayload& payload,
                                 const std::string& fileId, std::string* error) {
    if (kind == SignalKind::FILE_REQUEST) {
        return requestFile(fileId, error);
    }
    json data;
    data["targetId"] = toId;
    data["payload"] = signal_codec::payload_to_json(payload);
    data["fileId"] = fileId;
    return send(negotiation_event(kind), data, error);
}

bool WsPushTransport::requestFile(const std::string& fileId, std::string* error) {
    return send("request-file", json{{"fileId", fileId}}, error);
}

bool WsPushTransport::downloadComplete(const std::string& fileId, std::string* error) {
    return send("download-complete", json{{"fileId", fileId}}, error);
}

bool WsPushTransport::heartbeat(std::string* error) {
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (m_room_id.empty()) {
            if (error) *error = "not in a room";
            return false;
        }
    }
    return send("heartbeat", json::object(), error);
}

bool WsPushTransport::poll(std::vector<TransportEvent>* events, std::string* error) {
    (void)events;
    (void)error;
    return true;
}

void WsPushTransport::leave() {
    bool isHost = false;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (m_room_id.empty() || !m_connected) {
            m_room_id.clear();
            return;
        }
        m_room_id.clear();
        isHost = m_is_host;
        m_is_host = false;
    }
    std::string error;
    if (!send(isHost ? "close-room" : "leave-room", json::object(), &error)) {
        LOG_WARN("AGENT: Leaving room failed: " + error);
    }
}
