#include "push_gateway.h"
#include "constants.h"
#include "logger.h"
#include "signal_codec.h"

namespace {

const char* negotiation_event(SignalKind kind) {
    switch (kind) {
        case SignalKind::OFFER: return "webrtc-offer";
        case SignalKind::ANSWER: return "webrtc-answer";
        case SignalKind::ICE_CANDIDATE: return "webrtc-ice-candidate";
        case SignalKind::FILE_REQUEST: return "file-requested";
    }
    return "unknown";
}

} // namespace

PushGateway::PushGateway(ISessionCoordinator& coordinator)
    : m_coordinator(coordinator) {}

std::string PushGateway::makeFrame(const std::string& event, const nlohmann::json& data) {
    return json{{"event", event}, {"data", data}}.dump();
}

PushGateway::ConnectionId PushGateway::attach(std::shared_ptr<PushSink> sink) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const ConnectionId id = m_next_id++;
    Connection conn;
    conn.sink = std::move(sink);
    m_connections.emplace(id, std::move(conn));
    return id;
}

size_t PushGateway::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connections.size();
}

bool PushGateway::lookup(ConnectionId id, Connection* out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(id);
    if (it == m_connections.end()) return false;
    *out = it->second;
    return true;
}

void PushGateway::bindRoom(ConnectionId id, const std::string& roomId, bool isHost) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(id);
    if (it == m_connections.end()) return;
    it->second.room_id = roomId;
    it->second.is_host = isHost;
}

void PushGateway::unbindRoom(ConnectionId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(id);
    if (it == m_connections.end()) return;
    it->second.room_id.clear();
    it->second.is_host = false;
}

std::shared_ptr<PushSink> PushGateway::sinkFor(const std::string& peerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto peer = m_by_peer.find(peerId);
    if (peer == m_by_peer.end()) return nullptr;
    auto it = m_connections.find(peer->second);
    return it == m_connections.end() ? nullptr : it->second.sink;
}

void PushGateway::deliver(Outbox& outbox) {
    for (auto& item : outbox) {
        if (item.first) {
            item.first->send(item.second);
        }
    }
    outbox.clear();
}

void PushGateway::queueTo(Outbox& outbox, const std::string& peerId, const std::string& event,
                          const json& data) const {
    auto sink = sinkFor(peerId);
    if (sink) {
        outbox.emplace_back(std::move(sink), makeFrame(event, data));
    }
}

void PushGateway::drainTo(Outbox& outbox, const std::string& roomId, const std::string& identity) {
    auto sink = sinkFor(identity);
    // Peers without a push connection keep their mailbox for the poll path.
    if (!sink) return;

    for (const Signal& signal : m_coordinator.drainMailbox(roomId, identity)) {
        json data;
        if (signal.kind == SignalKind::FILE_REQUEST) {
            data = json{{"clientId", signal.from_id}, {"fileId", signal.file_id}};
        } else {
            data = json{
                {"senderId", signal.from_id},
                {"payload", signal_codec::payload_to_json(signal.payload)},
                {"fileId", signal.file_id}
            };
        }
        outbox.emplace_back(sink, makeFrame(negotiation_event(signal.kind), data));
    }
}

void PushGateway::notifyHostCounts(Outbox& outbox, const std::string& hostId,
                                   const DownloadCounts& counts) const {
    queueTo(outbox, hostId, "peer-counts-updated", json{{"counts", signal_codec::counts_to_json(counts)}});
}

void PushGateway::handleFrame(ConnectionId id, const std::string& frame) {
    Connection conn;
    if (!lookup(id, &conn)) {
        return;
    }
    Outbox outbox;
    auto reply_error = [&](const std::string& message) {
        outbox.emplace_back(conn.sink, makeFrame("room-error", json{{"message", message}}));
    };

    json message = json::parse(frame, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        LOG_WARN("WS: Malformed frame on connection " + std::to_string(id));
        reply_error("Malformed frame");
        deliver(outbox);
        return;
    }
    const std::string event = signal_codec::string_field(message, "event");
    const json data = message.contains("data") && message["data"].is_object() ? message["data"] : json::object();

    if (event == "hello") {
        onHello(id, data, outbox);
    } else if (conn.peer_id.empty()) {
        reply_error("hello required");
    } else if (event == "create-room") {
        onCreateRoom(id, conn, outbox);
    } else if (event == "host-room") {
        onHostRoom(id, conn, data, outbox);
    } else if (event == "join-room") {
        onJoinRoom(id, conn, data, outbox);
    } else if (conn.room_id.empty()) {
        reply_error("Not in a room");
    } else if (event == "update-files") {
        onUpdateFiles(conn, data, outbox);
    } else if (event == "request-file") {
        onRequestFile(conn, data, outbox);
    } else if (event == "webrtc-offer") {
        onNegotiation(conn, SignalKind::OFFER, data, outbox);
    } else if (event == "webrtc-answer") {
        onNegotiation(conn, SignalKind::ANSWER, data, outbox);
    } else if (event == "webrtc-ice-candidate") {
        onNegotiation(conn, SignalKind::ICE_CANDIDATE, data, outbox);
    } else if (event == "download-complete") {
        onDownloadComplete(conn, data, outbox);
    } else if (event == "leave-room") {
        onLeaveRoom(id, conn, outbox);
    } else if (event == "close-room") {
        onCloseRoom(id, conn, outbox);
    } else if (event == "heartbeat") {
        onHeartbeat(conn, outbox);
    } else {
        LOG_DEBUG("WS: Unknown event '" + event + "' from " + conn.peer_id);
        reply_error("Unknown event");
    }
    deliver(outbox);
}

void PushGateway::onHello(ConnectionId id, const json& data, Outbox& outbox) {
    const std::string peerId = signal_codec::string_field(data, "peerId");
    std::shared_ptr<PushSink> sink;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(id);
        if (it == m_connections.end()) return;
        sink = it->second.sink;
        if (!peerId.empty()) {
            it->second.peer_id = peerId;
            // A reconnect under the same identity takes over delivery.
            m_by_peer[peerId] = id;
        }
    }
    if (peerId.empty()) {
        outbox.emplace_back(sink, makeFrame("room-error", json{{"message", "peerId required"}}));
        return;
    }
    LOG_DEBUG("WS: Connection " + std::to_string(id) + " is peer " + peerId);
}

void PushGateway::onCreateRoom(ConnectionId id, const Connection& conn, Outbox& outbox) {
    const std::string roomId = m_coordinator.createRoomId();
    m_coordinator.registerHost(roomId, conn.peer_id);
    bindRoom(id, roomId, true);
    outbox.emplace_back(conn.sink, makeFrame("room-created", json{{"roomId", roomId}}));
}

void PushGateway::onHostRoom(ConnectionId id, const Connection& conn, const json& data, Outbox& outbox) {
    const std::string roomId = signal_codec::string_field(data, "roomId");
    if (roomId.empty()) {
        outbox.emplace_back(conn.sink, makeFrame("room-error", json{{"message", "roomId required"}}));
        return;
    }
    m_coordinator.registerHost(roomId, conn.peer_id);
    bindRoom(id, roomId, true);
    outbox.emplace_back(conn.sink, makeFrame("room-created", json{{"roomId", roomId}}));
    drainTo(outbox, roomId, conn.peer_id);
}

void PushGateway::onJoinRoom(ConnectionId id, const Connection& conn, const json& data, Outbox& outbox) {
    const std::string roomId = signal_codec::string_field(data, "roomId");
    JoinResult result = m_coordinator.joinClient(roomId, conn.peer_id);
    if (result.status != CoordinatorStatus::OK) {
        outbox.emplace_back(conn.sink, makeFrame("room-error", json{{"message", "Room not found or host offline"}}));
        return;
    }
    bindRoom(id, roomId, false);
    outbox.emplace_back(conn.sink, makeFrame("room-joined", json{
        {"roomId", roomId},
        {"files", signal_codec::files_to_json(result.files)},
        {"filesVersion", result.files_version},
        {"hostId", result.host_id}
    }));
    queueTo(outbox, result.host_id, "client-count", json{{"count", result.client_count}});
    drainTo(outbox, roomId, conn.peer_id);
}

void PushGateway::onUpdateFiles(const Connection& conn, const json& data, Outbox& outbox) {
    if (!conn.is_host) {
        outbox.emplace_back(conn.sink, makeFrame("room-error", json{{"message", "Only the host can update files"}}));
        return;
    }
    std::vector<FileDescriptor> files;
    std::string parse_error;
    auto it = data.find("files");
    if (it == data.end() || !signal_codec::files_from_json(*it, &files, &parse_error)) {
        outbox.emplace_back(conn.sink, makeFrame("room-error", json{{"message", parse_error.empty() ? "files required" : parse_error}}));
        return;
    }
    if (m_coordinator.setFiles(conn.room_id, files) != CoordinatorStatus::OK) {
        outbox.emplace_back(conn.sink, makeFrame("room-error", json{{"message", "Room not found"}}));
        return;
    }
    deliver(outbox);
    onFilesChanged(conn.room_id);
}

void PushGateway::onRequestFile(const Connection& conn, const json& data, Outbox& outbox) {
    const std::string fileId = signal_codec::string_field(data, "fileId");
    if (fileId.empty()) {
        outbox.emplace_back(conn.sink, makeFrame("room-error", json{{"message", "fileId required"}}));
        return;
    }
    DownloadUpdate update = m_coordinator.requestFile(conn.room_id, conn.peer_id, fileId);
    if (update.status != CoordinatorStatus::OK) {
        outbox.emplace_back(conn.sink, makeFrame("host-disconnected", json::object()));
        return;
    }
    drainTo(outbox, conn.room_id, update.host_id);
    notifyHostCounts(outbox, update.host_id, update.counts);
}

void PushGateway::onNegotiation(const Connection& conn, SignalKind kind, const json& data, Outbox& outbox) {
    Signal signal;
    signal.from_id = conn.peer_id;
    signal.to_id = signal_codec::string_field(data, "targetId");
    if (signal.to_id.empty()) {
        signal.to_id = HOST_TARGET;
    }
    signal.kind = kind;
    signal.file_id = signal_codec::string_field(data, "fileId");
    auto payload = data.find("payload");
    if (payload != data.end()) {
        signal.payload = signal_codec::payload_from_json(*payload);
    }

    RelayResult result = m_coordinator.relaySignal(conn.room_id, std::move(signal));
    if (result.status != CoordinatorStatus::OK) {
        outbox.emplace_back(conn.sink, makeFrame("room-error", json{{"message", "Room not found"}}));
        return;
    }
    if (result.queued) {
        drainTo(outbox, conn.room_id, result.target_id);
    }
}

void PushGateway::onDownloadComplete(const Connection& conn, const json& data, Outbox& outbox) {
    const std::string fileId = signal_codec::string_field(data, "fileId");
    DownloadUpdate update = m_coordinator.recordDownloadComplete(conn.room_id, fileId, conn.peer_id);
    if (update.status == CoordinatorStatus::OK) {
        notifyHostCounts(outbox, update.host_id, update.counts);
    }
}

void PushGateway::onLeaveRoom(ConnectionId id, const Connection& conn, Outbox& outbox) {
    if (conn.is_host) {
        closeAsHost(conn, outbox);
    } else {
        leaveAsClient(conn, outbox);
    }
    unbindRoom(id);
}

void PushGateway::onCloseRoom(ConnectionId id, const Connection& conn, Outbox& outbox) {
    if (!conn.is_host) {
        outbox.emplace_back(conn.sink, makeFrame("room-error", json{{"message", "Only the host can close the room"}}));
        return;
    }
    unbindRoom(id);
    closeAsHost(conn, outbox);
}

void PushGateway::onHeartbeat(const Connection& conn, Outbox& outbox) {
    if (conn.is_host) {
        m_coordinator.registerHost(conn.room_id, conn.peer_id);
        return;
    }
    JoinResult result = m_coordinator.joinClient(conn.room_id, conn.peer_id);
    if (result.status != CoordinatorStatus::OK) {
        outbox.emplace_back(conn.sink, makeFrame("host-disconnected", json::object()));
    }
}

void PushGateway::leaveAsClient(const Connection& conn, Outbox& outbox) {
    LeaveResult result = m_coordinator.leaveClient(conn.room_id, conn.peer_id);
    if (!result.removed) return;
    queueTo(outbox, result.host_id, "client-left", json{{"clientId", conn.peer_id}});
    queueTo(outbox, result.host_id, "client-count", json{{"count", result.client_count}});
    notifyHostCounts(outbox, result.host_id, result.counts);
}

void PushGateway::closeAsHost(const Connection& conn, Outbox& outbox) {
    CloseResult result = m_coordinator.closeRoom(conn.room_id);
    if (!result.existed) return;
    deliver(outbox);
    onRoomClosed(conn.room_id, result.host_id, result.clients);
}

void PushGateway::detach(ConnectionId id) {
    Connection conn;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(id);
        if (it == m_connections.end()) return;
        conn = it->second;
        m_connections.erase(it);
        auto peer = m_by_peer.find(conn.peer_id);
        if (peer != m_by_peer.end() && peer->second == id) {
            m_by_peer.erase(peer);
        }
    }
    if (conn.room_id.empty()) {
        return;
    }
    LOG_INFO("WS: Peer " + conn.peer_id + " disconnected from room " + conn.room_id);
    Outbox outbox;
    if (conn.is_host) {
        closeAsHost(conn, outbox);
    } else {
        leaveAsClient(conn, outbox);
    }
    deliver(outbox);
}

void PushGateway::detachAll() {
    std::map<ConnectionId, Connection> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        dropped.swap(m_connections);
        m_by_peer.clear();
    }
    if (!dropped.empty()) {
        LOG_INFO("WS: Dropped " + std::to_string(dropped.size()) + " connections");
    }
}

void PushGateway::onSweepReport(const SweepReport& report) {
    for (const auto& room : report.rooms) {
        onRoomClosed(room.room_id, room.host_id, room.clients);
    }
    Outbox outbox;
    for (const auto& client : report.clients) {
        queueTo(outbox, client.host_id, "client-left", json{{"clientId", client.client_id}});
        notifyHostCounts(outbox, client.host_id, client.counts);
    }
    deliver(outbox);
}

void PushGateway::onMailboxChanged(const std::string& roomId, const std::string& identity) {
    Outbox outbox;
    drainTo(outbox, roomId, identity);
    deliver(outbox);
}

void PushGateway::onFilesChanged(const std::string& roomId) {
    RoomSnapshot snapshot = m_coordinator.roomSnapshot(roomId);
    if (snapshot.status == CoordinatorStatus::ROOM_NOT_FOUND) return;

    const std::string frame = makeFrame("files-updated", json{
        {"files", signal_codec::files_to_json(snapshot.files)},
        {"filesVersion", snapshot.files_version}
    });
    Outbox outbox;
    for (const auto& clientId : snapshot.clients) {
        auto sink = sinkFor(clientId);
        if (sink) outbox.emplace_back(std::move(sink), frame);
    }
    deliver(outbox);
}

void PushGateway::onMembershipChanged(const std::string& roomId, const std::string& clientId, bool joined) {
    RoomSnapshot snapshot = m_coordinator.roomSnapshot(roomId);
    if (snapshot.status == CoordinatorStatus::ROOM_NOT_FOUND) return;
    Outbox outbox;
    if (!joined) {
        queueTo(outbox, snapshot.host_id, "client-left", json{{"clientId", clientId}});
    }
    queueTo(outbox, snapshot.host_id, "client-count", json{{"count", snapshot.clients.size()}});
    deliver(outbox);
}

void PushGateway::onDownloadsChanged(const std::string& roomId, const std::string& hostId,
                                     const DownloadCounts& counts) {
    Outbox outbox;
    notifyHostCounts(outbox, hostId, counts);
    deliver(outbox);
}

void PushGateway::onRoomClosed(const std::string& roomId, const std::string& hostId,
                               const std::vector<std::string>& clients) {
    Outbox outbox;
    const std::string frame = makeFrame("host-disconnected", json{{"roomId", roomId}});
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // A host still bound here did not close the room itself (stale sweep);
        // unbinding it stops its next heartbeat from re-creating the room.
        auto host = m_by_peer.find(hostId);
        if (host != m_by_peer.end()) {
            auto it = m_connections.find(host->second);
            if (it != m_connections.end() && it->second.is_host && it->second.room_id == roomId) {
                outbox.emplace_back(it->second.sink, makeFrame("room-closed", json{{"roomId", roomId}}));
                it->second.room_id.clear();
                it->second.is_host = false;
            }
        }
        for (const auto& clientId : clients) {
            auto peer = m_by_peer.find(clientId);
            if (peer == m_by_peer.end()) continue;
            auto it = m_connections.find(peer->second);
            if (it == m_connections.end() || it->second.room_id != roomId) continue;
            outbox.emplace_back(it->second.sink, frame);
            it->second.room_id.clear();
        }
    }
    const size_t notified = outbox.size();
    deliver(outbox);
    LOG_INFO("WS: Room " + roomId + " closed, notified " + std::to_string(notified) + " push peers");
}
