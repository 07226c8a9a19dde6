#include "local_transport.h"
#include "logger.h"

LocalTransport::LocalTransport(ISessionCoordinator& coordinator)
    : m_coordinator(coordinator) {}

bool LocalTransport::connect(const std::string& peerId, std::string* error) {
    if (peerId.empty()) {
        if (error) *error = "peer id required";
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_peer_id = peerId;
    return true;
}

void LocalTransport::disconnect() {
    leave();
}

bool LocalTransport::currentRoom(std::string* roomId, std::string* peerId, bool* isHost, std::string* error) const {
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

bool LocalTransport::createRoom(std::string* roomId, std::string* error) {
    (void)error;
    *roomId = m_coordinator.createRoomId();
    return true;
}

bool LocalTransport::hostRoom(const std::string& roomId, std::string* error) {
    std::string peerId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        peerId = m_peer_id;
    }
    if (roomId.empty() || peerId.empty()) {
        if (error) *error = "room id and peer id required";
        return false;
    }
    m_coordinator.registerHost(roomId, peerId);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_room_id = roomId;
    m_is_host = true;
    return true;
}

bool LocalTransport::joinRoom(const std::string& roomId, JoinReply* reply, std::string* error) {
    std::string peerId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        peerId = m_peer_id;
    }
    JoinResult result = m_coordinator.joinClient(roomId, peerId);
    if (result.status != CoordinatorStatus::OK) {
        if (error) *error = "Room not found or host offline";
        return false;
    }
    if (reply) {
        reply->files = std::move(result.files);
        reply->files_version = result.files_version;
        reply->host_id = result.host_id;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_room_id = roomId;
    m_is_host = false;
    return true;
}

bool LocalTransport::updateFiles(const std::vector<FileDescriptor>& files, std::string* error) {
    std::string roomId, peerId;
    bool isHost = false;
    if (!currentRoom(&roomId, &peerId, &isHost, error)) return false;
    if (m_coordinator.setFiles(roomId, files) != CoordinatorStatus::OK) {
        if (error) *error = "Room not found";
        return false;
    }
    return true;
}

bool LocalTransport::sendSignal(const std::string& toId, SignalKind kind, const OpaquePayload& payload,
                                const std::string& fileId, std::string* error) {
    std::string roomId, peerId;
    bool isHost = false;
    if (!currentRoom(&roomId, &peerId, &isHost, error)) return false;

    Signal signal;
    signal.from_id = peerId;
    signal.to_id = toId;
    signal.kind = kind;
    signal.payload = payload;
    signal.file_id = fileId;
    RelayResult result = m_coordinator.relaySignal(roomId, std::move(signal));
    if (result.status != CoordinatorStatus::OK) {
        if (error) *error = "Room not found";
        return false;
    }
    return true;
}

bool LocalTransport::requestFile(const std::string& fileId, std::string* error) {
    std::string roomId, peerId;
    bool isHost = false;
    if (!currentRoom(&roomId, &peerId, &isHost, error)) return false;
    if (m_coordinator.requestFile(roomId, peerId, fileId).status != CoordinatorStatus::OK) {
        if (error) *error = "Room not found";
        return false;
    }
    return true;
}

bool LocalTransport::downloadComplete(const std::string& fileId, std::string* error) {
    std::string roomId, peerId;
    bool isHost = false;
    if (!currentRoom(&roomId, &peerId, &isHost, error)) return false;
    m_coordinator.recordDownloadComplete(roomId, fileId, peerId);
    return true;
}

bool LocalTransport::heartbeat(std::string* error) {
    std::string roomId, peerId;
    bool isHost = false;
    if (!currentRoom(&roomId, &peerId, &isHost, error)) return false;
    if (isHost) {
        m_coordinator.registerHost(roomId, peerId);
    }
    return true;
}

bool LocalTransport::poll(std::vector<TransportEvent>* events, std::string* error) {
    std::string roomId, peerId;
    bool isHost = false;
    if (!currentRoom(&roomId, &peerId, &isHost, error)) return false;

    if (isHost) {
        HostPollResult result = m_coordinator.hostPoll(roomId);
        if (result.status == CoordinatorStatus::ROOM_NOT_FOUND) {
            events->push_back(HostDisconnectedEvent{roomId, true});
            return true;
        }
        for (const Signal& signal : result.signals) {
            events->push_back(event_from_signal(signal));
        }
        events->push_back(PeerCountsEvent{result.peer_counts});
        events->push_back(ClientCountEvent{result.client_count});
        events->push_back(ClientListEvent{result.clients});
        return true;
    }

    ClientPollResult result = m_coordinator.clientPoll(roomId, peerId);
    if (result.status == CoordinatorStatus::ROOM_NOT_FOUND || !result.host_online) {
        events->push_back(HostDisconnectedEvent{roomId, result.status == CoordinatorStatus::ROOM_NOT_FOUND});
        return true;
    }
    for (const Signal& signal : result.signals) {
        events->push_back(event_from_signal(signal));
    }
    events->push_back(FilesUpdatedEvent{std::move(result.files), result.files_version, result.files_updated_at_ms});
    return true;
}

void LocalTransport::leave() {
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
    if (isHost) {
        m_coordinator.closeRoom(roomId);
    } else {
        m_coordinator.leaveClient(roomId, peerId);
    }
    LOG_DEBUG("AGENT: Local transport left room " + roomId);
}
