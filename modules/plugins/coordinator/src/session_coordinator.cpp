#include "session_coordinator.h"
#include "config_manager.h"
#include "constants.h"
#include "id_utils.h"
#include "logger.h"
#include "telemetry.h"

#include <thread>

namespace {

int64_t wall_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::vector<Signal> take_all(std::deque<Signal>& mailbox) {
    std::vector<Signal> out(std::make_move_iterator(mailbox.begin()),
                            std::make_move_iterator(mailbox.end()));
    mailbox.clear();
    return out;
}

std::vector<std::string> client_ids(const Room& room) {
    std::vector<std::string> ids;
    ids.reserve(room.clients.size());
    for (const auto& kv : room.clients) {
        ids.push_back(kv.first);
    }
    return ids;
}

} // namespace

CoordinatorConfig CoordinatorConfig::fromConfigManager() {
    const ConfigManager& cm = ConfigManager::getInstance();
    CoordinatorConfig cfg;
    cfg.stale_timeout = std::chrono::milliseconds(cm.getStaleTimeoutMs());
    cfg.sweep_interval = std::chrono::milliseconds(cm.getSweepIntervalMs());
    cfg.room_id_length = static_cast<size_t>(cm.getRoomIdLength());
    return cfg;
}

SessionCoordinator::SessionCoordinator(CoordinatorConfig config, Clock clock)
    : m_config(config), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] { return std::chrono::steady_clock::now(); };
    }
    if (m_config.room_id_length == 0) {
        m_config.room_id_length = ROOM_ID_LENGTH;
    }
}

SessionCoordinator::~SessionCoordinator() {
    shutdown();
}

SessionCoordinator::SlotPtr SessionCoordinator::findSlot(const std::string& roomId) const {
    std::lock_guard<std::mutex> lock(m_index_mutex);
    auto it = m_rooms.find(roomId);
    return it == m_rooms.end() ? nullptr : it->second;
}

SessionCoordinator::SlotPtr SessionCoordinator::findOrCreateSlot(const std::string& roomId) {
    std::lock_guard<std::mutex> lock(m_index_mutex);
    auto& slot = m_rooms[roomId];
    if (!slot) {
        slot = std::make_shared<RoomSlot>();
        slot->room.room_id = roomId;
    }
    return slot;
}

void SessionCoordinator::eraseSlot(const std::string& roomId, const SlotPtr& expected) {
    std::lock_guard<std::mutex> lock(m_index_mutex);
    auto it = m_rooms.find(roomId);
    if (it != m_rooms.end() && it->second == expected) {
        m_rooms.erase(it);
    }
}

std::vector<std::pair<std::string, SessionCoordinator::SlotPtr>> SessionCoordinator::snapshotSlots() const {
    std::lock_guard<std::mutex> lock(m_index_mutex);
    return std::vector<std::pair<std::string, SlotPtr>>(m_rooms.begin(), m_rooms.end());
}

bool SessionCoordinator::hostAlive(const Room& room, std::chrono::steady_clock::time_point now) const {
    return !room.host_id.empty() && (now - room.last_seen_host) < m_config.stale_timeout;
}

DownloadCounts SessionCoordinator::countsOf(const Room& room) {
    DownloadCounts counts;
    for (const auto& kv : room.active_downloads) {
        counts[kv.first] = kv.second.size();
    }
    return counts;
}

void SessionCoordinator::dropClientDownloads(Room& room, const std::string& clientId) {
    for (auto it = room.active_downloads.begin(); it != room.active_downloads.end();) {
        it->second.erase(clientId);
        if (it->second.empty()) {
            it = room.active_downloads.erase(it);
        } else {
            ++it;
        }
    }
}

std::string SessionCoordinator::createRoomId() {
    for (;;) {
        std::string id = generate_room_id(m_config.room_id_length);
        if (!findSlot(id)) {
            return id;
        }
        LOG_DEBUG("COORD: Room code collision on " + id + ", drawing again");
    }
}

void SessionCoordinator::registerHost(const std::string& roomId, const std::string& hostId) {
    // A slot closed concurrently is about to leave the index; retry until a live one is found.
    for (;;) {
        SlotPtr slot = findOrCreateSlot(roomId);
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->closed) {
            std::this_thread::yield();
            continue;
        }
        Room& room = slot->room;
        const bool fresh = room.host_id.empty();
        // Signals queued for a previous host identity stay queued for whoever hosts now.
        room.host_id = hostId;
        room.last_seen_host = m_clock();
        if (fresh) {
            Telemetry::getInstance().inc_counter("rooms_total");
            LOG_INFO("COORD: Room " + roomId + " created by host " + hostId);
        }
        return;
    }
}

RoomStatus SessionCoordinator::roomStatus(const std::string& roomId) const {
    RoomStatus status;
    SlotPtr slot = findSlot(roomId);
    if (!slot) return status;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return status;
    status.exists = true;
    status.has_host = !slot->room.host_id.empty();
    status.file_count = slot->room.files.size();
    return status;
}

CoordinatorStatus SessionCoordinator::setFiles(const std::string& roomId, const std::vector<FileDescriptor>& files) {
    SlotPtr slot = findSlot(roomId);
    if (!slot) return CoordinatorStatus::ROOM_NOT_FOUND;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return CoordinatorStatus::ROOM_NOT_FOUND;
    Room& room = slot->room;
    room.files = files;
    room.files_version++;
    room.files_updated_at_ms = wall_clock_ms();
    LOG_INFO("COORD: Files updated in room " + roomId + ": " + std::to_string(files.size()) + " files");
    return CoordinatorStatus::OK;
}

JoinResult SessionCoordinator::joinClient(const std::string& roomId, const std::string& clientId) {
    JoinResult result;
    SlotPtr slot = findSlot(roomId);
    if (!slot) return result;

    std::lock_guard<std::mutex> lock(slot->mutex);
    Room& room = slot->room;
    if (slot->closed || room.host_id.empty()) return result;

    const auto now = m_clock();
    if (!hostAlive(room, now)) {
        result.status = CoordinatorStatus::HOST_OFFLINE;
        return result;
    }

    auto it = room.clients.find(clientId);
    if (it == room.clients.end()) {
        ClientSession session;
        session.client_id = clientId;
        session.last_seen = now;
        room.clients.emplace(clientId, std::move(session));
        Telemetry::getInstance().inc_counter("clients_total");
        LOG_INFO("COORD: Client " + clientId + " joined room " + roomId);
    } else {
        it->second.last_seen = now;
    }

    result.status = CoordinatorStatus::OK;
    result.files = room.files;
    result.files_version = room.files_version;
    result.host_id = room.host_id;
    result.client_count = room.clients.size();
    return result;
}

LeaveResult SessionCoordinator::leaveClient(const std::string& roomId, const std::string& clientId) {
    LeaveResult result;
    SlotPtr slot = findSlot(roomId);
    if (!slot) return result;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return result;
    Room& room = slot->room;
    result.status = CoordinatorStatus::OK;
    result.removed = room.clients.erase(clientId) > 0;
    dropClientDownloads(room, clientId);
    result.host_id = room.host_id;
    result.client_count = room.clients.size();
    result.counts = countsOf(room);
    if (result.removed) {
        LOG_INFO("COORD: Client " + clientId + " left room " + roomId);
    }
    return result;
}

CloseResult SessionCoordinator::closeRoom(const std::string& roomId) {
    CloseResult result;
    SlotPtr slot;
    {
        std::lock_guard<std::mutex> lock(m_index_mutex);
        auto it = m_rooms.find(roomId);
        if (it == m_rooms.end()) return result;
        slot = it->second;
        m_rooms.erase(it);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return result;
    slot->closed = true;
    result.existed = true;
    result.host_id = slot->room.host_id;
    result.clients = client_ids(slot->room);
    slot->room = Room();
    LOG_INFO("COORD: Room " + roomId + " closed");
    return result;
}

RelayResult SessionCoordinator::relaySignal(const std::string& roomId, Signal signal) {
    RelayResult result;
    SlotPtr slot = findSlot(roomId);
    if (!slot) return result;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return result;
    Room& room = slot->room;
    result.status = CoordinatorStatus::OK;
    signal.timestamp_ms = wall_clock_ms();

    if (signal.to_id == HOST_TARGET || signal.to_id == room.host_id) {
        result.target_id = room.host_id;
        signal.to_id = room.host_id;
        room.host_mailbox.push_back(std::move(signal));
        result.queued = true;
    } else {
        auto it = room.clients.find(signal.to_id);
        if (it != room.clients.end()) {
            result.target_id = it->first;
            it->second.mailbox.push_back(std::move(signal));
            result.queued = true;
        } else {
            LOG_DEBUG("COORD: Dropping signal for unknown peer " + signal.to_id + " in room " + roomId);
        }
    }
    if (result.queued) {
        Telemetry::getInstance().inc_counter("signals_relayed");
    }
    return result;
}

DownloadUpdate SessionCoordinator::recordDownloadStart(const std::string& roomId, const std::string& fileId,
                                                       const std::string& clientId) {
    DownloadUpdate update;
    SlotPtr slot = findSlot(roomId);
    if (!slot) return update;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return update;
    Room& room = slot->room;
    room.active_downloads[fileId].insert(clientId);
    update.status = CoordinatorStatus::OK;
    update.host_id = room.host_id;
    update.counts = countsOf(room);
    return update;
}

DownloadUpdate SessionCoordinator::recordDownloadComplete(const std::string& roomId, const std::string& fileId,
                                                          const std::string& clientId) {
    DownloadUpdate update;
    SlotPtr slot = findSlot(roomId);
    if (!slot) return update;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return update;
    Room& room = slot->room;
    auto it = room.active_downloads.find(fileId);
    if (it != room.active_downloads.end()) {
        it->second.erase(clientId);
        if (it->second.empty()) {
            room.active_downloads.erase(it);
        }
    }
    LOG_INFO("COORD: Download complete: " + clientId + " finished " + fileId);
    update.status = CoordinatorStatus::OK;
    update.host_id = room.host_id;
    update.counts = countsOf(room);
    return update;
}

DownloadUpdate SessionCoordinator::requestFile(const std::string& roomId, const std::string& clientId,
                                               const std::string& fileId) {
    DownloadUpdate update;
    SlotPtr slot = findSlot(roomId);
    if (!slot) return update;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return update;
    Room& room = slot->room;
    room.active_downloads[fileId].insert(clientId);

    Signal request;
    request.from_id = clientId;
    request.to_id = room.host_id;
    request.kind = SignalKind::FILE_REQUEST;
    request.file_id = fileId;
    request.timestamp_ms = wall_clock_ms();
    room.host_mailbox.push_back(std::move(request));
    Telemetry::getInstance().inc_counter("signals_relayed");

    LOG_INFO("COORD: File request from " + clientId + " for file " + fileId);
    update.status = CoordinatorStatus::OK;
    update.host_id = room.host_id;
    update.counts = countsOf(room);
    return update;
}

std::vector<Signal> SessionCoordinator::drainMailbox(const std::string& roomId, const std::string& identity) {
    SlotPtr slot = findSlot(roomId);
    if (!slot) return {};

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return {};
    Room& room = slot->room;
    if (identity == HOST_TARGET || identity == room.host_id) {
        return take_all(room.host_mailbox);
    }
    auto it = room.clients.find(identity);
    if (it == room.clients.end()) return {};
    return take_all(it->second.mailbox);
}

HostPollResult SessionCoordinator::hostPoll(const std::string& roomId) {
    HostPollResult result;
    SlotPtr slot = findSlot(roomId);
    if (!slot) return result;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return result;
    Room& room = slot->room;
    room.last_seen_host = m_clock();

    result.status = CoordinatorStatus::OK;
    result.signals = take_all(room.host_mailbox);
    result.client_count = room.clients.size();
    result.peer_counts = countsOf(room);
    result.clients = client_ids(room);
    return result;
}

ClientPollResult SessionCoordinator::clientPoll(const std::string& roomId, const std::string& clientId) {
    ClientPollResult result;
    SlotPtr slot = findSlot(roomId);
    if (!slot) return result;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return result;
    Room& room = slot->room;
    const auto now = m_clock();

    auto it = room.clients.find(clientId);
    if (it == room.clients.end()) {
        ClientSession session;
        session.client_id = clientId;
        session.last_seen = now;
        it = room.clients.emplace(clientId, std::move(session)).first;
        LOG_INFO("COORD: Client " + clientId + " re-registered in room " + roomId);
    } else {
        it->second.last_seen = now;
    }

    result.host_online = hostAlive(room, now);
    result.status = result.host_online ? CoordinatorStatus::OK : CoordinatorStatus::HOST_OFFLINE;
    result.signals = take_all(it->second.mailbox);
    result.files = room.files;
    result.files_version = room.files_version;
    result.files_updated_at_ms = room.files_updated_at_ms;
    result.host_id = room.host_id;
    return result;
}

SweepReport SessionCoordinator::sweepStale(std::chrono::steady_clock::time_point now) {
    SweepReport report;
    for (auto& entry : snapshotSlots()) {
        const std::string& roomId = entry.first;
        SlotPtr& slot = entry.second;
        bool evict_room = false;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            if (slot->closed) continue;
            Room& room = slot->room;

            if (now - room.last_seen_host > m_config.stale_timeout) {
                slot->closed = true;
                evict_room = true;
                SweepReport::EvictedRoom evicted;
                evicted.room_id = roomId;
                evicted.host_id = room.host_id;
                evicted.clients = client_ids(room);
                report.rooms.push_back(std::move(evicted));
                room = Room();
                LOG_INFO("SWEEP: Room " + roomId + " removed (host timeout)");
            } else {
                for (auto it = room.clients.begin(); it != room.clients.end();) {
                    if (now - it->second.last_seen > m_config.stale_timeout) {
                        const std::string clientId = it->first;
                        it = room.clients.erase(it);
                        dropClientDownloads(room, clientId);

                        SweepReport::EvictedClient evicted;
                        evicted.room_id = roomId;
                        evicted.client_id = clientId;
                        evicted.host_id = room.host_id;
                        evicted.counts = countsOf(room);
                        report.clients.push_back(std::move(evicted));
                        LOG_INFO("SWEEP: Client " + clientId + " removed from room " + roomId + " (timeout)");
                    } else {
                        ++it;
                    }
                }
            }
        }
        if (evict_room) {
            eraseSlot(roomId, slot);
        }
    }

    if (!report.empty()) {
        Telemetry& t = Telemetry::getInstance();
        t.inc_counter("rooms_evicted", static_cast<int64_t>(report.rooms.size()));
        t.inc_counter("clients_evicted", static_cast<int64_t>(report.clients.size()));
    }
    Telemetry::getInstance().set_gauge("rooms_active", static_cast<int64_t>(roomCount()));
    return report;
}

RoomSnapshot SessionCoordinator::roomSnapshot(const std::string& roomId) const {
    RoomSnapshot snapshot;
    SlotPtr slot = findSlot(roomId);
    if (!slot) return snapshot;
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return snapshot;
    const Room& room = slot->room;
    snapshot.host_online = hostAlive(room, m_clock());
    snapshot.status = snapshot.host_online ? CoordinatorStatus::OK : CoordinatorStatus::HOST_OFFLINE;
    snapshot.host_id = room.host_id;
    snapshot.files = room.files;
    snapshot.files_version = room.files_version;
    snapshot.clients = client_ids(room);
    snapshot.counts = countsOf(room);
    return snapshot;
}

DownloadCounts SessionCoordinator::activeDownloadCounts(const std::string& roomId) const {
    SlotPtr slot = findSlot(roomId);
    if (!slot) return {};
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->closed) return {};
    return countsOf(slot->room);
}

size_t SessionCoordinator::roomCount() const {
    std::lock_guard<std::mutex> lock(m_index_mutex);
    return m_rooms.size();
}

void SessionCoordinator::shutdown() {
    if (m_shut_down.exchange(true)) {
        return;
    }
    std::unordered_map<std::string, SlotPtr> rooms;
    {
        std::lock_guard<std::mutex> lock(m_index_mutex);
        rooms.swap(m_rooms);
    }
    for (auto& kv : rooms) {
        std::lock_guard<std::mutex> lock(kv.second->mutex);
        kv.second->closed = true;
        kv.second->room = Room();
    }
    if (!rooms.empty()) {
        LOG_INFO("COORD: Shutdown dropped " + std::to_string(rooms.size()) + " rooms");
    }
}
