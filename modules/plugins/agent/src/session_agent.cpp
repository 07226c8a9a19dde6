#include "session_agent.h"
#include "config_manager.h"
#include "constants.h"
#include "id_utils.h"
#include "logger.h"
#include "telemetry.h"

#include <algorithm>
#include <type_traits>
#include <variant>

AgentConfig AgentConfig::fromConfigManager() {
    const ConfigManager& cfg = ConfigManager::getInstance();
    AgentConfig config;
    config.poll_interval = std::chrono::milliseconds(std::max(10, cfg.getPollIntervalMs()));
    config.request_poll_delay = std::chrono::milliseconds(std::max(0, cfg.getRequestPollDelayMs()));
    return config;
}

SessionAgent::SessionAgent(AgentConfig config, std::string peerId, SignalingTransport& transport,
                           ChannelNegotiator& negotiator, TransferScheduler& scheduler, TransferReceiver& receiver)
    : m_config(config),
      m_peer_id(std::move(peerId)),
      m_transport(transport),
      m_negotiator(negotiator),
      m_scheduler(scheduler),
      m_receiver(receiver) {
    m_transport.setEventHandler([this](const TransportEvent& event) { handleEvent(event); });
    m_receiver.setDownloadEndedCallback([this](const TransferKey& key) { onDownloadEnded(key); });
}

SessionAgent::~SessionAgent() {
    leave();
    stopLoop();
    m_transport.setEventHandler(nullptr);
    m_receiver.setDownloadEndedCallback(nullptr);
}

// ============================================================================
// ROOM LIFECYCLE
// ============================================================================

bool SessionAgent::createRoom(std::string* roomId, std::string* error) {
    std::string id;
    if (!m_transport.createRoom(&id, error)) {
        LOG_WARN("AGENT: Failed to create room");
        return false;
    }
    if (!hostRoom(id, error)) {
        return false;
    }
    if (roomId) *roomId = id;
    return true;
}

bool SessionAgent::hostRoom(const std::string& roomId, std::string* error) {
    if (isActive()) {
        if (error) *error = "already in room " + this->roomId();
        return false;
    }
    if (!m_transport.hostRoom(roomId, error)) {
        LOG_WARN("AGENT: Failed to host room " + roomId);
        return false;
    }
    beginSession(SessionRole::HOST, roomId, m_peer_id);
    LOG_INFO("AGENT: Hosting room " + roomId + " (" + delivery_mode_to_string(m_transport.mode()) + ")");
    return true;
}

bool SessionAgent::joinRoom(const std::string& roomId, std::string* error) {
    if (isActive()) {
        if (error) *error = "already in room " + this->roomId();
        return false;
    }
    JoinReply reply;
    if (!m_transport.joinRoom(roomId, &reply, error)) {
        LOG_WARN("AGENT: Failed to join room " + roomId);
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_files = reply.files;
        m_files_version = reply.files_version;
        m_files_updated_at_ms = 0;
    }
    beginSession(SessionRole::CLIENT, roomId, reply.host_id);
    LOG_INFO("AGENT: Joined room " + roomId + " (" + std::to_string(reply.files.size()) + " files)");

    FilesUpdatedCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        cb = m_on_files_updated;
    }
    if (cb) cb(reply.files);
    return true;
}

void SessionAgent::leave() {
    SessionRole role;
    std::string roomId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active) return;
        m_active = false;
        role = m_role;
        roomId = m_room_id;
    }
    stopLoop();

    if (role == SessionRole::HOST) {
        m_scheduler.cleanup();
    } else {
        m_receiver.cancelPeer(hostId());
    }
    m_negotiator.closeAll();
    m_transport.leave();
    LOG_INFO("AGENT: Left room " + roomId);

    SessionEndedCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        cb = m_on_session_ended;
    }
    if (cb) cb(SessionEndReason::LEFT);
}

void SessionAgent::beginSession(SessionRole role, const std::string& roomId, const std::string& hostId) {
    // A loop that ended itself on a disconnect is still joinable.
    stopLoop();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_role = role;
        m_active = true;
        m_room_id = roomId;
        m_host_id = hostId.empty() ? std::string(HOST_TARGET) : hostId;
        m_known_clients.clear();
        m_peer_counts.clear();
        m_client_count = 0;
        m_pending_completions.clear();
        if (role == SessionRole::HOST) {
            m_files.clear();
            m_hosted.clear();
            m_files_version = 0;
            m_files_updated_at_ms = 0;
        }
    }
    Telemetry::getInstance().inc_counter(role == SessionRole::HOST ? "rooms_hosted" : "rooms_joined");
    startLoop();
}

void SessionAgent::endSession(SessionEndReason reason) {
    SessionRole role;
    std::string roomId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active) return;
        m_active = false;
        role = m_role;
        roomId = m_room_id;
    }
    stopLoop();

    if (role == SessionRole::HOST) {
        m_scheduler.cleanup();
    } else {
        m_receiver.cancelPeer(hostId());
    }
    m_negotiator.closeAll();
    LOG_WARN("AGENT: Session in room " + roomId + " ended: " + session_end_reason_to_string(reason));

    SessionEndedCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        cb = m_on_session_ended;
    }
    if (cb) cb(reason);
}

// ============================================================================
// HOST
// ============================================================================

bool SessionAgent::offerFiles(std::vector<HostedFile> files, std::string* error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active || m_role != SessionRole::HOST) {
            if (error) *error = "not hosting a room";
            return false;
        }
    }

    std::vector<FileDescriptor> descriptors;
    std::map<std::string, HostedFile> hosted;
    for (HostedFile& file : files) {
        if (!file.source) {
            if (error) *error = "file '" + file.descriptor.name + "' has no source";
            return false;
        }
        if (file.descriptor.id.empty()) {
            file.descriptor.id = generate_file_id();
        }
        if (hosted.count(file.descriptor.id)) {
            if (error) *error = "duplicate file id " + file.descriptor.id;
            return false;
        }
        file.descriptor.size = file.source->size();
        descriptors.push_back(file.descriptor);
        hosted[file.descriptor.id] = std::move(file);
    }

    if (!m_transport.updateFiles(descriptors, error)) {
        LOG_WARN("AGENT: Failed to publish file list");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_hosted = std::move(hosted);
        m_files = descriptors;
        ++m_files_version;
    }
    LOG_INFO("AGENT: Offering " + std::to_string(descriptors.size()) + " files");
    return true;
}

void SessionAgent::onFileRequested(const FileRequestedEvent& event) {
    HostedFile file;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_role != SessionRole::HOST) return;
        auto it = m_hosted.find(event.file_id);
        if (it == m_hosted.end()) {
            LOG_WARN("AGENT: " + event.client_id + " requested unknown file " + event.file_id);
            return;
        }
        file = it->second;
    }

    const TransferKey key{event.client_id, event.file_id};
    LOG_INFO("AGENT: " + event.client_id + " requested " + file.descriptor.name);
    Telemetry::getInstance().inc_counter("file_requests");
    m_negotiator.initiate(key, hostCallbacks(key, file));
}

ChannelNegotiator::Callbacks SessionAgent::hostCallbacks(const TransferKey& key, const HostedFile& file) {
    ChannelNegotiator::Callbacks callbacks;
    callbacks.emit = emitterFor(key);

    callbacks.on_open = [this, key, file](const std::shared_ptr<DataChannel>& channel) {
        OutboundTransfer transfer;
        transfer.channel = channel;
        transfer.source = file.source;
        transfer.name = file.descriptor.name;
        transfer.mime_type = file.descriptor.mime_type;
        // Close this transfer's own channel: a repeated request may already
        // have a newer channel negotiated under the same key.
        std::weak_ptr<DataChannel> weak = channel;
        transfer.on_complete = [this, weak](const TransferKey& k, const TransferStats& stats) {
            // The marker is already queued; the close frame follows it.
            if (auto ch = weak.lock()) ch->close();
            TransferCompleteCallback cb;
            {
                std::lock_guard<std::mutex> lock(m_callback_mutex);
                cb = m_on_upload_complete;
            }
            if (cb) cb(k, stats);
        };
        transfer.on_failed = [this, weak](const TransferKey& k, TransferError error, const std::string& message) {
            if (auto ch = weak.lock()) ch->close();
            TransferFailedCallback cb;
            {
                std::lock_guard<std::mutex> lock(m_callback_mutex);
                cb = m_on_upload_failed;
            }
            if (cb) cb(k, error, message);
        };
        channel->setStateHandler([this, key, weak](ChannelState state) {
            if (state != ChannelState::CLOSED && state != ChannelState::FAILED) return;
            if (auto ch = weak.lock()) {
                m_scheduler.handleChannelFailure(key, std::string("channel ") + channel_state_to_string(state), ch);
            }
        });
        if (!m_scheduler.addTransfer(key, std::move(transfer))) {
            LOG_WARN("AGENT: Could not schedule " + key.toString());
            m_negotiator.close(key);
        }
    };

    callbacks.on_failed = [this, key](const std::string& reason) {
        LOG_WARN("AGENT: Negotiation for " + key.toString() + " failed: " + reason);
        TransferFailedCallback cb;
        {
            std::lock_guard<std::mutex> lock(m_callback_mutex);
            cb = m_on_upload_failed;
        }
        if (cb) cb(key, TransferError::CHANNEL_FAILURE, reason);
    };
    return callbacks;
}

void SessionAgent::onClientList(const ClientListEvent& event) {
    std::vector<std::string> gone;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_role != SessionRole::HOST) return;
        std::set<std::string> current(event.clients.begin(), event.clients.end());
        for (const std::string& client : m_known_clients) {
            if (!current.count(client)) gone.push_back(client);
        }
        m_known_clients.swap(current);
    }
    for (const std::string& client : gone) {
        dropClient(client);
    }
}

void SessionAgent::onClientLeft(const ClientLeftEvent& event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_role != SessionRole::HOST) return;
        m_known_clients.erase(event.client_id);
    }
    dropClient(event.client_id);
}

void SessionAgent::dropClient(const std::string& clientId) {
    LOG_INFO("AGENT: Client " + clientId + " left, cancelling its transfers");
    m_scheduler.removeTransfersForPeer(clientId);
}

void SessionAgent::onPeerCounts(const PeerCountsEvent& event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_peer_counts == event.counts) return;
        m_peer_counts = event.counts;
    }
    PeerCountsCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        cb = m_on_peer_counts;
    }
    if (cb) cb(event.counts);
}

void SessionAgent::onClientCount(const ClientCountEvent& event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_client_count == event.count) return;
        m_client_count = event.count;
    }
    ClientCountCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        cb = m_on_client_count;
    }
    if (cb) cb(event.count);
}

// ============================================================================
// CLIENT
// ============================================================================

bool SessionAgent::requestFile(const std::string& fileId, std::string* error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active || m_role != SessionRole::CLIENT) {
            if (error) *error = "not in a room as a client";
            return false;
        }
        const bool known = std::any_of(m_files.begin(), m_files.end(),
                                       [&](const FileDescriptor& f) { return f.id == fileId; });
        if (!known) {
            if (error) *error = "unknown file " + fileId;
            return false;
        }
    }
    if (!m_transport.requestFile(fileId, error)) {
        LOG_WARN("AGENT: File request for " + fileId + " failed");
        return false;
    }
    LOG_INFO("AGENT: Requested file " + fileId);
    scheduleEarlyPoll(m_config.request_poll_delay);
    return true;
}

void SessionAgent::onFilesUpdated(const FilesUpdatedEvent& event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_role != SessionRole::CLIENT) return;
        // Push frames carry no stamp; fall back to the version counter.
        const bool newer = event.files_updated_at_ms > 0
                               ? event.files_updated_at_ms > m_files_updated_at_ms
                               : event.files_version > m_files_version;
        if (!newer) return;
        m_files = event.files;
        m_files_version = std::max(m_files_version, event.files_version);
        if (event.files_updated_at_ms > 0) m_files_updated_at_ms = event.files_updated_at_ms;
    }
    LOG_INFO("AGENT: File list updated (" + std::to_string(event.files.size()) + " files)");

    FilesUpdatedCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        cb = m_on_files_updated;
    }
    if (cb) cb(event.files);
}

ChannelNegotiator::Callbacks SessionAgent::clientCallbacks(const TransferKey& key) {
    ChannelNegotiator::Callbacks callbacks;
    callbacks.emit = emitterFor(key);

    callbacks.on_open = [this, key](const std::shared_ptr<DataChannel>& channel) {
        channel->setTextHandler([this, key](const std::string& text) { m_receiver.onText(key, text); });
        channel->setBinaryHandler([this, key](const std::string& bytes) { m_receiver.onBinary(key, bytes); });
        channel->setStateHandler([this, key](ChannelState state) { m_receiver.onChannelState(key, state); });
        LOG_DEBUG("AGENT: Channel open for " + key.toString());
    };

    callbacks.on_failed = [this, key](const std::string& reason) {
        LOG_WARN("AGENT: Negotiation for " + key.toString() + " failed: " + reason);
        m_receiver.onChannelState(key, ChannelState::FAILED);
    };
    return callbacks;
}

// Runs on the channel's io thread, so the coordinator call is left to the
// poll thread.
void SessionAgent::onDownloadEnded(const TransferKey& key) {
    m_negotiator.close(key);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active) return;
        m_pending_completions.push_back(key.file_id);
    }
    scheduleEarlyPoll(std::chrono::milliseconds(0));
}

void SessionAgent::sendPendingCompletions() {
    std::vector<std::string> fileIds;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        fileIds.swap(m_pending_completions);
    }
    for (const std::string& fileId : fileIds) {
        std::string err;
        if (!m_transport.downloadComplete(fileId, &err)) {
            LOG_DEBUG("AGENT: download-complete for " + fileId + " not recorded: " + err);
        }
    }
}

// ============================================================================
// BOTH ROLES
// ============================================================================

ChannelNegotiator::EmitSignal SessionAgent::emitterFor(const TransferKey& key) {
    return [this, key](SignalKind kind, const OpaquePayload& payload) {
        std::string err;
        if (!m_transport.sendSignal(key.peer_id, kind, payload, key.file_id, &err)) {
            LOG_WARN("AGENT: Could not relay signal for " + key.toString() + ": " + err);
        }
    };
}

void SessionAgent::onNegotiationSignal(const NegotiationSignalEvent& event) {
    SessionRole role;
    std::string host;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        role = m_role;
        host = m_host_id;
    }

    if (role == SessionRole::HOST) {
        const TransferKey key{event.sender_id, event.file_id};
        // Negotiations are opened by initiate(); these callbacks are never adopted.
        m_negotiator.handleSignal(key, event.kind, event.payload, ChannelNegotiator::Callbacks());
        return;
    }

    // The relay may name the host by its sentinel; answers always go back to the room's host.
    const TransferKey key{host, event.file_id};
    if (event.kind == SignalKind::OFFER) {
        m_receiver.begin(key);
    }
    m_negotiator.handleSignal(key, event.kind, event.payload, clientCallbacks(key));
}

void SessionAgent::onHostDisconnected(const HostDisconnectedEvent& event) {
    LOG_WARN("AGENT: Room " + event.room_id + (event.room_missing ? " no longer exists" : ": host went offline"));
    endSession(event.room_missing ? SessionEndReason::ROOM_NOT_FOUND : SessionEndReason::HOST_OFFLINE);
}

void SessionAgent::handleEvent(const TransportEvent& event) {
    if (!isActive()) return;
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, FilesUpdatedEvent>) {
            onFilesUpdated(e);
        } else if constexpr (std::is_same_v<T, FileRequestedEvent>) {
            onFileRequested(e);
        } else if constexpr (std::is_same_v<T, NegotiationSignalEvent>) {
            onNegotiationSignal(e);
        } else if constexpr (std::is_same_v<T, PeerCountsEvent>) {
            onPeerCounts(e);
        } else if constexpr (std::is_same_v<T, ClientCountEvent>) {
            onClientCount(e);
        } else if constexpr (std::is_same_v<T, ClientListEvent>) {
            onClientList(e);
        } else if constexpr (std::is_same_v<T, ClientLeftEvent>) {
            onClientLeft(e);
        } else if constexpr (std::is_same_v<T, HostDisconnectedEvent>) {
            onHostDisconnected(e);
        } else if constexpr (std::is_same_v<T, RoomErrorEvent>) {
            LOG_WARN("AGENT: Coordinator error: " + e.message);
        }
    }, event);
}

bool SessionAgent::pollOnce() {
    if (!isActive()) return false;
    sendPendingCompletions();

    std::string err;
    if (!m_transport.heartbeat(&err)) {
        LOG_DEBUG("AGENT: Heartbeat failed: " + err);
    }

    std::vector<TransportEvent> events;
    err.clear();
    if (!m_transport.poll(&events, &err)) {
        // Transient; the next interval retries.
        LOG_WARN("AGENT: Poll failed: " + err);
        return isActive();
    }
    for (const TransportEvent& event : events) {
        handleEvent(event);
        if (!isActive()) break;
    }
    return isActive();
}

// ============================================================================
// POLL LOOP
// ============================================================================

void SessionAgent::startLoop() {
    if (!m_config.run_poll_loop) return;
    std::lock_guard<std::mutex> lock(m_loop_mutex);
    m_stop_loop = false;
    m_wake = false;
    m_next_poll = std::chrono::steady_clock::now();
    m_early_poll = std::chrono::steady_clock::time_point();
    m_loop_thread = std::thread(&SessionAgent::pollLoop, this);
}

void SessionAgent::stopLoop() {
    {
        std::lock_guard<std::mutex> lock(m_loop_mutex);
        m_stop_loop = true;
    }
    m_loop_cv.notify_all();
    // Ending from inside the loop (a disconnect seen by pollOnce): the next
    // beginSession or the destructor joins.
    if (m_loop_thread.joinable() && m_loop_thread.get_id() != std::this_thread::get_id()) {
        m_loop_thread.join();
    }
}

void SessionAgent::scheduleEarlyPoll(std::chrono::milliseconds delay) {
    {
        std::lock_guard<std::mutex> lock(m_loop_mutex);
        m_early_poll = std::chrono::steady_clock::now() + delay;
        m_wake = true;
    }
    m_loop_cv.notify_all();
}

void SessionAgent::pollLoop() {
    LOG_DEBUG("AGENT: Poll loop started");
    std::unique_lock<std::mutex> lock(m_loop_mutex);
    while (!m_stop_loop) {
        auto due = m_next_poll;
        if (m_early_poll != std::chrono::steady_clock::time_point() && m_early_poll < due) {
            due = m_early_poll;
        }
        if (std::chrono::steady_clock::now() < due) {
            m_loop_cv.wait_until(lock, due, [this]() { return m_stop_loop || m_wake; });
            m_wake = false;
            continue;
        }

        m_early_poll = std::chrono::steady_clock::time_point();
        m_next_poll = std::chrono::steady_clock::now() + m_config.poll_interval;
        lock.unlock();
        const bool active = pollOnce();
        lock.lock();
        if (!active) break;
    }
    LOG_DEBUG("AGENT: Poll loop stopped");
}

// ============================================================================
// STATE
// ============================================================================

SessionRole SessionAgent::role() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_role;
}

bool SessionAgent::isActive() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active;
}

std::string SessionAgent::roomId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_room_id;
}

std::string SessionAgent::hostId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_host_id;
}

std::vector<FileDescriptor> SessionAgent::files() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_files;
}

DownloadCounts SessionAgent::peerCounts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peer_counts;
}

size_t SessionAgent::clientCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_client_count;
}

void SessionAgent::setFilesUpdatedCallback(FilesUpdatedCallback cb) {
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_on_files_updated = std::move(cb);
}

void SessionAgent::setPeerCountsCallback(PeerCountsCallback cb) {
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_on_peer_counts = std::move(cb);
}

void SessionAgent::setClientCountCallback(ClientCountCallback cb) {
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_on_client_count = std::move(cb);
}

void SessionAgent::setSessionEndedCallback(SessionEndedCallback cb) {
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_on_session_ended = std::move(cb);
}

void SessionAgent::setUploadCallbacks(TransferCompleteCallback on_complete, TransferFailedCallback on_failed) {
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_on_upload_complete = std::move(on_complete);
    m_on_upload_failed = std::move(on_failed);
}
