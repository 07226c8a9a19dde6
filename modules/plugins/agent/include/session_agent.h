#ifndef SESSION_AGENT_H
#define SESSION_AGENT_H

#include "byte_source.h"
#include "channel_negotiator.h"
#include "signaling_transport.h"
#include "transfer_receiver.h"
#include "transfer_scheduler.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

/**
 * SESSION AGENT
 *
 * Peer-side state machine for one room membership:
 *
 *   IDLE --createRoom/hostRoom--> HOST --leave / room gone--> ENDED
 *   IDLE --joinRoom-------------> CLIENT --leave / host gone--> ENDED
 *
 * The host answers file requests by negotiating a channel and handing it to
 * the scheduler; the client feeds negotiated channels into the receiver.
 * With a POLL transport a background loop heartbeats and polls; with PUSH
 * it only heartbeats and events arrive from the transport.
 */

enum class SessionRole {
    NONE,
    HOST,
    CLIENT
};

enum class SessionEndReason {
    ROOM_NOT_FOUND,     // the room vanished (closed or swept)
    HOST_OFFLINE,       // the host stopped refreshing its liveness
    LEFT                // this peer left
};

inline const char* session_end_reason_to_string(SessionEndReason reason) {
    switch (reason) {
        case SessionEndReason::ROOM_NOT_FOUND: return "ROOM_NOT_FOUND";
        case SessionEndReason::HOST_OFFLINE: return "HOST_OFFLINE";
        case SessionEndReason::LEFT: return "LEFT";
    }
    return "UNKNOWN";
}

struct AgentConfig {
    std::chrono::milliseconds poll_interval{2000};
    // One extra poll this long after a file request, to pick the offer up early.
    std::chrono::milliseconds request_poll_delay{500};
    // false: no background loop; the owner calls pollOnce() (tests).
    bool run_poll_loop = true;

    static AgentConfig fromConfigManager();
};

/**
 * A file this peer hosts: its public descriptor plus where its bytes come from.
 */
struct HostedFile {
    FileDescriptor descriptor;
    std::shared_ptr<ByteSource> source;
};

class SessionAgent {
public:
    using FilesUpdatedCallback = std::function<void(const std::vector<FileDescriptor>& files)>;
    using PeerCountsCallback = std::function<void(const DownloadCounts& counts)>;
    using ClientCountCallback = std::function<void(size_t count)>;
    using SessionEndedCallback = std::function<void(SessionEndReason reason)>;

    SessionAgent(AgentConfig config, std::string peerId, SignalingTransport& transport,
                 ChannelNegotiator& negotiator, TransferScheduler& scheduler, TransferReceiver& receiver);
    ~SessionAgent();

    SessionAgent(const SessionAgent&) = delete;
    SessionAgent& operator=(const SessionAgent&) = delete;

    // --- Room lifecycle ---
    bool createRoom(std::string* roomId, std::string* error = nullptr);
    bool hostRoom(const std::string& roomId, std::string* error = nullptr);
    bool joinRoom(const std::string& roomId, std::string* error = nullptr);
    void leave();

    // --- Host ---
    bool offerFiles(std::vector<HostedFile> files, std::string* error = nullptr);

    // --- Client ---
    bool requestFile(const std::string& fileId, std::string* error = nullptr);

    /**
     * One heartbeat plus one poll, with every resulting event dispatched.
     * @return false when the session is not active (or just ended)
     */
    bool pollOnce();

    // Entry point for every transport event (poll results and pushed frames).
    void handleEvent(const TransportEvent& event);

    // --- State ---
    const std::string& peerId() const { return m_peer_id; }
    SessionRole role() const;
    bool isActive() const;
    std::string roomId() const;
    std::string hostId() const;
    std::vector<FileDescriptor> files() const;
    DownloadCounts peerCounts() const;
    size_t clientCount() const;

    // --- Callbacks ---
    void setFilesUpdatedCallback(FilesUpdatedCallback cb);
    void setPeerCountsCallback(PeerCountsCallback cb);
    void setClientCountCallback(ClientCountCallback cb);
    void setSessionEndedCallback(SessionEndedCallback cb);
    void setUploadCallbacks(TransferCompleteCallback on_complete, TransferFailedCallback on_failed);

private:
    void onFilesUpdated(const FilesUpdatedEvent& event);
    void onFileRequested(const FileRequestedEvent& event);
    void onNegotiationSignal(const NegotiationSignalEvent& event);
    void onPeerCounts(const PeerCountsEvent& event);
    void onClientCount(const ClientCountEvent& event);
    void onClientList(const ClientListEvent& event);
    void onClientLeft(const ClientLeftEvent& event);
    void onHostDisconnected(const HostDisconnectedEvent& event);

    ChannelNegotiator::Callbacks hostCallbacks(const TransferKey& key, const HostedFile& file);
    ChannelNegotiator::Callbacks clientCallbacks(const TransferKey& key);
    ChannelNegotiator::EmitSignal emitterFor(const TransferKey& key);
    void dropClient(const std::string& clientId);
    void onDownloadEnded(const TransferKey& key);
    void sendPendingCompletions();

    void beginSession(SessionRole role, const std::string& roomId, const std::string& hostId);
    void endSession(SessionEndReason reason);

    void startLoop();
    void stopLoop();
    void pollLoop();
    void scheduleEarlyPoll(std::chrono::milliseconds delay);

    AgentConfig m_config;
    const std::string m_peer_id;
    SignalingTransport& m_transport;
    ChannelNegotiator& m_negotiator;
    TransferScheduler& m_scheduler;
    TransferReceiver& m_receiver;

    mutable std::mutex m_mutex;
    SessionRole m_role = SessionRole::NONE;
    bool m_active = false;
    std::string m_room_id;
    std::string m_host_id;
    std::vector<FileDescriptor> m_files;
    uint64_t m_files_version = 0;
    int64_t m_files_updated_at_ms = 0;
    std::map<std::string, HostedFile> m_hosted;
    std::set<std::string> m_known_clients;
    DownloadCounts m_peer_counts;
    size_t m_client_count = 0;
    // File ids whose download-complete is sent by the next pollOnce().
    std::vector<std::string> m_pending_completions;

    std::mutex m_callback_mutex;
    FilesUpdatedCallback m_on_files_updated;
    PeerCountsCallback m_on_peer_counts;
    ClientCountCallback m_on_client_count;
    SessionEndedCallback m_on_session_ended;
    TransferCompleteCallback m_on_upload_complete;
    TransferFailedCallback m_on_upload_failed;

    // Poll loop
    std::mutex m_loop_mutex;
    std::condition_variable m_loop_cv;
    std::thread m_loop_thread;
    bool m_stop_loop = false;
    bool m_wake = false;
    std::chrono::steady_clock::time_point m_next_poll;
    std::chrono::steady_clock::time_point m_early_poll;
};

#endif // SESSION_AGENT_H
