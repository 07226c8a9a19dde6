#ifndef PUSH_GATEWAY_H
#define PUSH_GATEWAY_H

#include "coordinator_observer.h"
#include "session_coordinator.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Outbound half of one push connection. send() must not block on the network.
class PushSink {
public:
    virtual ~PushSink() = default;
    virtual void send(const std::string& frame) = 0;
};

/**
 * @brief Event adapter over the coordinator for long-lived connections.
 *
 * Each frame is {"event": name, "data": {...}}. Relayed signals are drained
 * from the coordinator mailbox and written to the target connection in the
 * same call, so push peers never wait for a poll cycle.
 */
class PushGateway : public ICoordinatorObserver {
public:
    using ConnectionId = uint64_t;

    explicit PushGateway(ISessionCoordinator& coordinator);

    ConnectionId attach(std::shared_ptr<PushSink> sink);
    void handleFrame(ConnectionId id, const std::string& frame);
    // Connection lost: a host closes its room, a client leaves it.
    void detach(ConnectionId id);
    // Drops every connection without touching room state (server shutdown).
    void detachAll();

    void onSweepReport(const SweepReport& report);

    size_t connectionCount() const;

    static std::string makeFrame(const std::string& event, const nlohmann::json& data);

    // ICoordinatorObserver
    void onMailboxChanged(const std::string& roomId, const std::string& identity) override;
    void onFilesChanged(const std::string& roomId) override;
    void onMembershipChanged(const std::string& roomId, const std::string& clientId, bool joined) override;
    void onDownloadsChanged(const std::string& roomId, const std::string& hostId,
                            const DownloadCounts& counts) override;
    // Clients get host-disconnected; a host still bound to the room gets room-closed.
    void onRoomClosed(const std::string& roomId, const std::string& hostId,
                      const std::vector<std::string>& clients) override;

private:
    using json = nlohmann::json;

    struct Connection {
        std::shared_ptr<PushSink> sink;
        std::string peer_id;
        std::string room_id;
        bool is_host = false;
    };

    using Outbox = std::vector<std::pair<std::shared_ptr<PushSink>, std::string>>;

    bool lookup(ConnectionId id, Connection* out) const;
    void bindRoom(ConnectionId id, const std::string& roomId, bool isHost);
    void unbindRoom(ConnectionId id);
    std::shared_ptr<PushSink> sinkFor(const std::string& peerId) const;
    void deliver(Outbox& outbox);

    void queueTo(Outbox& outbox, const std::string& peerId, const std::string& event, const json& data) const;
    void drainTo(Outbox& outbox, const std::string& roomId, const std::string& identity);
    void notifyHostCounts(Outbox& outbox, const std::string& hostId, const DownloadCounts& counts) const;

    void onHello(ConnectionId id, const json& data, Outbox& outbox);
    void onCreateRoom(ConnectionId id, const Connection& conn, Outbox& outbox);
    void onHostRoom(ConnectionId id, const Connection& conn, const json& data, Outbox& outbox);
    void onJoinRoom(ConnectionId id, const Connection& conn, const json& data, Outbox& outbox);
    void onUpdateFiles(const Connection& conn, const json& data, Outbox& outbox);
    void onRequestFile(const Connection& conn, const json& data, Outbox& outbox);
    void onNegotiation(const Connection& conn, SignalKind kind, const json& data, Outbox& outbox);
    void onDownloadComplete(const Connection& conn, const json& data, Outbox& outbox);
    void onLeaveRoom(ConnectionId id, const Connection& conn, Outbox& outbox);
    void onCloseRoom(ConnectionId id, const Connection& conn, Outbox& outbox);
    void onHeartbeat(const Connection& conn, Outbox& outbox);

    void leaveAsClient(const Connection& conn, Outbox& outbox);
    void closeAsHost(const Connection& conn, Outbox& outbox);

    ISessionCoordinator& m_coordinator;

    mutable std::mutex m_mutex;
    ConnectionId m_next_id = 1;
    std::map<ConnectionId, Connection> m_connections;
    std::map<std::string, ConnectionId> m_by_peer;
};

#endif // PUSH_GATEWAY_H
