#ifndef SESSION_COORDINATOR_H
#define SESSION_COORDINATOR_H

#include "coordinator_status.h"
#include "room_types.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

struct RoomStatus {
    bool exists = false;
    bool has_host = false;
    size_t file_count = 0;
};

struct JoinResult {
    CoordinatorStatus status = CoordinatorStatus::ROOM_NOT_FOUND;
    std::vector<FileDescriptor> files;
    uint64_t files_version = 0;
    std::string host_id;
    size_t client_count = 0;
};

struct LeaveResult {
    CoordinatorStatus status = CoordinatorStatus::ROOM_NOT_FOUND;
    bool removed = false;
    std::string host_id;
    size_t client_count = 0;
    DownloadCounts counts;
};

struct CloseResult {
    bool existed = false;
    std::string host_id;
    std::vector<std::string> clients;
};

struct RelayResult {
    CoordinatorStatus status = CoordinatorStatus::ROOM_NOT_FOUND;
    bool queued = false;        // false when the target client is unknown
    std::string target_id;      // resolved mailbox owner
};

struct DownloadUpdate {
    CoordinatorStatus status = CoordinatorStatus::ROOM_NOT_FOUND;
    std::string host_id;
    DownloadCounts counts;
};

struct HostPollResult {
    CoordinatorStatus status = CoordinatorStatus::ROOM_NOT_FOUND;
    std::vector<Signal> signals;
    size_t client_count = 0;
    DownloadCounts peer_counts;
    std::vector<std::string> clients;
};

struct ClientPollResult {
    CoordinatorStatus status = CoordinatorStatus::ROOM_NOT_FOUND;
    std::vector<Signal> signals;
    std::vector<FileDescriptor> files;
    uint64_t files_version = 0;
    int64_t files_updated_at_ms = 0;
    bool host_online = false;
    std::string host_id;
};

// Read-only view; takes no liveness or mailbox side effects.
struct RoomSnapshot {
    CoordinatorStatus status = CoordinatorStatus::ROOM_NOT_FOUND;
    std::string host_id;
    bool host_online = false;
    std::vector<FileDescriptor> files;
    uint64_t files_version = 0;
    std::vector<std::string> clients;
    DownloadCounts counts;
};

struct SweepReport {
    struct EvictedRoom {
        std::string room_id;
        std::string host_id;
        std::vector<std::string> clients;
    };
    struct EvictedClient {
        std::string room_id;
        std::string client_id;
        std::string host_id;
        DownloadCounts counts;   // host's view after the eviction
    };

    std::vector<EvictedRoom> rooms;
    std::vector<EvictedClient> clients;

    bool empty() const { return rooms.empty() && clients.empty(); }
};

struct CoordinatorConfig {
    std::chrono::milliseconds stale_timeout{30000};
    std::chrono::milliseconds sweep_interval{10000};
    size_t room_id_length = 8;

    static CoordinatorConfig fromConfigManager();
};

/**
 * Authoritative room state. Every operation is safe to call concurrently;
 * the poll and push gateways and the stale sweeper all share one instance.
 */
class ISessionCoordinator {
public:
    virtual ~ISessionCoordinator() = default;

    virtual std::string createRoomId() = 0;
    virtual void registerHost(const std::string& roomId, const std::string& hostId) = 0;
    virtual RoomStatus roomStatus(const std::string& roomId) const = 0;
    virtual CoordinatorStatus setFiles(const std::string& roomId, const std::vector<FileDescriptor>& files) = 0;
    virtual JoinResult joinClient(const std::string& roomId, const std::string& clientId) = 0;
    virtual LeaveResult leaveClient(const std::string& roomId, const std::string& clientId) = 0;
    virtual CloseResult closeRoom(const std::string& roomId) = 0;
    virtual RelayResult relaySignal(const std::string& roomId, Signal signal) = 0;
    virtual DownloadUpdate recordDownloadStart(const std::string& roomId, const std::string& fileId,
                                               const std::string& clientId) = 0;
    virtual DownloadUpdate recordDownloadComplete(const std::string& roomId, const std::string& fileId,
                                                  const std::string& clientId) = 0;
    virtual DownloadUpdate requestFile(const std::string& roomId, const std::string& clientId,
                                       const std::string& fileId) = 0;
    virtual std::vector<Signal> drainMailbox(const std::string& roomId, const std::string& identity) = 0;
    virtual HostPollResult hostPoll(const std::string& roomId) = 0;
    virtual ClientPollResult clientPoll(const std::string& roomId, const std::string& clientId) = 0;
    virtual SweepReport sweepStale(std::chrono::steady_clock::time_point now) = 0;
    virtual RoomSnapshot roomSnapshot(const std::string& roomId) const = 0;
    virtual DownloadCounts activeDownloadCounts(const std::string& roomId) const = 0;
    virtual size_t roomCount() const = 0;
    virtual void shutdown() = 0;
};

class SessionCoordinator : public ISessionCoordinator {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit SessionCoordinator(CoordinatorConfig config = CoordinatorConfig(), Clock clock = Clock());
    ~SessionCoordinator() override;

    std::string createRoomId() override;
    void registerHost(const std::string& roomId, const std::string& hostId) override;
    RoomStatus roomStatus(const std::string& roomId) const override;
    CoordinatorStatus setFiles(const std::string& roomId, const std::vector<FileDescriptor>& files) override;
    JoinResult joinClient(const std::string& roomId, const std::string& clientId) override;
    LeaveResult leaveClient(const std::string& roomId, const std::string& clientId) override;
    CloseResult closeRoom(const std::string& roomId) override;
    RelayResult relaySignal(const std::string& roomId, Signal signal) override;
    DownloadUpdate recordDownloadStart(const std::string& roomId, const std::string& fileId,
                                       const std::string& clientId) override;
    DownloadUpdate recordDownloadComplete(const std::string& roomId, const std::string& fileId,
                                          const std::string& clientId) override;
    DownloadUpdate requestFile(const std::string& roomId, const std::string& clientId,
                               const std::string& fileId) override;
    std::vector<Signal> drainMailbox(const std::string& roomId, const std::string& identity) override;
    HostPollResult hostPoll(const std::string& roomId) override;
    ClientPollResult clientPoll(const std::string& roomId, const std::string& clientId) override;
    SweepReport sweepStale(std::chrono::steady_clock::time_point now) override;
    RoomSnapshot roomSnapshot(const std::string& roomId) const override;
    DownloadCounts activeDownloadCounts(const std::string& roomId) const override;
    size_t roomCount() const override;
    void shutdown() override;

    const CoordinatorConfig& config() const { return m_config; }
    std::chrono::steady_clock::time_point now() const { return m_clock(); }

private:
    // One slot per room. The index lock is only held to look a slot up;
    // all room state is mutated under the slot's own mutex.
    struct RoomSlot {
        std::mutex mutex;
        Room room;
        bool closed = false;
    };
    using SlotPtr = std::shared_ptr<RoomSlot>;

    SlotPtr findSlot(const std::string& roomId) const;
    SlotPtr findOrCreateSlot(const std::string& roomId);
    void eraseSlot(const std::string& roomId, const SlotPtr& expected);
    std::vector<std::pair<std::string, SlotPtr>> snapshotSlots() const;

    bool hostAlive(const Room& room, std::chrono::steady_clock::time_point now) const;
    static DownloadCounts countsOf(const Room& room);
    static void dropClientDownloads(Room& room, const std::string& clientId);

    CoordinatorConfig m_config;
    Clock m_clock;

    mutable std::mutex m_index_mutex;
    std::unordered_map<std::string, SlotPtr> m_rooms;
    std::atomic<bool> m_shut_down{false};
};

#endif // SESSION_COORDINATOR_H
