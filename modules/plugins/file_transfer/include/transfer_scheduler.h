#ifndef TRANSFER_SCHEDULER_H
#define TRANSFER_SCHEDULER_H

#include "byte_source.h"
#include "data_channel.h"
#include "transfer_types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

/**
 * TRANSFER SCHEDULER (sender side)
 *
 * One loop multiplexes every outbound transfer of this peer:
 * - each tick, transfers whose channel is open and below the buffer ceiling
 *   share a fixed chunk budget equally (floor(budget / active), at least 1)
 * - a transfer that has queued all its bytes sends the completion marker
 *   only once the channel buffer has drained below a small threshold
 * - a channel that closes or fails mid-transfer deregisters the transfer
 *
 * The loop is the only mutator of transfer state. addTransfer, removeTransfer
 * and the failure entry points enqueue commands that the loop applies at the
 * start of its next tick. With no transfers the loop thread blocks without a
 * timer.
 */

// ============================================================================
// CALLBACKS AND TYPEDEFS
// ============================================================================

using TransferCompleteCallback = std::function<void(const TransferKey& key, const TransferStats& stats)>;
using TransferFailedCallback = std::function<void(const TransferKey& key, TransferError error, const std::string& message)>;
using TransferProgressCallback = std::function<void(const TransferKey& key, uint64_t bytes_sent, uint64_t total_bytes)>;

// ============================================================================
// STRUCTURES
// ============================================================================

struct SchedulerConfig {
    size_t chunk_size = 64 * 1024;
    size_t max_buffer_bytes = 2 * 1024 * 1024;
    int chunks_per_tick = 16;
    std::chrono::milliseconds tick_interval{1};
    size_t completion_drain_threshold = 1000;
    std::chrono::milliseconds completion_backoff{10};
    // false: no loop thread; the owner drives runTick() (tests, embedding).
    bool run_loop = true;

    static SchedulerConfig fromConfigManager();
};

/**
 * An outbound file bound to an established channel.
 */
struct OutboundTransfer {
    std::shared_ptr<DataChannel> channel;
    std::shared_ptr<ByteSource> source;
    std::string name;
    std::string mime_type;

    TransferCompleteCallback on_complete;
    TransferFailedCallback on_failed;
    TransferProgressCallback on_progress;
};

// ============================================================================
// TRANSFER SCHEDULER
// ============================================================================

class TransferScheduler {
public:
    explicit TransferScheduler(SchedulerConfig config = SchedulerConfig());
    ~TransferScheduler();

    TransferScheduler(const TransferScheduler&) = delete;
    TransferScheduler& operator=(const TransferScheduler&) = delete;

    /**
     * Register a transfer. A transfer already registered under the same key is
     * replaced (reported CANCELLED).
     * @return false when the transfer has no channel or no source
     */
    bool addTransfer(const TransferKey& key, OutboundTransfer transfer);

    /**
     * Deregister without reporting. No-op for unknown keys.
     */
    void removeTransfer(const TransferKey& key);

    /**
     * The transfer's channel failed or closed outside the scheduler's view.
     * Reported through on_failed as CHANNEL_FAILURE, or as a completion when
     * every chunk was already queued. When channel is given, a transfer under
     * the same key running on a different channel is left alone.
     */
    void handleChannelFailure(const TransferKey& key, const std::string& reason,
                              std::shared_ptr<DataChannel> channel = nullptr);

    /**
     * Peer left or timed out: cancel every transfer keyed to it.
     */
    void removeTransfersForPeer(const std::string& peer_id);

    /**
     * Drop everything and stop the loop thread.
     */
    void cleanup();

    /**
     * Apply pending commands and run one scheduling pass on the caller's thread.
     * Only meaningful with run_loop == false.
     */
    void runTick();

    // Transfers registered as of the last applied command batch.
    size_t activeCount() const { return m_active_count.load(); }
    bool isIdle() const;

    const SchedulerConfig& config() const { return m_config; }

private:
    // --- Commands applied by the loop ---
    struct AddCommand {
        TransferKey key;
        OutboundTransfer transfer;
    };
    struct RemoveCommand {
        TransferKey key;
    };
    struct FailCommand {
        TransferKey key;
        std::string reason;
        std::shared_ptr<DataChannel> channel;
    };
    struct RemovePeerCommand {
        std::string peer_id;
    };

    using Command = std::variant<AddCommand, RemoveCommand, FailCommand, RemovePeerCommand>;

    struct ActiveTransfer {
        OutboundTransfer transfer;
        uint64_t total_size = 0;
        uint64_t offset = 0;
        uint64_t chunks_sent = 0;
        TransferState state = TransferState::PENDING;
        std::chrono::steady_clock::time_point start_time;
        std::chrono::steady_clock::time_point next_marker_check;
    };

    void post(Command command);
    void ensureLoop();
    void loop();

    void applyCommands();
    void apply(AddCommand& cmd);
    void apply(RemoveCommand& cmd);
    void apply(FailCommand& cmd);
    void apply(RemovePeerCommand& cmd);

    void tick();
    void sendChunks(const TransferKey& key, ActiveTransfer& t, int budget);
    bool tryFinalize(const TransferKey& key, ActiveTransfer& t, std::chrono::steady_clock::time_point now);
    void complete(const TransferKey& key, ActiveTransfer& t);
    void fail(const TransferKey& key, ActiveTransfer& t, TransferError error, const std::string& message);

    SchedulerConfig m_config;

    // Owned by the loop (or by the runTick caller).
    std::map<TransferKey, ActiveTransfer> m_transfers;

    mutable std::mutex m_cmd_mutex;
    std::condition_variable m_cmd_cv;
    std::deque<Command> m_commands;
    bool m_stop = false;

    std::atomic<size_t> m_active_count{0};
    std::thread m_thread;
    std::mutex m_thread_mutex;
    // Commands posted from inside a callback on the loop thread must not
    // take m_thread_mutex: cleanup() holds it while joining that thread.
    std::atomic<std::thread::id> m_loop_thread{};
};

#endif // TRANSFER_SCHEDULER_H
