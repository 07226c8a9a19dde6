#include "transfer_scheduler.h"
#include "channel_messages.h"
#include "config_manager.h"
#include "logger.h"
#include "telemetry.h"

#include <algorithm>
#include <cstdio>
#include <vector>

namespace {

std::string format_mbps(double mbps) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", mbps);
    return buf;
}

} // namespace

SchedulerConfig SchedulerConfig::fromConfigManager() {
    const ConfigManager& cm = ConfigManager::getInstance();
    SchedulerConfig cfg;
    cfg.chunk_size = static_cast<size_t>(std::max(1, cm.getChunkSize()));
    cfg.max_buffer_bytes = static_cast<size_t>(std::max(1, cm.getMaxBufferBytes()));
    cfg.chunks_per_tick = std::max(1, cm.getChunksPerTick());
    cfg.tick_interval = std::chrono::milliseconds(std::max(0, cm.getTickIntervalMs()));
    cfg.completion_drain_threshold = static_cast<size_t>(std::max(1, cm.getCompletionDrainThreshold()));
    cfg.completion_backoff = std::chrono::milliseconds(std::max(0, cm.getCompletionBackoffMs()));
    return cfg;
}

TransferScheduler::TransferScheduler(SchedulerConfig config)
    : m_config(config) {
    if (m_config.chunk_size == 0) m_config.chunk_size = 64 * 1024;
    if (m_config.chunks_per_tick <= 0) m_config.chunks_per_tick = 16;
}

TransferScheduler::~TransferScheduler() {
    cleanup();
}

// ============================================================================
// PUBLIC ENTRY POINTS (enqueue only)
// ============================================================================

bool TransferScheduler::addTransfer(const TransferKey& key, OutboundTransfer transfer) {
    if (!transfer.channel || !transfer.source) {
        LOG_WARN("SCHED: Rejecting transfer " + key.toString() + " without channel or source");
        return false;
    }
    post(AddCommand{key, std::move(transfer)});
    return true;
}

void TransferScheduler::removeTransfer(const TransferKey& key) {
    post(RemoveCommand{key});
}

void TransferScheduler::handleChannelFailure(const TransferKey& key, const std::string& reason,
                                             std::shared_ptr<DataChannel> channel) {
    post(FailCommand{key, reason, std::move(channel)});
}

void TransferScheduler::removeTransfersForPeer(const std::string& peer_id) {
    post(RemovePeerCommand{peer_id});
}

bool TransferScheduler::isIdle() const {
    std::lock_guard<std::mutex> lock(m_cmd_mutex);
    return m_commands.empty() && m_active_count.load() == 0;
}

void TransferScheduler::post(Command command) {
    {
        std::lock_guard<std::mutex> lock(m_cmd_mutex);
        m_commands.push_back(std::move(command));
    }
    m_cmd_cv.notify_one();
    if (m_config.run_loop && m_loop_thread.load() != std::this_thread::get_id()) {
        ensureLoop();
    }
}

void TransferScheduler::ensureLoop() {
    std::lock_guard<std::mutex> lock(m_thread_mutex);
    if (!m_thread.joinable()) {
        m_thread = std::thread(&TransferScheduler::loop, this);
    }
}

void TransferScheduler::cleanup() {
    {
        std::lock_guard<std::mutex> lock(m_cmd_mutex);
        m_stop = true;
    }
    m_cmd_cv.notify_all();
    {
        std::lock_guard<std::mutex> lock(m_thread_mutex);
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    const size_t dropped = m_transfers.size();
    m_transfers.clear();
    m_active_count = 0;
    {
        std::lock_guard<std::mutex> lock(m_cmd_mutex);
        m_commands.clear();
        m_stop = false;
    }
    if (dropped > 0) {
        LOG_INFO("SCHED: Cleanup dropped " + std::to_string(dropped) + " transfers");
    }
}

void TransferScheduler::runTick() {
    applyCommands();
    if (!m_transfers.empty()) {
        tick();
    }
}

// ============================================================================
// LOOP
// ============================================================================

void TransferScheduler::loop() {
    m_loop_thread = std::this_thread::get_id();
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(m_cmd_mutex);
            if (m_transfers.empty()) {
                // Fully idle: no timer armed until a command arrives.
                m_cmd_cv.wait(lock, [this] { return m_stop || !m_commands.empty(); });
            }
            if (m_stop) break;
        }

        applyCommands();
        if (m_transfers.empty()) {
            continue;
        }
        tick();

        if (!m_transfers.empty()) {
            std::unique_lock<std::mutex> lock(m_cmd_mutex);
            if (m_cmd_cv.wait_for(lock, m_config.tick_interval, [this] { return m_stop; })) {
                break;
            }
        }
    }
    m_loop_thread = std::thread::id();
}

void TransferScheduler::applyCommands() {
    std::deque<Command> pending;
    {
        std::lock_guard<std::mutex> lock(m_cmd_mutex);
        pending.swap(m_commands);
    }
    for (auto& cmd : pending) {
        std::visit([this](auto& c) { apply(c); }, cmd);
    }
    m_active_count = m_transfers.size();
}

void TransferScheduler::apply(AddCommand& cmd) {
    auto existing = m_transfers.find(cmd.key);
    if (existing != m_transfers.end()) {
        fail(cmd.key, existing->second, TransferError::CANCELLED, "replaced by a new request");
        m_transfers.erase(existing);
    }

    ActiveTransfer t;
    t.total_size = cmd.transfer.source->size();
    t.transfer = std::move(cmd.transfer);
    t.start_time = std::chrono::steady_clock::now();
    t.next_marker_check = t.start_time;
    LOG_INFO("SCHED: Transfer added: " + cmd.key.toString() + " (" + std::to_string(t.total_size) + " bytes)");
    m_transfers.emplace(cmd.key, std::move(t));
}

void TransferScheduler::apply(RemoveCommand& cmd) {
    if (m_transfers.erase(cmd.key) > 0) {
        LOG_DEBUG("SCHED: Transfer removed: " + cmd.key.toString());
    }
}

void TransferScheduler::apply(FailCommand& cmd) {
    auto it = m_transfers.find(cmd.key);
    if (it == m_transfers.end()) return;
    ActiveTransfer& t = it->second;
    if (cmd.channel && t.transfer.channel != cmd.channel) return;
    if (t.state == TransferState::FINALIZING) {
        complete(cmd.key, t);
    } else {
        fail(cmd.key, t, TransferError::CHANNEL_FAILURE, cmd.reason);
    }
    m_transfers.erase(it);
}

void TransferScheduler::apply(RemovePeerCommand& cmd) {
    for (auto it = m_transfers.begin(); it != m_transfers.end();) {
        if (it->first.peer_id == cmd.peer_id) {
            fail(it->first, it->second, TransferError::CANCELLED, "peer left");
            it = m_transfers.erase(it);
        } else {
            ++it;
        }
    }
}

// ============================================================================
// SCHEDULING PASS
// ============================================================================

void TransferScheduler::tick() {
    const auto now = std::chrono::steady_clock::now();

    // Channel health, then metadata for transfers whose channel just opened.
    for (auto& kv : m_transfers) {
        ActiveTransfer& t = kv.second;
        const ChannelState cs = t.transfer.channel->state();
        if (cs == ChannelState::CLOSED || cs == ChannelState::FAILED || cs == ChannelState::CLOSING) {
            if (t.state == TransferState::FINALIZING) {
                // Everything was queued; a closed channel stands in for the marker.
                complete(kv.first, t);
            } else {
                fail(kv.first, t, TransferError::CHANNEL_FAILURE,
                     std::string("channel ") + channel_state_to_string(cs));
            }
            continue;
        }
        if (t.state == TransferState::PENDING && cs == ChannelState::OPEN) {
            const std::string meta = channel_msg::encode_metadata(t.transfer.name, t.total_size,
                                                                  t.transfer.mime_type);
            if (t.transfer.channel->sendText(meta)) {
                t.state = TransferState::SENDING;
                t.start_time = now;
            }
        }
    }

    // Active set: sending, open, below the ceiling.
    std::vector<std::map<TransferKey, ActiveTransfer>::iterator> active;
    for (auto it = m_transfers.begin(); it != m_transfers.end(); ++it) {
        ActiveTransfer& t = it->second;
        if (t.state == TransferState::SENDING && t.transfer.channel->isOpen() &&
            t.transfer.channel->bufferedAmount() < m_config.max_buffer_bytes) {
            active.push_back(it);
        }
    }
    if (!active.empty()) {
        const int per_transfer = std::max(1, m_config.chunks_per_tick / static_cast<int>(active.size()));
        for (auto& it : active) {
            sendChunks(it->first, it->second, per_transfer);
        }
    }

    for (auto& kv : m_transfers) {
        if (kv.second.state == TransferState::FINALIZING) {
            tryFinalize(kv.first, kv.second, now);
        }
    }

    for (auto it = m_transfers.begin(); it != m_transfers.end();) {
        if (it->second.state == TransferState::COMPLETED || it->second.state == TransferState::FAILED) {
            it = m_transfers.erase(it);
        } else {
            ++it;
        }
    }
    m_active_count = m_transfers.size();
}

void TransferScheduler::sendChunks(const TransferKey& key, ActiveTransfer& t, int budget) {
    DataChannel& channel = *t.transfer.channel;
    const uint64_t offset_before = t.offset;
    Telemetry& telemetry = Telemetry::getInstance();

    for (int i = 0; i < budget && t.offset < t.total_size; ++i) {
        if (channel.bufferedAmount() >= m_config.max_buffer_bytes) {
            break;
        }
        const size_t len = static_cast<size_t>(std::min<uint64_t>(m_config.chunk_size, t.total_size - t.offset));
        std::string chunk;
        if (!t.transfer.source->read(t.offset, len, &chunk) || chunk.size() != len) {
            fail(key, t, TransferError::SOURCE_UNREADABLE,
                 "cannot read " + std::to_string(len) + " bytes at offset " + std::to_string(t.offset));
            return;
        }
        if (!channel.sendBinary(chunk)) {
            // Buffer full; this transfer's turn ends, retried next tick.
            break;
        }
        t.offset += len;
        t.chunks_sent++;
        telemetry.inc_counter("chunks_sent");
        telemetry.inc_counter("bytes_sent", static_cast<int64_t>(len));
    }

    if (t.offset != offset_before && t.transfer.on_progress) {
        t.transfer.on_progress(key, t.offset, t.total_size);
    }
    if (t.offset >= t.total_size) {
        t.state = TransferState::FINALIZING;
        LOG_DEBUG("SCHED: All " + std::to_string(t.chunks_sent) + " chunks queued for " + key.toString());
    }
}

bool TransferScheduler::tryFinalize(const TransferKey& key, ActiveTransfer& t,
                                    std::chrono::steady_clock::time_point now) {
    if (now < t.next_marker_check) {
        return false;
    }
    DataChannel& channel = *t.transfer.channel;
    if (channel.isTerminated()) {
        complete(key, t);
        return true;
    }
    if (channel.bufferedAmount() < m_config.completion_drain_threshold &&
        channel.sendText(channel_msg::encode_complete())) {
        complete(key, t);
        return true;
    }
    t.next_marker_check = now + m_config.completion_backoff;
    return false;
}

void TransferScheduler::complete(const TransferKey& key, ActiveTransfer& t) {
    t.state = TransferState::COMPLETED;

    TransferStats stats;
    stats.bytes = t.offset;
    stats.chunks = t.chunks_sent;
    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t.start_time);

    LOG_INFO("SCHED: Transfer complete: " + key.toString() + " (" + std::to_string(stats.bytes) + " bytes in " +
             std::to_string(stats.elapsed.count()) + "ms, " + format_mbps(stats.megabytesPerSecond()) + " MB/s)");

    Telemetry& telemetry = Telemetry::getInstance();
    telemetry.inc_counter("transfers_completed");
    telemetry.observe_hist_ms("transfer_duration_ms", stats.elapsed.count());

    if (t.transfer.on_complete) {
        t.transfer.on_complete(key, stats);
    }
}

void TransferScheduler::fail(const TransferKey& key, ActiveTransfer& t, TransferError error,
                             const std::string& message) {
    t.state = TransferState::FAILED;
    LOG_WARN("SCHED: Transfer " + key.toString() + " failed (" + transfer_error_to_string(error) + "): " + message);
    Telemetry::getInstance().inc_counter("transfers_failed");
    if (t.transfer.on_failed) {
        t.transfer.on_failed(key, error, message);
    }
}
