#ifndef TRANSFER_RECEIVER_H
#define TRANSFER_RECEIVER_H

#include "data_channel.h"
#include "file_sink.h"
#include "transfer_types.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * TRANSFER RECEIVER (receiver side)
 *
 * One ReceiveBuffer per (peer, file). Chunks are kept in receipt order (the
 * channel is ordered) and assembled only when the completion marker arrives.
 * Every terminal outcome, success or failure, discards the buffer and fires
 * the download-ended callback exactly once.
 */

using ReceiveProgressCallback = std::function<void(const TransferKey& key, uint64_t received, uint64_t declared, double percent)>;
using ReceiveCompleteCallback = std::function<void(const ReceivedFile& file)>;
using ReceiveFailedCallback = std::function<void(const TransferKey& key, TransferError error, const std::string& message)>;
using DownloadEndedCallback = std::function<void(const TransferKey& key)>;

struct ReceiverConfig {
    // A completion marker before the declared size arrived still delivers.
    bool accept_short_complete = false;

    static ReceiverConfig fromConfigManager();
};

class TransferReceiver {
public:
    TransferReceiver(ReceiverConfig config, std::shared_ptr<FileSink> sink);

    void setProgressCallback(ReceiveProgressCallback cb);
    void setCompleteCallback(ReceiveCompleteCallback cb);
    void setFailedCallback(ReceiveFailedCallback cb);
    void setDownloadEndedCallback(DownloadEndedCallback cb);

    /**
     * Create an empty buffer for a negotiation that just started.
     * A buffer already present under the key is reset.
     */
    void begin(const TransferKey& key);

    /**
     * Control message (metadata / complete) received on the key's channel.
     */
    void onText(const TransferKey& key, const std::string& text);

    /**
     * Data chunk received on the key's channel.
     */
    void onBinary(const TransferKey& key, const std::string& bytes);

    /**
     * Channel closed or failed before the completion marker: CHANNEL_FAILURE.
     */
    void onChannelState(const TransferKey& key, ChannelState state);

    // Drop silently (local cancel, peer gone); download-ended still fires.
    void cancel(const TransferKey& key);
    void cancelPeer(const std::string& peer_id);

    bool isActive(const TransferKey& key) const;
    size_t activeCount() const;

private:
    struct ReceiveBuffer {
        bool has_metadata = false;
        std::string name;
        std::string mime_type;
        uint64_t declared_size = 0;
        std::vector<std::string> chunks;
        uint64_t received_size = 0;
        std::chrono::steady_clock::time_point start_time;
    };

    void finish(const TransferKey& key, ReceiveBuffer buffer);
    void fail(const TransferKey& key, TransferError error, const std::string& message);
    void reportFailure(const TransferKey& key, TransferError error, const std::string& message);
    void notifyEnded(const TransferKey& key);
    bool takeBuffer(const TransferKey& key, ReceiveBuffer* out);

    ReceiverConfig m_config;
    std::shared_ptr<FileSink> m_sink;

    mutable std::mutex m_mutex;
    std::map<TransferKey, ReceiveBuffer> m_buffers;

    std::mutex m_callback_mutex;
    ReceiveProgressCallback m_on_progress;
    ReceiveCompleteCallback m_on_complete;
    ReceiveFailedCallback m_on_failed;
    DownloadEndedCallback m_on_download_ended;
};

#endif // TRANSFER_RECEIVER_H
