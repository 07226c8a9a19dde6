#include "transfer_receiver.h"
#include "channel_messages.h"
#include "config_manager.h"
#include "logger.h"
#include "telemetry.h"

#include <algorithm>
#include <cstdio>

namespace {

std::string format_fixed(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

double to_megabytes(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

} // namespace

ReceiverConfig ReceiverConfig::fromConfigManager() {
    ReceiverConfig cfg;
    cfg.accept_short_complete = ConfigManager::getInstance().acceptShortComplete();
    return cfg;
}

TransferReceiver::TransferReceiver(ReceiverConfig config, std::shared_ptr<FileSink> sink)
    : m_config(config), m_sink(std::move(sink)) {}

void TransferReceiver::setProgressCallback(ReceiveProgressCallback cb) {
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_on_progress = std::move(cb);
}

void TransferReceiver::setCompleteCallback(ReceiveCompleteCallback cb) {
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_on_complete = std::move(cb);
}

void TransferReceiver::setFailedCallback(ReceiveFailedCallback cb) {
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_on_failed = std::move(cb);
}

void TransferReceiver::setDownloadEndedCallback(DownloadEndedCallback cb) {
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_on_download_ended = std::move(cb);
}

void TransferReceiver::begin(const TransferKey& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_buffers[key] = ReceiveBuffer();
    LOG_DEBUG("RECV: Buffer ready for " + key.toString());
}

void TransferReceiver::onText(const TransferKey& key, const std::string& text) {
    channel_msg::ControlMessage msg;
    std::string error;
    if (!channel_msg::decode_control(text, &msg, &error)) {
        fail(key, TransferError::PROTOCOL, error);
        return;
    }

    if (msg.kind == channel_msg::ControlMessage::Kind::METADATA) {
        std::lock_guard<std::mutex> lock(m_mutex);
        ReceiveBuffer& buffer = m_buffers[key];
        buffer.has_metadata = true;
        buffer.name = msg.name;
        buffer.mime_type = msg.mime_type.empty() ? channel_msg::kDefaultMimeType : msg.mime_type;
        buffer.declared_size = msg.size;
        buffer.start_time = std::chrono::steady_clock::now();
        LOG_INFO("RECV: Receiving " + buffer.name + " (" + format_fixed(to_megabytes(msg.size)) + " MB) from " +
                 key.peer_id);
        return;
    }

    ReceiveBuffer buffer;
    if (!takeBuffer(key, &buffer)) {
        LOG_DEBUG("RECV: Completion marker for unknown transfer " + key.toString());
        return;
    }
    if (!buffer.has_metadata) {
        LOG_WARN("RECV: Completion marker without metadata for " + key.toString());
        reportFailure(key, TransferError::MISSING_METADATA, "completion marker without metadata");
        return;
    }
    if (buffer.received_size < buffer.declared_size && !m_config.accept_short_complete) {
        const std::string message = "received " + std::to_string(buffer.received_size) + " of " +
                                    std::to_string(buffer.declared_size) + " bytes";
        LOG_WARN("RECV: Short transfer " + key.toString() + ": " + message);
        reportFailure(key, TransferError::TRUNCATED, message);
        return;
    }
    finish(key, std::move(buffer));
}

void TransferReceiver::onBinary(const TransferKey& key, const std::string& bytes) {
    uint64_t received = 0;
    uint64_t declared = 0;
    bool report = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_buffers.find(key);
        if (it == m_buffers.end()) {
            LOG_DEBUG("RECV: Dropping chunk for unknown transfer " + key.toString());
            return;
        }
        ReceiveBuffer& buffer = it->second;
        buffer.chunks.push_back(bytes);
        buffer.received_size += bytes.size();
        received = buffer.received_size;
        declared = buffer.declared_size;
        report = buffer.has_metadata;
    }

    if (!report) return;

    ReceiveProgressCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        cb = m_on_progress;
    }
    if (cb) {
        const double percent = declared == 0
            ? 100.0
            : std::min(100.0, static_cast<double>(received) * 100.0 / static_cast<double>(declared));
        cb(key, received, declared, percent);
    }
}

void TransferReceiver::onChannelState(const TransferKey& key, ChannelState state) {
    if (state != ChannelState::CLOSED && state != ChannelState::FAILED) {
        return;
    }
    // Buffers already completed are gone, so a normal close after the marker is a no-op.
    fail(key, TransferError::CHANNEL_FAILURE,
         std::string("channel ") + channel_state_to_string(state) + " before completion");
}

void TransferReceiver::cancel(const TransferKey& key) {
    ReceiveBuffer buffer;
    if (!takeBuffer(key, &buffer)) return;
    LOG_INFO("RECV: Cancelled " + key.toString());
    notifyEnded(key);
}

void TransferReceiver::cancelPeer(const std::string& peer_id) {
    std::vector<TransferKey> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_buffers.begin(); it != m_buffers.end();) {
            if (it->first.peer_id == peer_id) {
                dropped.push_back(it->first);
                it = m_buffers.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& key : dropped) {
        LOG_INFO("RECV: Cancelled " + key.toString() + " (peer gone)");
        notifyEnded(key);
    }
}

bool TransferReceiver::isActive(const TransferKey& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_buffers.count(key) > 0;
}

size_t TransferReceiver::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_buffers.size();
}

bool TransferReceiver::takeBuffer(const TransferKey& key, ReceiveBuffer* out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_buffers.find(key);
    if (it == m_buffers.end()) {
        return false;
    }
    *out = std::move(it->second);
    m_buffers.erase(it);
    return true;
}

void TransferReceiver::finish(const TransferKey& key, ReceiveBuffer buffer) {
    ReceivedFile file;
    file.key = key;
    file.name = buffer.name;
    file.mime_type = buffer.mime_type;
    file.declared_size = buffer.declared_size;
    file.bytes.reserve(static_cast<size_t>(buffer.received_size));
    for (const auto& chunk : buffer.chunks) {
        file.bytes.append(chunk);
    }
    buffer.chunks.clear();
    file.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - buffer.start_time);

    const double secs = static_cast<double>(file.elapsed.count()) / 1000.0;
    const double mb = to_megabytes(file.bytes.size());
    LOG_INFO("RECV: Complete: " + file.name + " - " + format_fixed(mb) + "MB in " + format_fixed(secs) + "s (" +
             format_fixed(secs > 0.0 ? mb / secs : 0.0) + " MB/s)");

    if (m_sink) {
        std::string error;
        if (!m_sink->deliver(file, &error)) {
            reportFailure(key, TransferError::SINK_FAILURE, error);
            return;
        }
    }

    Telemetry& telemetry = Telemetry::getInstance();
    telemetry.inc_counter("transfers_received");
    telemetry.inc_counter("bytes_received", static_cast<int64_t>(file.bytes.size()));

    notifyEnded(key);

    ReceiveCompleteCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        cb = m_on_complete;
    }
    if (cb) cb(file);
}

void TransferReceiver::fail(const TransferKey& key, TransferError error, const std::string& message) {
    ReceiveBuffer buffer;
    if (!takeBuffer(key, &buffer)) {
        LOG_DEBUG("RECV: Ignoring " + std::string(transfer_error_to_string(error)) + " for unknown transfer " +
                  key.toString());
        return;
    }
    reportFailure(key, error, message);
}

void TransferReceiver::reportFailure(const TransferKey& key, TransferError error, const std::string& message) {
    LOG_WARN("RECV: Transfer " + key.toString() + " failed (" + transfer_error_to_string(error) + "): " + message);
    Telemetry::getInstance().inc_counter("receives_failed");

    notifyEnded(key);

    ReceiveFailedCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        cb = m_on_failed;
    }
    if (cb) cb(key, error, message);
}

void TransferReceiver::notifyEnded(const TransferKey& key) {
    DownloadEndedCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        cb = m_on_download_ended;
    }
    if (cb) cb(key);
}
