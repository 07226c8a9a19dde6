#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include "channel_negotiator.h"
#include "data_channel.h"
#include "file_sink.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Shared fakes for the standalone test executables.

static inline bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

/**
 * In-memory DataChannel. Records everything sent; when linked to a peer,
 * each send is delivered synchronously to the peer's handlers.
 */
class FakeDataChannel : public DataChannel {
public:
    struct Sent {
        bool text = false;
        std::string data;
    };

    explicit FakeDataChannel(ChannelState initial = ChannelState::OPEN) : m_state(initial) {}

    static void link(const std::shared_ptr<FakeDataChannel>& a, const std::shared_ptr<FakeDataChannel>& b) {
        a->m_peer = b;
        b->m_peer = a;
    }

    ChannelState state() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }
    size_t bufferedAmount() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_buffered;
    }

    bool sendBinary(const std::string& bytes) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_state != ChannelState::OPEN || m_refuse_binary) return false;
            m_sent.push_back(Sent{false, bytes});
            if (m_accumulate) m_buffered += bytes.size();
        }
        if (auto peer = m_peer.lock()) peer->emitBinary(bytes);
        return true;
    }

    bool sendText(const std::string& text) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_state != ChannelState::OPEN) return false;
            m_sent.push_back(Sent{true, text});
        }
        if (auto peer = m_peer.lock()) peer->emitText(text);
        return true;
    }

    void close() override {
        if (!setStateSilently(ChannelState::CLOSED)) return;
        emitState(ChannelState::CLOSED);
        if (auto peer = m_peer.lock()) {
            if (peer->setStateSilently(ChannelState::CLOSED)) {
                peer->emitState(ChannelState::CLOSED);
            }
        }
    }

    // Test controls
    void setState(ChannelState state) {
        if (setStateSilently(state)) emitState(state);
    }
    void setBuffered(size_t bytes) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_buffered = bytes;
    }
    // Every accepted chunk adds to bufferedAmount() until drained.
    void setAccumulate(bool on) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_accumulate = on;
    }
    void setRefuseBinary(bool on) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_refuse_binary = on;
    }

    std::vector<Sent> sent() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sent;
    }
    size_t binaryCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t n = 0;
        for (const auto& s : m_sent) {
            if (!s.text) ++n;
        }
        return n;
    }
    std::string binaryBytes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::string out;
        for (const auto& s : m_sent) {
            if (!s.text) out += s.data;
        }
        return out;
    }
    std::vector<std::string> texts() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> out;
        for (const auto& s : m_sent) {
            if (s.text) out.push_back(s.data);
        }
        return out;
    }

    // Inject inbound traffic as if the remote end had sent it.
    void deliverText(const std::string& text) { emitText(text); }
    void deliverBinary(const std::string& bytes) { emitBinary(bytes); }

private:
    bool setStateSilently(ChannelState state) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == state) return false;
        m_state = state;
        return true;
    }

    mutable std::mutex m_mutex;
    ChannelState m_state;
    size_t m_buffered = 0;
    bool m_accumulate = false;
    bool m_refuse_binary = false;
    std::vector<Sent> m_sent;
    std::weak_ptr<FakeDataChannel> m_peer;
};

/**
 * Negotiator pair that opens linked FakeDataChannels, driven entirely by the
 * relayed signals. Both peers' negotiators share one hub.
 *
 * Host initiate() -> OFFER {token}. Client OFFER -> channel open, ANSWER.
 * Host ANSWER -> channel open.
 */
class LoopbackNegotiator : public ChannelNegotiator {
public:
    struct Hub {
        std::mutex mutex;
        int next_token = 1;
        std::map<std::string, std::shared_ptr<FakeDataChannel>> client_ends;
    };

    explicit LoopbackNegotiator(std::shared_ptr<Hub> hub) : m_hub(std::move(hub)) {}

    void initiate(const TransferKey& key, Callbacks callbacks) override {
        auto host_end = std::make_shared<FakeDataChannel>(ChannelState::CONNECTING);
        auto client_end = std::make_shared<FakeDataChannel>(ChannelState::CONNECTING);
        FakeDataChannel::link(host_end, client_end);

        std::string token;
        {
            std::lock_guard<std::mutex> lock(m_hub->mutex);
            token = "loop-" + std::to_string(m_hub->next_token++);
            m_hub->client_ends[token] = client_end;
        }
        const EmitSignal emit = callbacks.emit;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            Entry entry;
            entry.channel = host_end;
            entry.callbacks = std::move(callbacks);
            m_entries[key] = std::move(entry);
            m_initiated++;
        }
        if (emit) emit(SignalKind::OFFER, token);
    }

    void handleSignal(const TransferKey& key, SignalKind kind, const OpaquePayload& payload,
                      Callbacks callbacks) override {
        if (kind == SignalKind::OFFER) {
            std::shared_ptr<FakeDataChannel> client_end;
            {
                std::lock_guard<std::mutex> lock(m_hub->mutex);
                auto it = m_hub->client_ends.find(payload);
                if (it != m_hub->client_ends.end()) {
                    client_end = it->second;
                    m_hub->client_ends.erase(it);
                }
            }
            if (!client_end) {
                if (callbacks.on_failed) callbacks.on_failed("unknown offer token");
                return;
            }
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                Entry entry;
                entry.channel = client_end;
                m_entries[key] = entry;
            }
            if (callbacks.on_open) callbacks.on_open(client_end);
            client_end->setState(ChannelState::OPEN);
            if (callbacks.emit) callbacks.emit(SignalKind::ANSWER, "accepted");
            return;
        }
        if (kind == SignalKind::ANSWER) {
            Entry entry;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_entries.find(key);
                if (it == m_entries.end() || it->second.opened) return;
                it->second.opened = true;
                entry = it->second;
            }
            entry.channel->setState(ChannelState::OPEN);
            if (entry.callbacks.on_open) entry.callbacks.on_open(entry.channel);
        }
    }

    void close(const TransferKey& key) override {
        std::shared_ptr<FakeDataChannel> channel;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_entries.find(key);
            if (it == m_entries.end()) return;
            channel = it->second.channel;
            m_entries.erase(it);
        }
        channel->close();
    }

    void closeAll() override {
        std::map<TransferKey, Entry> entries;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            entries.swap(m_entries);
        }
        for (auto& kv : entries) {
            kv.second.channel->close();
        }
    }

    int initiatedCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_initiated;
    }

private:
    struct Entry {
        std::shared_ptr<FakeDataChannel> channel;
        Callbacks callbacks;
        bool opened = false;
    };

    std::shared_ptr<Hub> m_hub;
    mutable std::mutex m_mutex;
    std::map<TransferKey, Entry> m_entries;
    int m_initiated = 0;
};

// Keeps every delivered file; can be told to refuse.
class MemoryFileSink : public FileSink {
public:
    bool deliver(const ReceivedFile& file, std::string* error) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_refuse) {
            if (error) *error = "sink refused";
            return false;
        }
        m_files.push_back(file);
        return true;
    }

    void setRefuse(bool refuse) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_refuse = refuse;
    }
    std::vector<ReceivedFile> files() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_files;
    }

private:
    mutable std::mutex m_mutex;
    bool m_refuse = false;
    std::vector<ReceivedFile> m_files;
};

#endif // TEST_SUPPORT_H
