#ifndef DATA_CHANNEL_H
#define DATA_CHANNEL_H

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

enum class ChannelState {
    CONNECTING,
    OPEN,
    CLOSING,
    CLOSED,
    FAILED
};

inline const char* channel_state_to_string(ChannelState state) {
    switch (state) {
        case ChannelState::CONNECTING: return "CONNECTING";
        case ChannelState::OPEN: return "OPEN";
        case ChannelState::CLOSING: return "CLOSING";
        case ChannelState::CLOSED: return "CLOSED";
        case ChannelState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * Ordered, reliable, message-oriented channel to one remote peer.
 *
 * Sends never block: bytes are queued and bufferedAmount() reports how many
 * are still waiting to leave. sendBinary() refuses (returns false) instead of
 * queueing past the implementation's limit.
 */
class DataChannel {
public:
    using TextHandler = std::function<void(const std::string&)>;
    using BinaryHandler = std::function<void(const std::string&)>;
    using StateHandler = std::function<void(ChannelState)>;

    virtual ~DataChannel() = default;

    virtual ChannelState state() const = 0;
    virtual size_t bufferedAmount() const = 0;
    virtual bool sendBinary(const std::string& bytes) = 0;
    virtual bool sendText(const std::string& text) = 0;
    virtual void close() = 0;

    void setTextHandler(TextHandler handler) {
        std::lock_guard<std::mutex> lock(m_handler_mutex);
        m_on_text = std::move(handler);
    }
    void setBinaryHandler(BinaryHandler handler) {
        std::lock_guard<std::mutex> lock(m_handler_mutex);
        m_on_binary = std::move(handler);
    }
    void setStateHandler(StateHandler handler) {
        std::lock_guard<std::mutex> lock(m_handler_mutex);
        m_on_state = std::move(handler);
    }

    bool isOpen() const { return state() == ChannelState::OPEN; }
    bool isTerminated() const {
        const ChannelState s = state();
        return s == ChannelState::CLOSED || s == ChannelState::FAILED;
    }

protected:
    void emitText(const std::string& text) {
        TextHandler handler;
        {
            std::lock_guard<std::mutex> lock(m_handler_mutex);
            handler = m_on_text;
        }
        if (handler) handler(text);
    }
    void emitBinary(const std::string& bytes) {
        BinaryHandler handler;
        {
            std::lock_guard<std::mutex> lock(m_handler_mutex);
            handler = m_on_binary;
        }
        if (handler) handler(bytes);
    }
    void emitState(ChannelState state) {
        StateHandler handler;
        {
            std::lock_guard<std::mutex> lock(m_handler_mutex);
            handler = m_on_state;
        }
        if (handler) handler(state);
    }

private:
    std::mutex m_handler_mutex;
    TextHandler m_on_text;
    BinaryHandler m_on_binary;
    StateHandler m_on_state;
};

#endif // DATA_CHANNEL_H
