#ifndef SIGNALING_TRANSPORT_H
#define SIGNALING_TRANSPORT_H

#include "transport_events.h"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

enum class DeliveryMode {
    POLL,   // the agent drives poll() on an interval
    PUSH    // events arrive through the event handler as they happen
};

inline const char* delivery_mode_to_string(DeliveryMode mode) {
    return mode == DeliveryMode::PUSH ? "push" : "poll";
}

struct JoinReply {
    std::vector<FileDescriptor> files;
    uint64_t files_version = 0;
    std::string host_id;
};

/**
 * Peer-side view of the coordinator. Room lifecycle calls are synchronous on
 * every transport; relayed signals and room changes arrive as TransportEvents,
 * either from poll() or from the event handler, depending on mode().
 *
 * After hostRoom()/joinRoom() succeed, the transport remembers the room and
 * the peer's role; every later call is scoped to it.
 */
class SignalingTransport {
public:
    using EventHandler = std::function<void(const TransportEvent&)>;

    virtual ~SignalingTransport() = default;

    virtual DeliveryMode mode() const = 0;

    virtual bool connect(const std::string& peerId, std::string* error) = 0;
    virtual void disconnect() = 0;

    virtual bool createRoom(std::string* roomId, std::string* error) = 0;
    virtual bool hostRoom(const std::string& roomId, std::string* error) = 0;
    virtual bool joinRoom(const std::string& roomId, JoinReply* reply, std::string* error) = 0;

    virtual bool updateFiles(const std::vector<FileDescriptor>& files, std::string* error) = 0;
    virtual bool sendSignal(const std::string& toId, SignalKind kind, const OpaquePayload& payload,
                            const std::string& fileId, std::string* error) = 0;
    virtual bool requestFile(const std::string& fileId, std::string* error) = 0;
    virtual bool downloadComplete(const std::string& fileId, std::string* error) = 0;

    // Liveness refresh for the current role.
    virtual bool heartbeat(std::string* error) = 0;

    // POLL: fetch and convert everything queued for this peer. PUSH: no-op.
    virtual bool poll(std::vector<TransportEvent>* events, std::string* error) = 0;

    // Host closes its room, client leaves it. Never fails from the caller's view.
    virtual void leave() = 0;

    void setEventHandler(EventHandler handler) {
        std::lock_guard<std::mutex> lock(m_handler_mutex);
        m_on_event = std::move(handler);
    }

protected:
    void emitEvent(const TransportEvent& event) {
        EventHandler handler;
        {
            std::lock_guard<std::mutex> lock(m_handler_mutex);
            handler = m_on_event;
        }
        if (handler) handler(event);
    }

private:
    std::mutex m_handler_mutex;
    EventHandler m_on_event;
};

#endif // SIGNALING_TRANSPORT_H
