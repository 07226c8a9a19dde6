#ifndef LOCAL_TRANSPORT_H
#define LOCAL_TRANSPORT_H

#include "session_coordinator.h"
#include "signaling_transport.h"

#include <mutex>
#include <string>

/**
 * In-process transport straight over a coordinator instance. Behaves like
 * the HTTP poll transport without the network, which makes it the transport
 * of choice for tests and single-process demos.
 */
class LocalTransport : public SignalingTransport {
public:
    explicit LocalTransport(ISessionCoordinator& coordinator);

    DeliveryMode mode() const override { return DeliveryMode::POLL; }

    bool connect(const std::string& peerId, std::string* error) override;
    void disconnect() override;

    bool createRoom(std::string* roomId, std::string* error) override;
    bool hostRoom(const std::string& roomId, std::string* error) override;
    bool joinRoom(const std::string& roomId, JoinReply* reply, std::string* error) override;

    bool updateFiles(const std::vector<FileDescriptor>& files, std::string* error) override;
    bool sendSignal(const std::string& toId, SignalKind kind, const OpaquePayload& payload,
                    const std::string& fileId, std::string* error) override;
    bool requestFile(const std::string& fileId, std::string* error) override;
    bool downloadComplete(const std::string& fileId, std::string* error) override;

    bool heartbeat(std::string* error) override;
    bool poll(std::vector<TransportEvent>* events, std::string* error) override;
    void leave() override;

private:
    bool currentRoom(std::string* roomId, std::string* peerId, bool* isHost, std::string* error) const;

    ISessionCoordinator& m_coordinator;

    mutable std::mutex m_mutex;
    std::string m_peer_id;
    std::string m_room_id;
    bool m_is_host = false;
};

#endif // LOCAL_TRANSPORT_H
