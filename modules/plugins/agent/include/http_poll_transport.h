#ifndef HTTP_POLL_TRANSPORT_H
#define HTTP_POLL_TRANSPORT_H

#include "server_endpoint.h"
#include "signaling_transport.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <string>

/**
 * Poll transport over the coordinator's REST routes. Each call is one
 * short-lived HTTP/1.1 request bounded by the request timeout.
 */
class HttpPollTransport : public SignalingTransport {
public:
    HttpPollTransport(ServerEndpoint server, std::chrono::milliseconds request_timeout);

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
    using json = nlohmann::json;

    struct Reply {
        int status = 0;
        json body;
    };

    // Transport-level failure (connect, timeout) returns false. Any HTTP
    // status returns true with the status in reply.
    bool request(const std::string& method, const std::string& target, const json* body, Reply* reply,
                 std::string* error) const;
    // request() plus "2xx or fail with the body's error text".
    bool call(const std::string& method, const std::string& target, const json* body, Reply* reply,
              std::string* error) const;

    bool currentRoom(std::string* roomId, std::string* peerId, bool* isHost, std::string* error) const;
    static std::string roomPath(const std::string& roomId);

    ServerEndpoint m_server;
    std::chrono::milliseconds m_timeout;

    mutable std::mutex m_mutex;
    std::string m_peer_id;
    std::string m_room_id;
    bool m_is_host = false;
};

#endif // HTTP_POLL_TRANSPORT_H
