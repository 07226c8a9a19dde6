#ifndef WS_PUSH_TRANSPORT_H
#define WS_PUSH_TRANSPORT_H

#include "server_endpoint.h"
#include "signaling_transport.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

/**
 * Push transport: one WebSocket to the coordinator carrying {event, data}
 * frames. Room lifecycle calls wait for their reply frame; everything else
 * the coordinator pushes is raised through the event handler on the
 * transport's io thread.
 *
 * Event handlers must not call createRoom/hostRoom/joinRoom: those wait for
 * a frame that only the io thread can read.
 */
class WsPushTransport : public SignalingTransport {
public:
    WsPushTransport(ServerEndpoint server, std::chrono::milliseconds request_timeout);
    ~WsPushTransport() override;

    WsPushTransport(const WsPushTransport&) = delete;
    WsPushTransport& operator=(const WsPushTransport&) = delete;

    DeliveryMode mode() const override { return DeliveryMode::PUSH; }

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

    bool isConnected() const;

private:
    using json = nlohmann::json;
    using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    bool send(const std::string& event, const json& data, std::string* error);
    bool awaitReply(const std::string& event, const json& data, const std::set<std::string>& expected,
                    json* reply, std::string* error);

    void doRead();
    void doWrite();
    void finishClose();
    void onFrame(const std::string& text);
    void onConnectionLost(const std::string& reason);

    ServerEndpoint m_server;
    std::chrono::milliseconds m_timeout;

    boost::asio::io_context m_ioc;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> m_work;
    std::unique_ptr<WebSocket> m_ws;
    std::thread m_thread;

    // io-thread owned
    boost::beast::flat_buffer m_read_buffer;
    std::deque<std::string> m_write_queue;
    bool m_close_requested = false;
    bool m_closing = false;
    std::shared_ptr<std::promise<void>> m_close_done;

    // Request / reply rendezvous; one outstanding lifecycle call at a time.
    std::mutex m_call_mutex;
    mutable std::mutex m_state_mutex;
    std::condition_variable m_reply_cv;
    std::set<std::string> m_expected;
    bool m_has_reply = false;
    std::string m_reply_event;
    json m_reply_data;
    bool m_connected = false;

    std::string m_peer_id;
    std::string m_room_id;
    bool m_is_host = false;
};

#endif // WS_PUSH_TRANSPORT_H
