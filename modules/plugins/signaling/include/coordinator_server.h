#ifndef COORDINATOR_SERVER_H
#define COORDINATOR_SERVER_H

#include "poll_gateway.h"
#include "push_gateway.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief One listening port for both transports.
 *
 * Plain HTTP requests are answered by the PollGateway; requests carrying a
 * WebSocket upgrade are handed to the PushGateway as a long-lived connection.
 */
class CoordinatorServer {
public:
    CoordinatorServer(PollGateway& poll, PushGateway& push);
    ~CoordinatorServer();

    CoordinatorServer(const CoordinatorServer&) = delete;
    CoordinatorServer& operator=(const CoordinatorServer&) = delete;

    // port 0 binds an ephemeral port; see port().
    bool start(const std::string& address, uint16_t port, int io_threads, std::string* error = nullptr);
    void stop();

    bool isRunning() const { return m_running.load(); }
    uint16_t port() const { return m_port; }

private:
    void doAccept();

    PollGateway& m_poll;
    PushGateway& m_push;

    boost::asio::io_context m_ioc;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> m_acceptor;
    std::vector<std::thread> m_threads;
    std::atomic<bool> m_running{false};
    uint16_t m_port = 0;
};

#endif // COORDINATOR_SERVER_H
