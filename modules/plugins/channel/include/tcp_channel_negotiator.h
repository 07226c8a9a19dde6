#ifndef TCP_CHANNEL_NEGOTIATOR_H
#define TCP_CHANNEL_NEGOTIATOR_H

#include "channel_negotiator.h"
#include "tcp_data_channel.h"

#include <boost/asio.hpp>

#include <map>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/**
 * Direct TCP channels negotiated over the relayed signals.
 *
 * Host:   initiate() -> offer {transport:"tcp", host, port, token}, one
 *         ice-candidate {host, port} per extra advertised host. The channel
 *         opens when a connection presents the token.
 * Client: offer -> connect through the candidates in order, send HELLO with
 *         the token, answer {accepted:true}. A failed negotiation answers
 *         {accepted:false, reason}.
 *
 * All negotiation state lives on the negotiator's io thread.
 */
class TcpChannelNegotiator : public ChannelNegotiator {
public:
    explicit TcpChannelNegotiator(ChannelConfig config = ChannelConfig());
    ~TcpChannelNegotiator() override;

    TcpChannelNegotiator(const TcpChannelNegotiator&) = delete;
    TcpChannelNegotiator& operator=(const TcpChannelNegotiator&) = delete;

    // Binds an ephemeral listening port and starts the io thread.
    bool start(std::string* error = nullptr);
    void stop();
    bool isRunning() const { return m_running; }
    unsigned short listenPort() const { return m_port; }

    void initiate(const TransferKey& key, Callbacks callbacks) override;
    void handleSignal(const TransferKey& key, SignalKind kind, const OpaquePayload& payload,
                      Callbacks callbacks) override;
    void close(const TransferKey& key) override;
    void closeAll() override;

private:
    using tcp = boost::asio::ip::tcp;
    using Candidate = std::pair<std::string, unsigned short>;

    struct Pending {
        bool host_side = false;
        Callbacks callbacks;
        std::string token;
        std::vector<Candidate> candidates;
        size_t next_candidate = 0;
        bool connecting = false;
        std::shared_ptr<boost::asio::steady_timer> timer;
        std::shared_ptr<tcp::socket> socket;
    };

    void doAccept();
    void readHello(std::shared_ptr<tcp::socket> socket);
    void onHello(std::shared_ptr<tcp::socket> socket, const std::string& token);

    void handleOffer(const TransferKey& key, const OpaquePayload& payload, Callbacks callbacks);
    void handleCandidate(const TransferKey& key, const OpaquePayload& payload);
    void handleAnswer(const TransferKey& key, const OpaquePayload& payload);
    void tryNextCandidate(const TransferKey& key);
    void sendHello(const TransferKey& key, std::shared_ptr<tcp::socket> socket);

    void armTimeout(const TransferKey& key, Pending& pending);
    void openChannel(const TransferKey& key, Pending pending, std::shared_ptr<tcp::socket> socket);
    void failPending(const TransferKey& key, const std::string& reason, bool answer);
    void dropPending(Pending& pending);
    void closeEverything();

    ChannelConfig m_config;
    std::shared_ptr<boost::asio::io_context> m_io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_work;
    tcp::acceptor m_acceptor;
    std::thread m_thread;
    bool m_running = false;
    unsigned short m_port = 0;

    // io-thread owned
    std::map<TransferKey, Pending> m_pending;
    std::map<TransferKey, std::weak_ptr<TcpDataChannel>> m_open;
};

#endif // TCP_CHANNEL_NEGOTIATOR_H
