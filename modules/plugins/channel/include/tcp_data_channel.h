#ifndef TCP_DATA_CHANNEL_H
#define TCP_DATA_CHANNEL_H

#include "data_channel.h"
#include "message_types.h"
#include "wire_codec.h"

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <deque>
#include <memory>
#include <string>

/**
 * DataChannel over one TCP connection, framed with the 5-byte wire header.
 *
 * All socket work runs on a strand. Sends are queued from any thread;
 * bufferedAmount() counts payload bytes queued but not yet written.
 */
class TcpDataChannel : public DataChannel, public std::enable_shared_from_this<TcpDataChannel> {
public:
    using tcp = boost::asio::ip::tcp;

    TcpDataChannel(std::shared_ptr<boost::asio::io_context> io, tcp::socket socket, std::string label,
                   size_t send_queue_limit);

    // Moves to OPEN and starts reading. Install handlers before calling.
    void start();

    ChannelState state() const override { return m_state.load(); }
    size_t bufferedAmount() const override { return m_buffered.load(); }
    bool sendBinary(const std::string& bytes) override;
    bool sendText(const std::string& text) override;
    void close() override;

    const std::string& label() const { return m_label; }

private:
    bool enqueue(MessageType type, const std::string& payload, bool enforce_limit);
    void doWrite();
    void readHeader();
    void readBody(MessageType type);
    void finish(ChannelState final_state, const std::string& reason);
    bool transition(ChannelState next);
    bool finished() const;
    void releaseBuffered(size_t bytes);

    struct Outgoing {
        std::string frame;
        size_t payload_size = 0;
    };

    // Declared first: the socket must go before the context it belongs to.
    std::shared_ptr<boost::asio::io_context> m_io;
    tcp::socket m_socket;
    boost::asio::strand<boost::asio::io_context::executor_type> m_strand;

    std::string m_label;
    size_t m_send_queue_limit;

    std::atomic<ChannelState> m_state{ChannelState::CONNECTING};
    std::atomic<size_t> m_buffered{0};

    // Strand-owned
    std::deque<Outgoing> m_write_queue;
    bool m_close_after_flush = false;
    std::array<char, wire::kHeaderSize> m_header{};
    std::string m_body;
};

#endif // TCP_DATA_CHANNEL_H
