#include "tcp_data_channel.h"
#include "logger.h"

#include <utility>

TcpDataChannel::TcpDataChannel(std::shared_ptr<boost::asio::io_context> io, tcp::socket socket, std::string label,
                               size_t send_queue_limit)
    : m_io(std::move(io)),
      m_socket(std::move(socket)),
      m_strand(boost::asio::make_strand(*m_io)),
      m_label(std::move(label)),
      m_send_queue_limit(send_queue_limit) {}

void TcpDataChannel::start() {
    if (!transition(ChannelState::OPEN)) {
        return;
    }
    LOG_INFO("CHAN: Channel " + m_label + " open");
    emitState(ChannelState::OPEN);
    auto self = shared_from_this();
    boost::asio::post(m_strand, [self]() { self->readHeader(); });
}

bool TcpDataChannel::sendBinary(const std::string& bytes) {
    return enqueue(MessageType::CHANNEL_BINARY, bytes, true);
}

bool TcpDataChannel::sendText(const std::string& text) {
    return enqueue(MessageType::CHANNEL_TEXT, text, false);
}

void TcpDataChannel::close() {
    if (!transition(ChannelState::CLOSING)) {
        return;
    }
    emitState(ChannelState::CLOSING);
    auto self = shared_from_this();
    boost::asio::post(m_strand, [self]() {
        if (self->finished()) return;
        self->m_close_after_flush = true;
        const bool idle = self->m_write_queue.empty();
        self->m_write_queue.push_back(Outgoing{wire::encode_message(MessageType::CHANNEL_CLOSE, {}), 0});
        if (idle) self->doWrite();
    });
}

bool TcpDataChannel::enqueue(MessageType type, const std::string& payload, bool enforce_limit) {
    if (m_state.load() != ChannelState::OPEN) {
        return false;
    }
    if (payload.size() > wire::kMaxMessageSize) {
        LOG_WARN("CHAN: Refusing " + std::to_string(payload.size()) + " byte message on " + m_label);
        return false;
    }
    if (enforce_limit && m_buffered.load() + payload.size() > m_send_queue_limit) {
        return false;
    }

    m_buffered += payload.size();
    Outgoing out{wire::encode_message(type, payload), payload.size()};
    auto self = shared_from_this();
    boost::asio::post(m_strand, [self, out = std::move(out)]() mutable {
        if (self->finished()) {
            self->releaseBuffered(out.payload_size);
            return;
        }
        const bool idle = self->m_write_queue.empty();
        self->m_write_queue.push_back(std::move(out));
        if (idle) self->doWrite();
    });
    return true;
}

void TcpDataChannel::doWrite() {
    if (m_write_queue.empty()) return;

    auto self = shared_from_this();
    boost::asio::async_write(m_socket, boost::asio::buffer(m_write_queue.front().frame),
        boost::asio::bind_executor(m_strand, [self](const boost::system::error_code& ec, std::size_t) {
            // finish() may have run between this write completing and its handler.
            if (self->finished() || self->m_write_queue.empty()) {
                return;
            }
            if (ec) {
                self->finish(ChannelState::FAILED, "write failed: " + ec.message());
                return;
            }
            self->releaseBuffered(self->m_write_queue.front().payload_size);
            self->m_write_queue.pop_front();
            if (!self->m_write_queue.empty()) {
                self->doWrite();
            } else if (self->m_close_after_flush) {
                self->finish(ChannelState::CLOSED, "closed locally");
            }
        }));
}

void TcpDataChannel::readHeader() {
    auto self = shared_from_this();
    boost::asio::async_read(m_socket, boost::asio::buffer(m_header),
        boost::asio::bind_executor(m_strand, [self](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                if (ec == boost::asio::error::eof && self->state() == ChannelState::CLOSING) {
                    self->finish(ChannelState::CLOSED, "closed");
                } else {
                    self->finish(ChannelState::FAILED, "read failed: " + ec.message());
                }
                return;
            }
            MessageType type;
            uint32_t length = 0;
            if (!wire::decode_header(std::string_view(self->m_header.data(), self->m_header.size()), type, length)) {
                self->finish(ChannelState::FAILED, "malformed frame header");
                return;
            }
            self->m_body.assign(length, '\0');
            self->readBody(type);
        }));
}

void TcpDataChannel::readBody(MessageType type) {
    auto self = shared_from_this();
    auto handle = [self, type](const boost::system::error_code& ec, std::size_t) {
        if (ec) {
            self->finish(ChannelState::FAILED, "read failed: " + ec.message());
            return;
        }
        switch (type) {
            case MessageType::CHANNEL_TEXT:
                self->emitText(self->m_body);
                break;
            case MessageType::CHANNEL_BINARY:
                self->emitBinary(self->m_body);
                break;
            case MessageType::CHANNEL_CLOSE:
                self->finish(ChannelState::CLOSED, "closed by peer");
                return;
            case MessageType::CHANNEL_HELLO:
                LOG_WARN("CHAN: Unexpected hello on open channel " + self->m_label);
                break;
        }
        self->readHeader();
    };

    if (m_body.empty()) {
        boost::asio::post(m_strand, [handle]() { handle(boost::system::error_code(), 0); });
        return;
    }
    boost::asio::async_read(m_socket, boost::asio::buffer(m_body), boost::asio::bind_executor(m_strand, handle));
}

void TcpDataChannel::finish(ChannelState final_state, const std::string& reason) {
    if (!transition(final_state)) {
        return;
    }
    boost::system::error_code ignored;
    m_socket.shutdown(tcp::socket::shutdown_both, ignored);
    m_socket.close(ignored);
    m_write_queue.clear();
    m_buffered = 0;

    if (final_state == ChannelState::FAILED) {
        LOG_WARN("CHAN: Channel " + m_label + " failed: " + reason);
    } else {
        LOG_INFO("CHAN: Channel " + m_label + " " + reason);
    }
    emitState(final_state);
}

bool TcpDataChannel::finished() const {
    const ChannelState current = m_state.load();
    return current == ChannelState::CLOSED || current == ChannelState::FAILED;
}

void TcpDataChannel::releaseBuffered(size_t bytes) {
    size_t current = m_buffered.load();
    while (!m_buffered.compare_exchange_weak(current, current > bytes ? current - bytes : 0)) {
    }
}

bool TcpDataChannel::transition(ChannelState next) {
    ChannelState current = m_state.load();
    for (;;) {
        if (current == ChannelState::CLOSED || current == ChannelState::FAILED || current == next) {
            return false;
        }
        if (next == ChannelState::CLOSING && current != ChannelState::OPEN) {
            return false;
        }
        if (m_state.compare_exchange_weak(current, next)) {
            return true;
        }
    }
}
