#include "tcp_channel_negotiator.h"
#include "id_utils.h"
#include "logger.h"

#include <nlohmann/json.hpp>

#include <array>
#include <future>

using json = nlohmann::json;

namespace {

// Longest HELLO payload accepted; a token is 32 hex chars.
constexpr uint32_t kMaxTokenLength = 128;

json parse_payload(const OpaquePayload& payload) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return json();
    }
    return j;
}

std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

int port_field(const json& obj) {
    auto it = obj.find("port");
    if (it == obj.end() || !it->is_number_integer()) return -1;
    const int port = it->get<int>();
    return (port > 0 && port <= 65535) ? port : -1;
}

} // namespace

TcpChannelNegotiator::TcpChannelNegotiator(ChannelConfig config)
    : m_config(std::move(config)),
      m_io(std::make_shared<boost::asio::io_context>()),
      m_work(boost::asio::make_work_guard(*m_io)),
      m_acceptor(*m_io) {
    if (m_config.advertise_hosts.empty()) {
        m_config.advertise_hosts.push_back("127.0.0.1");
    }
}

TcpChannelNegotiator::~TcpChannelNegotiator() {
    stop();
}

bool TcpChannelNegotiator::start(std::string* error) {
    if (m_running) return true;

    boost::system::error_code ec;
    const tcp::endpoint endpoint(tcp::v4(), 0);
    m_acceptor.open(endpoint.protocol(), ec);
    if (!ec) m_acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) m_acceptor.bind(endpoint, ec);
    if (!ec) m_acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (!ec) m_port = m_acceptor.local_endpoint(ec).port();
    if (ec) {
        if (error) *error = "cannot listen for data channels: " + ec.message();
        LOG_ERROR("NEG: Cannot listen for data channels: " + ec.message());
        boost::system::error_code ignored;
        m_acceptor.close(ignored);
        return false;
    }

    m_running = true;
    doAccept();
    auto io = m_io;
    m_thread = std::thread([io]() {
        try {
            io->run();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("NEG: io thread terminated: ") + e.what());
        }
    });
    LOG_INFO("NEG: Listening for data channels on port " + std::to_string(m_port));
    return true;
}

void TcpChannelNegotiator::stop() {
    if (!m_running) return;
    m_running = false;

    std::promise<void> done;
    auto finished = done.get_future();
    boost::asio::post(*m_io, [this, &done]() {
        closeEverything();
        boost::system::error_code ignored;
        m_acceptor.close(ignored);
        done.set_value();
    });
    finished.wait();

    m_work.reset();
    m_io->stop();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    LOG_INFO("NEG: Stopped");
}

// ============================================================================
// PUBLIC ENTRY POINTS
// ============================================================================

void TcpChannelNegotiator::initiate(const TransferKey& key, Callbacks callbacks) {
    if (!m_running) {
        if (callbacks.on_failed) callbacks.on_failed("negotiator not running");
        return;
    }

    const std::string token = generate_channel_token();
    const EmitSignal emit = callbacks.emit;

    // Registered before the offer leaves, so a fast connect always finds it.
    boost::asio::post(*m_io, [this, key, token, callbacks = std::move(callbacks)]() mutable {
        auto existing = m_pending.find(key);
        if (existing != m_pending.end()) {
            dropPending(existing->second);
            m_pending.erase(existing);
        }
        Pending pending;
        pending.host_side = true;
        pending.callbacks = std::move(callbacks);
        pending.token = token;
        Pending& stored = m_pending[key];
        stored = std::move(pending);
        armTimeout(key, stored);
    });

    if (!emit) return;

    json offer;
    offer["transport"] = "tcp";
    offer["host"] = m_config.advertise_hosts.front();
    offer["port"] = m_port;
    offer["token"] = token;
    LOG_INFO("NEG: Offering channel for " + key.toString() + " on " + m_config.advertise_hosts.front() + ":" +
             std::to_string(m_port));
    emit(SignalKind::OFFER, offer.dump());

    for (size_t i = 1; i < m_config.advertise_hosts.size(); ++i) {
        json candidate;
        candidate["host"] = m_config.advertise_hosts[i];
        candidate["port"] = m_port;
        emit(SignalKind::ICE_CANDIDATE, candidate.dump());
    }
}

void TcpChannelNegotiator::handleSignal(const TransferKey& key, SignalKind kind, const OpaquePayload& payload,
                                        Callbacks callbacks) {
    if (!m_running) {
        if (callbacks.on_failed) callbacks.on_failed("negotiator not running");
        return;
    }
    boost::asio::post(*m_io, [this, key, kind, payload, callbacks = std::move(callbacks)]() mutable {
        switch (kind) {
            case SignalKind::OFFER:
                handleOffer(key, payload, std::move(callbacks));
                break;
            case SignalKind::ICE_CANDIDATE:
                handleCandidate(key, payload);
                break;
            case SignalKind::ANSWER:
                handleAnswer(key, payload);
                break;
            case SignalKind::FILE_REQUEST:
                LOG_WARN("NEG: Ignoring file-request routed to the negotiator for " + key.toString());
                break;
        }
    });
}

void TcpChannelNegotiator::close(const TransferKey& key) {
    if (!m_running) return;
    boost::asio::post(*m_io, [this, key]() {
        auto pending = m_pending.find(key);
        if (pending != m_pending.end()) {
            dropPending(pending->second);
            m_pending.erase(pending);
        }
        auto open = m_open.find(key);
        if (open != m_open.end()) {
            if (auto channel = open->second.lock()) {
                channel->close();
            }
            m_open.erase(open);
        }
    });
}

void TcpChannelNegotiator::closeAll() {
    if (!m_running) return;
    boost::asio::post(*m_io, [this]() { closeEverything(); });
}

void TcpChannelNegotiator::closeEverything() {
    for (auto& kv : m_pending) {
        dropPending(kv.second);
    }
    m_pending.clear();
    for (auto& kv : m_open) {
        if (auto channel = kv.second.lock()) {
            channel->close();
        }
    }
    m_open.clear();
}

// ============================================================================
// HOST SIDE: ACCEPT + HELLO
// ============================================================================

void TcpChannelNegotiator::doAccept() {
    auto socket = std::make_shared<tcp::socket>(*m_io);
    m_acceptor.async_accept(*socket, [this, socket](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            LOG_WARN("NEG: Accept failed: " + ec.message());
        } else {
            readHello(socket);
        }
        if (m_acceptor.is_open()) {
            doAccept();
        }
    });
}

void TcpChannelNegotiator::readHello(std::shared_ptr<tcp::socket> socket) {
    auto header = std::make_shared<std::array<char, wire::kHeaderSize>>();
    boost::asio::async_read(*socket, boost::asio::buffer(*header),
        [this, socket, header](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                LOG_DEBUG("NEG: Connection dropped before hello: " + ec.message());
                return;
            }
            MessageType type;
            uint32_t length = 0;
            if (!wire::decode_header(std::string_view(header->data(), header->size()), type, length) ||
                type != MessageType::CHANNEL_HELLO || length == 0 || length > kMaxTokenLength) {
                LOG_WARN("NEG: Rejecting connection without a valid hello");
                boost::system::error_code ignored;
                socket->close(ignored);
                return;
            }
            auto token = std::make_shared<std::string>(length, '\0');
            boost::asio::async_read(*socket, boost::asio::buffer(*token),
                [this, socket, token](const boost::system::error_code& ec2, std::size_t) {
                    if (ec2) {
                        LOG_DEBUG("NEG: Connection dropped during hello: " + ec2.message());
                        return;
                    }
                    onHello(socket, *token);
                });
        });
}

void TcpChannelNegotiator::onHello(std::shared_ptr<tcp::socket> socket, const std::string& token) {
    for (auto it = m_pending.begin(); it != m_pending.end(); ++it) {
        if (it->second.host_side && tokens_equal(it->second.token, token)) {
            const TransferKey key = it->first;
            Pending pending = std::move(it->second);
            m_pending.erase(it);
            if (pending.timer) pending.timer->cancel();
            openChannel(key, std::move(pending), std::move(socket));
            return;
        }
    }
    LOG_WARN("NEG: Rejecting connection with unknown token");
    boost::system::error_code ignored;
    socket->close(ignored);
}

void TcpChannelNegotiator::handleAnswer(const TransferKey& key, const OpaquePayload& payload) {
    const json answer = parse_payload(payload);
    auto accepted = answer.find("accepted");
    if (accepted != answer.end() && accepted->is_boolean() && accepted->get<bool>()) {
        LOG_DEBUG("NEG: " + key.peer_id + " accepted the channel for " + key.file_id);
        return;
    }
    std::string reason = string_field(answer, "reason");
    if (reason.empty()) reason = "rejected by peer";
    if (m_pending.count(key) > 0) {
        failPending(key, reason, false);
    } else {
        LOG_DEBUG("NEG: Late rejection for " + key.toString() + ": " + reason);
    }
}

// ============================================================================
// CLIENT SIDE: CONNECT + HELLO
// ============================================================================

void TcpChannelNegotiator::handleOffer(const TransferKey& key, const OpaquePayload& payload, Callbacks callbacks) {
    auto existing = m_pending.find(key);
    if (existing != m_pending.end()) {
        dropPending(existing->second);
        m_pending.erase(existing);
    }

    Pending pending;
    pending.host_side = false;
    pending.callbacks = std::move(callbacks);

    const json offer = parse_payload(payload);
    const std::string transport = string_field(offer, "transport");
    const std::string host = string_field(offer, "host");
    const int port = port_field(offer);
    pending.token = string_field(offer, "token");

    std::string reason;
    if (offer.is_null()) {
        reason = "offer is not a JSON object";
    } else if (transport != "tcp") {
        reason = "unsupported transport '" + transport + "'";
    } else if (host.empty() || port < 0 || pending.token.empty()) {
        reason = "offer without host, port or token";
    }

    Pending& stored = m_pending[key];
    stored = std::move(pending);
    if (!reason.empty()) {
        failPending(key, reason, true);
        return;
    }

    stored.candidates.emplace_back(host, static_cast<unsigned short>(port));
    armTimeout(key, stored);
    LOG_INFO("NEG: Received offer for " + key.toString() + ", connecting to " + host + ":" + std::to_string(port));
    tryNextCandidate(key);
}

void TcpChannelNegotiator::handleCandidate(const TransferKey& key, const OpaquePayload& payload) {
    auto it = m_pending.find(key);
    if (it == m_pending.end() || it->second.host_side) {
        LOG_DEBUG("NEG: Ignoring candidate for " + key.toString());
        return;
    }
    Pending& pending = it->second;
    const json candidate = parse_payload(payload);
    const std::string host = string_field(candidate, "host");
    int port = port_field(candidate);
    if (port < 0 && !pending.candidates.empty()) {
        port = pending.candidates.front().second;
    }
    if (host.empty() || port < 0) {
        LOG_WARN("NEG: Malformed candidate for " + key.toString());
        return;
    }
    pending.candidates.emplace_back(host, static_cast<unsigned short>(port));
    if (!pending.connecting) {
        tryNextCandidate(key);
    }
}

void TcpChannelNegotiator::tryNextCandidate(const TransferKey& key) {
    auto it = m_pending.find(key);
    if (it == m_pending.end()) return;
    Pending& pending = it->second;

    while (pending.next_candidate < pending.candidates.size()) {
        const Candidate candidate = pending.candidates[pending.next_candidate++];
        boost::system::error_code ec;
        const auto address = boost::asio::ip::make_address(candidate.first, ec);
        if (ec) {
            LOG_WARN("NEG: Skipping candidate '" + candidate.first + "': " + ec.message());
            continue;
        }

        auto socket = std::make_shared<tcp::socket>(*m_io);
        pending.socket = socket;
        pending.connecting = true;
        socket->async_connect(tcp::endpoint(address, candidate.second),
            [this, key, socket, candidate](const boost::system::error_code& ec2) {
                auto current = m_pending.find(key);
                if (current == m_pending.end() || current->second.socket != socket) {
                    return;
                }
                if (ec2) {
                    LOG_DEBUG("NEG: Candidate " + candidate.first + ":" + std::to_string(candidate.second) +
                              " failed: " + ec2.message());
                    current->second.socket.reset();
                    current->second.connecting = false;
                    tryNextCandidate(key);
                    return;
                }
                sendHello(key, socket);
            });
        return;
    }

    // Out of candidates: wait for more until the timeout fires.
    pending.connecting = false;
}

void TcpChannelNegotiator::sendHello(const TransferKey& key, std::shared_ptr<tcp::socket> socket) {
    auto it = m_pending.find(key);
    if (it == m_pending.end()) return;

    auto frame = std::make_shared<std::string>(wire::encode_message(MessageType::CHANNEL_HELLO, it->second.token));
    boost::asio::async_write(*socket, boost::asio::buffer(*frame),
        [this, key, socket, frame](const boost::system::error_code& ec, std::size_t) {
            auto current = m_pending.find(key);
            if (current == m_pending.end() || current->second.socket != socket) {
                return;
            }
            if (ec) {
                LOG_DEBUG("NEG: Hello failed for " + key.toString() + ": " + ec.message());
                current->second.socket.reset();
                current->second.connecting = false;
                tryNextCandidate(key);
                return;
            }
            Pending pending = std::move(current->second);
            m_pending.erase(current);
            if (pending.timer) pending.timer->cancel();

            const EmitSignal emit = pending.callbacks.emit;
            openChannel(key, std::move(pending), socket);
            if (emit) {
                emit(SignalKind::ANSWER, json{{"accepted", true}}.dump());
            }
        });
}

// ============================================================================
// SHARED
// ============================================================================

void TcpChannelNegotiator::armTimeout(const TransferKey& key, Pending& pending) {
    auto timer = std::make_shared<boost::asio::steady_timer>(*m_io, m_config.connect_timeout);
    pending.timer = timer;
    timer->async_wait([this, key, timer](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        auto it = m_pending.find(key);
        if (it == m_pending.end() || it->second.timer != timer) return;
        failPending(key, "channel negotiation timed out", !it->second.host_side);
    });
}

void TcpChannelNegotiator::openChannel(const TransferKey& key, Pending pending, std::shared_ptr<tcp::socket> socket) {
    for (auto it = m_open.begin(); it != m_open.end();) {
        it = it->second.expired() ? m_open.erase(it) : std::next(it);
    }

    auto channel = std::make_shared<TcpDataChannel>(m_io, std::move(*socket), key.toString(), m_config.send_queue_limit);
    m_open[key] = channel;
    LOG_INFO("NEG: Channel negotiated for " + key.toString());

    if (pending.callbacks.on_open) {
        pending.callbacks.on_open(channel);
    }
    channel->start();
}

void TcpChannelNegotiator::failPending(const TransferKey& key, const std::string& reason, bool answer) {
    auto it = m_pending.find(key);
    if (it == m_pending.end()) return;
    Pending pending = std::move(it->second);
    m_pending.erase(it);
    dropPending(pending);

    LOG_WARN("NEG: Negotiation for " + key.toString() + " failed: " + reason);
    if (answer && pending.callbacks.emit) {
        json rejection;
        rejection["accepted"] = false;
        rejection["reason"] = reason;
        pending.callbacks.emit(SignalKind::ANSWER, rejection.dump());
    }
    if (pending.callbacks.on_failed) {
        pending.callbacks.on_failed(reason);
    }
}

void TcpChannelNegotiator::dropPending(Pending& pending) {
    if (pending.timer) {
        pending.timer->cancel();
        pending.timer.reset();
    }
    if (pending.socket) {
        boost::system::error_code ignored;
        pending.socket->close(ignored);
        pending.socket.reset();
    }
}
