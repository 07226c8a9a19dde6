#include "logger.h"
#include "tcp_channel_negotiator.h"
#include "test_support.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

using json = nlohmann::json;
using namespace std::chrono_literals;

// One end of a negotiated channel, filled from the negotiator's io thread.
struct Endpoint {
    std::mutex mutex;
    std::shared_ptr<DataChannel> channel;
    std::vector<std::string> texts;
    std::vector<std::string> binaries;
    std::vector<ChannelState> states;
    std::vector<std::string> failures;
    std::vector<std::pair<SignalKind, std::string>> emitted;

    void adopt(const std::shared_ptr<DataChannel>& ch) {
        ch->setTextHandler([this](const std::string& t) {
            std::lock_guard<std::mutex> lock(mutex);
            texts.push_back(t);
        });
        ch->setBinaryHandler([this](const std::string& b) {
            std::lock_guard<std::mutex> lock(mutex);
            binaries.push_back(b);
        });
        ch->setStateHandler([this](ChannelState s) {
            std::lock_guard<std::mutex> lock(mutex);
            states.push_back(s);
        });
        std::lock_guard<std::mutex> lock(mutex);
        channel = ch;
    }

    std::shared_ptr<DataChannel> current() {
        std::lock_guard<std::mutex> lock(mutex);
        return channel;
    }

    template <typename F>
    auto locked(F f) {
        std::lock_guard<std::mutex> lock(mutex);
        return f();
    }
};

static ChannelConfig loopback_config() {
    ChannelConfig cfg;
    cfg.advertise_hosts = {"127.0.0.1"};
    cfg.connect_timeout = 2000ms;
    return cfg;
}

static bool test_negotiate_and_exchange() {
    // Declared before the negotiators so io-thread callbacks never outlive them.
    Endpoint host_end;
    Endpoint client_end;
    TcpChannelNegotiator host(loopback_config());
    TcpChannelNegotiator client(loopback_config());
    std::string err;
    TEST_ASSERT(host.start(&err), "host start: " + err);
    TEST_ASSERT(client.start(&err), "client start: " + err);
    TEST_ASSERT(host.listenPort() != 0, "ephemeral port bound");

    const TransferKey host_key{"client-1", "file-1"};
    const TransferKey client_key{"host-1", "file-1"};

    ChannelNegotiator::Callbacks client_cb;
    client_cb.emit = [&](SignalKind kind, const OpaquePayload& payload) {
        client_end.locked([&] { client_end.emitted.emplace_back(kind, payload); return 0; });
        host.handleSignal(host_key, kind, payload, {});
    };
    client_cb.on_open = [&](const std::shared_ptr<DataChannel>& ch) { client_end.adopt(ch); };
    client_cb.on_failed = [&](const std::string& reason) {
        client_end.locked([&] { client_end.failures.push_back(reason); return 0; });
    };

    ChannelNegotiator::Callbacks host_cb;
    host_cb.emit = [&](SignalKind kind, const OpaquePayload& payload) {
        host_end.locked([&] { host_end.emitted.emplace_back(kind, payload); return 0; });
        client.handleSignal(client_key, kind, payload, client_cb);
    };
    host_cb.on_open = [&](const std::shared_ptr<DataChannel>& ch) { host_end.adopt(ch); };
    host_cb.on_failed = [&](const std::string& reason) {
        host_end.locked([&] { host_end.failures.push_back(reason); return 0; });
    };

    host.initiate(host_key, host_cb);

    const json offer = json::parse(host_end.locked([&] { return host_end.emitted.at(0).second; }));
    TEST_ASSERT(offer["transport"] == "tcp" && offer["host"] == "127.0.0.1", "offer shape");
    TEST_ASSERT(offer["port"] == host.listenPort() && offer["token"].get<std::string>().size() == 32, "offer fields");

    TEST_ASSERT(wait_until([&] { return host_end.current() && client_end.current(); }, 3000ms),
                "both ends opened");
    TEST_ASSERT(wait_until([&] { return client_end.locked([&] { return !client_end.emitted.empty(); }); }, 1000ms),
                "client answered");
    const auto answer = client_end.locked([&] { return client_end.emitted.front(); });
    TEST_ASSERT(answer.first == SignalKind::ANSWER && json::parse(answer.second)["accepted"] == true,
                "answer accepts the channel");

    auto h = host_end.current();
    auto c = client_end.current();
    TEST_ASSERT(wait_until([&] { return h->isOpen() && c->isOpen(); }, 1000ms), "both ends open");

    TEST_ASSERT(h->sendText(R"({"type":"metadata","name":"a","size":3})"), "text sent");
    TEST_ASSERT(h->sendBinary("abc"), "binary sent");
    TEST_ASSERT(c->sendText("back"), "reverse direction");

    TEST_ASSERT(wait_until([&] {
        return client_end.locked([&] { return client_end.texts.size() == 1 && client_end.binaries.size() == 1; });
    }, 2000ms), "client received text and binary");
    TEST_ASSERT(client_end.locked([&] { return client_end.binaries[0] == "abc"; }), "binary intact");
    TEST_ASSERT(wait_until([&] { return host_end.locked([&] { return host_end.texts.size() == 1; }); }, 2000ms),
                "host received text");

    h->close();
    TEST_ASSERT(wait_until([&] { return c->state() == ChannelState::CLOSED; }, 2000ms), "close reaches the peer");
    TEST_ASSERT(wait_until([&] { return h->state() == ChannelState::CLOSED; }, 2000ms), "closer ends closed");
    TEST_ASSERT(!c->sendText("late"), "closed channel refuses sends");
    TEST_ASSERT(host_end.locked([&] { return host_end.failures.empty(); }), "no host failure");

    client.stop();
    host.stop();
    TEST_ASSERT(!host.isRunning(), "stopped");
    return true;
}

static bool test_bad_offer_rejected() {
    Endpoint end;
    TcpChannelNegotiator client(loopback_config());
    std::string err;
    TEST_ASSERT(client.start(&err), "client start: " + err);

    ChannelNegotiator::Callbacks cb;
    cb.emit = [&](SignalKind kind, const OpaquePayload& payload) {
        end.locked([&] { end.emitted.emplace_back(kind, payload); return 0; });
    };
    cb.on_open = [&](const std::shared_ptr<DataChannel>& ch) { end.adopt(ch); };
    cb.on_failed = [&](const std::string& reason) {
        end.locked([&] { end.failures.push_back(reason); return 0; });
    };

    client.handleSignal({"host", "f"}, SignalKind::OFFER, "not json", cb);
    TEST_ASSERT(wait_until([&] { return end.locked([&] { return !end.failures.empty(); }); }, 2000ms),
                "negotiation failed");
    TEST_ASSERT(!end.current(), "no channel opened");
    const auto emitted = end.locked([&] { return end.emitted; });
    TEST_ASSERT(emitted.size() == 1 && emitted[0].first == SignalKind::ANSWER, "rejection answered");
    const json rejection = json::parse(emitted[0].second);
    TEST_ASSERT(rejection["accepted"] == false && !rejection["reason"].get<std::string>().empty(),
                "rejection carries a reason");

    end.locked([&] { end.failures.clear(); end.emitted.clear(); return 0; });
    client.handleSignal({"host", "g"}, SignalKind::OFFER, R"({"transport":"udp","host":"127.0.0.1","port":1,"token":"t"})",
                        cb);
    TEST_ASSERT(wait_until([&] { return end.locked([&] { return !end.failures.empty(); }); }, 2000ms),
                "unsupported transport refused");

    client.stop();
    return true;
}

static bool test_unanswered_offer_times_out() {
    ChannelConfig cfg = loopback_config();
    cfg.connect_timeout = 150ms;
    Endpoint end;
    TcpChannelNegotiator host(cfg);
    std::string err;
    TEST_ASSERT(host.start(&err), "host start: " + err);

    ChannelNegotiator::Callbacks cb;
    cb.emit = [&](SignalKind kind, const OpaquePayload& payload) {
        end.locked([&] { end.emitted.emplace_back(kind, payload); return 0; });
    };
    cb.on_failed = [&](const std::string& reason) {
        end.locked([&] { end.failures.push_back(reason); return 0; });
    };

    host.initiate({"nobody", "f"}, cb);
    TEST_ASSERT(wait_until([&] { return end.locked([&] { return !end.failures.empty(); }); }, 2000ms),
                "timeout reported");
    const auto emitted = end.locked([&] { return end.emitted; });
    TEST_ASSERT(emitted.size() == 1 && emitted[0].first == SignalKind::OFFER, "host side does not answer itself");

    host.stop();
    return true;
}

// Runs offer / answer between two started negotiators and waits for both ends.
static bool open_pair(TcpChannelNegotiator& host, TcpChannelNegotiator& client, Endpoint& host_end,
                      Endpoint& client_end, const std::string& file_id) {
    const TransferKey host_key{"client-1", file_id};
    const TransferKey client_key{"host-1", file_id};

    ChannelNegotiator::Callbacks client_cb;
    client_cb.emit = [&host, host_key](SignalKind kind, const OpaquePayload& payload) {
        host.handleSignal(host_key, kind, payload, {});
    };
    client_cb.on_open = [&client_end](const std::shared_ptr<DataChannel>& ch) { client_end.adopt(ch); };

    ChannelNegotiator::Callbacks host_cb;
    host_cb.emit = [&client, client_key, client_cb](SignalKind kind, const OpaquePayload& payload) {
        client.handleSignal(client_key, kind, payload, client_cb);
    };
    host_cb.on_open = [&host_end](const std::shared_ptr<DataChannel>& ch) { host_end.adopt(ch); };

    host.initiate(host_key, host_cb);
    TEST_ASSERT(wait_until([&] { return host_end.current() && client_end.current(); }, 3000ms), "pair opened");
    TEST_ASSERT(wait_until([&] { return host_end.current()->isOpen() && client_end.current()->isOpen(); }, 1000ms),
                "pair open");
    return true;
}

static bool is_terminal(ChannelState s) {
    return s == ChannelState::CLOSED || s == ChannelState::FAILED;
}

static bool test_peer_closes_mid_stream() {
    ChannelConfig cfg = loopback_config();
    cfg.send_queue_limit = 1024 * 1024;
    Endpoint host_end;
    Endpoint client_end;
    TcpChannelNegotiator host(cfg);
    TcpChannelNegotiator client(cfg);
    std::string err;
    TEST_ASSERT(host.start(&err), "host start: " + err);
    TEST_ASSERT(client.start(&err), "client start: " + err);
    if (!open_pair(host, client, host_end, client_end, "stream")) return false;

    auto h = host_end.current();
    auto c = client_end.current();
    const std::string chunk(64 * 1024, 'z');
    std::atomic<bool> streaming{true};
    std::atomic<size_t> accepted{0};
    std::thread sender([&] {
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (streaming && !is_terminal(h->state()) && std::chrono::steady_clock::now() < deadline) {
            if (h->sendBinary(chunk)) {
                accepted++;
            } else {
                std::this_thread::sleep_for(1ms);
            }
        }
    });

    TEST_ASSERT(wait_until([&] { return client_end.locked([&] { return client_end.binaries.size() >= 2; }); }, 3000ms),
                "stream reached the client");
    c->close();

    const bool host_ended = wait_until([&] { return is_terminal(h->state()); }, 3000ms);
    streaming = false;
    sender.join();
    TEST_ASSERT(host_ended, "sender sees the close");
    TEST_ASSERT(accepted > 2, "sender was streaming");
    TEST_ASSERT(wait_until([&] { return h->bufferedAmount() == 0; }, 1000ms), "queued bytes released");
    TEST_ASSERT(!h->sendBinary(chunk) && !h->sendText("late"), "ended channel refuses sends");
    TEST_ASSERT(wait_until([&] { return is_terminal(c->state()); }, 2000ms), "closer ends");
    TEST_ASSERT(h->bufferedAmount() == 0, "no buffered bytes after the io thread settles");

    client.stop();
    host.stop();
    return true;
}

static bool test_not_running() {
    TcpChannelNegotiator idle(loopback_config());
    std::string reason;
    ChannelNegotiator::Callbacks cb;
    cb.on_failed = [&](const std::string& r) { reason = r; };
    idle.initiate({"p", "f"}, cb);
    TEST_ASSERT(!reason.empty(), "initiate before start fails");
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);
    std::cout << "--- TCP channel tests ---" << std::endl;

    if (test_negotiate_and_exchange()) std::cout << "PASS: negotiate and exchange" << std::endl;
    if (test_bad_offer_rejected()) std::cout << "PASS: bad offer rejected" << std::endl;
    if (test_unanswered_offer_times_out()) std::cout << "PASS: unanswered offer times out" << std::endl;
    if (test_peer_closes_mid_stream()) std::cout << "PASS: peer closes mid-stream" << std::endl;
    if (test_not_running()) std::cout << "PASS: not running" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
