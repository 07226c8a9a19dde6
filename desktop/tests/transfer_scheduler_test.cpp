#include "byte_source.h"
#include "channel_messages.h"
#include "logger.h"
#include "test_support.h"
#include "transfer_scheduler.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
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

using namespace std::chrono_literals;

static SchedulerConfig manual_config() {
    SchedulerConfig cfg;
    cfg.chunk_size = 65536;
    cfg.max_buffer_bytes = 2 * 1024 * 1024;
    cfg.chunks_per_tick = 16;
    cfg.completion_drain_threshold = 1000;
    cfg.completion_backoff = 0ms;
    cfg.run_loop = false;
    return cfg;
}

static std::string pattern_bytes(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) {
        s[i] = static_cast<char>((i * 31 + 7) & 0xff);
    }
    return s;
}

// Records terminal outcomes of one transfer.
struct Outcome {
    int completed = 0;
    int failed = 0;
    TransferError error = TransferError::CHANNEL_FAILURE;
    TransferStats stats;
    uint64_t last_progress = 0;
};

static OutboundTransfer make_transfer(const std::shared_ptr<FakeDataChannel>& channel, std::string data,
                                      Outcome* outcome) {
    OutboundTransfer t;
    t.channel = channel;
    t.source = std::make_shared<MemoryByteSource>(std::move(data));
    t.name = "file.bin";
    t.mime_type = "application/octet-stream";
    t.on_complete = [outcome](const TransferKey&, const TransferStats& stats) {
        outcome->completed++;
        outcome->stats = stats;
    };
    t.on_failed = [outcome](const TransferKey&, TransferError error, const std::string&) {
        outcome->failed++;
        outcome->error = error;
    };
    t.on_progress = [outcome](const TransferKey&, uint64_t sent, uint64_t) { outcome->last_progress = sent; };
    return t;
}

class UnreadableSource : public ByteSource {
public:
    uint64_t size() const override { return 1000; }
    bool read(uint64_t, size_t, std::string*) override { return false; }
};

static bool test_chunking_and_marker_order() {
    TransferScheduler sched(manual_config());
    auto channel = std::make_shared<FakeDataChannel>();
    Outcome outcome;
    const std::string data = pattern_bytes(200000);
    TEST_ASSERT(sched.addTransfer({"c", "f"}, make_transfer(channel, data, &outcome)), "transfer accepted");

    sched.runTick();

    const auto sent = channel->sent();
    TEST_ASSERT(sent.size() == 6, "metadata + 4 chunks + marker");
    TEST_ASSERT(sent[0].text, "metadata first");
    channel_msg::ControlMessage meta;
    TEST_ASSERT(channel_msg::decode_control(sent[0].data, &meta), "metadata decodes");
    TEST_ASSERT(meta.kind == channel_msg::ControlMessage::Kind::METADATA && meta.size == 200000 &&
                    meta.name == "file.bin",
                "metadata describes the file");
    TEST_ASSERT(!sent[1].text && sent[1].data.size() == 65536, "chunk 1 full");
    TEST_ASSERT(!sent[2].text && sent[2].data.size() == 65536, "chunk 2 full");
    TEST_ASSERT(!sent[3].text && sent[3].data.size() == 65536, "chunk 3 full");
    TEST_ASSERT(!sent[4].text && sent[4].data.size() == 200000 - 3 * 65536, "chunk 4 partial");
    TEST_ASSERT(sent[5].text && sent[5].data == channel_msg::encode_complete(), "marker after the last chunk");
    TEST_ASSERT(channel->binaryBytes() == data, "bytes arrive in order");

    TEST_ASSERT(outcome.completed == 1 && outcome.failed == 0, "completed once");
    TEST_ASSERT(outcome.stats.bytes == 200000 && outcome.stats.chunks == 4, "stats");
    TEST_ASSERT(outcome.last_progress == 200000, "progress reached the total");
    TEST_ASSERT(sched.activeCount() == 0 && sched.isIdle(), "transfer deregistered");

    sched.runTick();
    TEST_ASSERT(channel->texts().size() == 2, "marker sent exactly once");
    return true;
}

static bool test_fair_share() {
    SchedulerConfig cfg = manual_config();
    cfg.chunk_size = 10;
    TransferScheduler sched(cfg);

    std::vector<std::shared_ptr<FakeDataChannel>> channels;
    std::vector<Outcome> outcomes(4);
    for (int i = 0; i < 4; ++i) {
        channels.push_back(std::make_shared<FakeDataChannel>());
        sched.addTransfer({"c" + std::to_string(i), "f"}, make_transfer(channels.back(), pattern_bytes(1000),
                                                                        &outcomes[i]));
    }
    sched.runTick();
    for (int i = 0; i < 4; ++i) {
        TEST_ASSERT(channels[i]->binaryCount() == 4, "each of 4 transfers gets floor(16/4) chunks");
    }
    return true;
}

static bool test_fair_share_floor_of_one() {
    SchedulerConfig cfg = manual_config();
    cfg.chunk_size = 10;
    TransferScheduler sched(cfg);

    std::vector<std::shared_ptr<FakeDataChannel>> channels;
    std::vector<Outcome> outcomes(20);
    for (int i = 0; i < 20; ++i) {
        channels.push_back(std::make_shared<FakeDataChannel>());
        sched.addTransfer({"c" + std::to_string(i), "f"}, make_transfer(channels.back(), pattern_bytes(1000),
                                                                        &outcomes[i]));
    }
    sched.runTick();
    for (const auto& ch : channels) {
        TEST_ASSERT(ch->binaryCount() == 1, "more transfers than budget still move one chunk each");
    }
    return true;
}

static bool test_buffer_ceiling() {
    SchedulerConfig cfg = manual_config();
    cfg.chunk_size = 100;
    cfg.max_buffer_bytes = 300;
    TransferScheduler sched(cfg);
    auto channel = std::make_shared<FakeDataChannel>();
    channel->setAccumulate(true);
    Outcome outcome;
    sched.addTransfer({"c", "f"}, make_transfer(channel, pattern_bytes(1000), &outcome));

    sched.runTick();
    TEST_ASSERT(channel->binaryCount() == 3, "sending stops at the ceiling");
    sched.runTick();
    TEST_ASSERT(channel->binaryCount() == 3, "no sends while the buffer is full");

    channel->setBuffered(0);
    sched.runTick();
    TEST_ASSERT(channel->binaryCount() == 6, "sending resumes after the buffer drains");
    TEST_ASSERT(outcome.completed == 0 && outcome.failed == 0, "still in flight");
    return true;
}

static bool test_send_refused_retries_next_tick() {
    TransferScheduler sched(manual_config());
    auto channel = std::make_shared<FakeDataChannel>();
    channel->setRefuseBinary(true);
    Outcome outcome;
    sched.addTransfer({"c", "f"}, make_transfer(channel, pattern_bytes(1000), &outcome));

    sched.runTick();
    TEST_ASSERT(channel->binaryCount() == 0 && outcome.failed == 0, "refused send is not a failure");

    channel->setRefuseBinary(false);
    sched.runTick();
    TEST_ASSERT(outcome.completed == 1, "transfer completes once sends are accepted");
    return true;
}

static bool test_marker_waits_for_drain() {
    SchedulerConfig cfg = manual_config();
    cfg.chunk_size = 100;
    TransferScheduler sched(cfg);
    auto channel = std::make_shared<FakeDataChannel>();
    channel->setBuffered(5000);
    Outcome outcome;
    sched.addTransfer({"c", "f"}, make_transfer(channel, pattern_bytes(500), &outcome));

    sched.runTick();
    TEST_ASSERT(channel->binaryCount() == 5, "all chunks queued");
    TEST_ASSERT(channel->texts().size() == 1, "marker withheld while the buffer is full");
    TEST_ASSERT(outcome.completed == 0, "not complete yet");

    channel->setBuffered(999);
    sched.runTick();
    TEST_ASSERT(channel->texts().size() == 2, "marker sent once below the threshold");
    TEST_ASSERT(outcome.completed == 1, "complete");
    return true;
}

static bool test_channel_failure_mid_transfer() {
    SchedulerConfig cfg = manual_config();
    cfg.chunk_size = 100;
    cfg.max_buffer_bytes = 200;
    TransferScheduler sched(cfg);
    auto channel = std::make_shared<FakeDataChannel>();
    channel->setAccumulate(true);
    Outcome outcome;
    sched.addTransfer({"c", "f"}, make_transfer(channel, pattern_bytes(1000), &outcome));

    sched.runTick();
    channel->setState(ChannelState::CLOSED);
    sched.runTick();
    TEST_ASSERT(outcome.failed == 1 && outcome.error == TransferError::CHANNEL_FAILURE, "channel failure reported");
    TEST_ASSERT(sched.activeCount() == 0, "failed transfer deregistered");

    auto other = std::make_shared<FakeDataChannel>();
    Outcome second;
    sched.addTransfer({"c", "g"}, make_transfer(other, pattern_bytes(1000), &second));
    sched.handleChannelFailure({"c", "g"}, "socket reset");
    sched.runTick();
    TEST_ASSERT(second.failed == 1 && second.error == TransferError::CHANNEL_FAILURE,
                "handleChannelFailure reported");
    TEST_ASSERT(other->binaryCount() == 0, "failed before any chunk");
    return true;
}

static bool test_failure_scoped_to_channel() {
    SchedulerConfig cfg = manual_config();
    cfg.chunk_size = 100;
    cfg.max_buffer_bytes = 200;
    TransferScheduler sched(cfg);
    auto current = std::make_shared<FakeDataChannel>();
    auto replaced = std::make_shared<FakeDataChannel>();
    current->setAccumulate(true);
    Outcome outcome;
    const TransferKey key{"c", "f"};
    sched.addTransfer(key, make_transfer(current, pattern_bytes(1000), &outcome));
    sched.runTick();

    sched.handleChannelFailure(key, "channel closed", replaced);
    sched.runTick();
    TEST_ASSERT(outcome.failed == 0 && sched.activeCount() == 1, "an older channel's close is ignored");

    sched.handleChannelFailure(key, "channel closed", current);
    sched.runTick();
    TEST_ASSERT(outcome.failed == 1 && outcome.error == TransferError::CHANNEL_FAILURE, "own channel fails it");
    TEST_ASSERT(sched.activeCount() == 0, "deregistered");

    sched.handleChannelFailure(key, "late", current);
    sched.runTick();
    TEST_ASSERT(outcome.failed == 1, "reported once");
    return true;
}

static bool test_close_after_all_chunks_completes() {
    SchedulerConfig cfg = manual_config();
    cfg.chunk_size = 100;
    TransferScheduler sched(cfg);
    auto channel = std::make_shared<FakeDataChannel>();
    channel->setBuffered(5000);
    Outcome outcome;
    const TransferKey key{"c", "f"};
    sched.addTransfer(key, make_transfer(channel, pattern_bytes(500), &outcome));

    sched.runTick();
    TEST_ASSERT(channel->binaryCount() == 5 && outcome.completed == 0, "all chunks queued, marker pending");

    sched.handleChannelFailure(key, "channel closed", channel);
    sched.runTick();
    TEST_ASSERT(outcome.completed == 1 && outcome.failed == 0, "closed after the last chunk counts as complete");
    TEST_ASSERT(outcome.stats.bytes == 500, "full size reported");
    return true;
}

static bool test_loop_callback_posts_command() {
    SchedulerConfig cfg = manual_config();
    cfg.run_loop = true;
    cfg.tick_interval = 1ms;
    TransferScheduler sched(cfg);
    auto channel = std::make_shared<FakeDataChannel>();
    std::atomic<int> completed{0};
    OutboundTransfer t;
    t.channel = channel;
    t.source = std::make_shared<MemoryByteSource>(pattern_bytes(1000));
    t.name = "f";
    // Completion callbacks may close the channel, which reports back into the scheduler.
    t.on_complete = [&](const TransferKey& key, const TransferStats&) {
        sched.handleChannelFailure(key, "channel closed", channel);
        completed++;
    };
    sched.addTransfer({"c", "cb"}, std::move(t));

    TEST_ASSERT(wait_until([&] { return completed.load() == 1; }, 5000ms), "completed on the loop thread");
    TEST_ASSERT(wait_until([&] { return sched.isIdle(); }, 1000ms), "command from the callback consumed");
    sched.cleanup();
    return true;
}

static bool test_empty_file() {
    TransferScheduler sched(manual_config());
    auto channel = std::make_shared<FakeDataChannel>();
    Outcome outcome;
    sched.addTransfer({"c", "empty"}, make_transfer(channel, std::string(), &outcome));
    sched.runTick();

    TEST_ASSERT(channel->binaryCount() == 0, "no chunks for an empty file");
    TEST_ASSERT(channel->texts().size() == 2, "metadata and marker only");
    TEST_ASSERT(outcome.completed == 1 && outcome.stats.bytes == 0, "empty transfer completes");
    return true;
}

static bool test_waits_for_open_channel() {
    TransferScheduler sched(manual_config());
    auto channel = std::make_shared<FakeDataChannel>(ChannelState::CONNECTING);
    Outcome outcome;
    sched.addTransfer({"c", "f"}, make_transfer(channel, pattern_bytes(100), &outcome));

    sched.runTick();
    TEST_ASSERT(channel->sent().empty(), "nothing sent before the channel opens");
    TEST_ASSERT(sched.activeCount() == 1, "transfer pending");

    channel->setState(ChannelState::OPEN);
    sched.runTick();
    TEST_ASSERT(outcome.completed == 1, "transfer completes once open");
    return true;
}

static bool test_cancel_paths() {
    SchedulerConfig cfg = manual_config();
    cfg.chunk_size = 10;
    cfg.max_buffer_bytes = 20;
    TransferScheduler sched(cfg);

    auto a = std::make_shared<FakeDataChannel>();
    auto b = std::make_shared<FakeDataChannel>();
    auto c = std::make_shared<FakeDataChannel>();
    a->setAccumulate(true);
    b->setAccumulate(true);
    c->setAccumulate(true);
    Outcome oa, ob, oc;
    sched.addTransfer({"peer1", "f1"}, make_transfer(a, pattern_bytes(1000), &oa));
    sched.addTransfer({"peer1", "f2"}, make_transfer(b, pattern_bytes(1000), &ob));
    sched.addTransfer({"peer2", "f1"}, make_transfer(c, pattern_bytes(1000), &oc));
    sched.runTick();
    TEST_ASSERT(sched.activeCount() == 3, "three in flight");

    sched.removeTransfersForPeer("peer1");
    sched.runTick();
    TEST_ASSERT(oa.failed == 1 && oa.error == TransferError::CANCELLED, "peer1/f1 cancelled");
    TEST_ASSERT(ob.failed == 1 && ob.error == TransferError::CANCELLED, "peer1/f2 cancelled");
    TEST_ASSERT(oc.failed == 0 && sched.activeCount() == 1, "peer2 unaffected");

    auto replacement = std::make_shared<FakeDataChannel>();
    Outcome orep;
    sched.addTransfer({"peer2", "f1"}, make_transfer(replacement, pattern_bytes(10), &orep));
    sched.runTick();
    TEST_ASSERT(oc.failed == 1 && oc.error == TransferError::CANCELLED, "replaced transfer cancelled");
    TEST_ASSERT(orep.completed == 1, "replacement completes");

    Outcome silent;
    auto d = std::make_shared<FakeDataChannel>(ChannelState::CONNECTING);
    sched.addTransfer({"peer3", "f"}, make_transfer(d, pattern_bytes(10), &silent));
    sched.removeTransfer({"peer3", "f"});
    sched.runTick();
    TEST_ASSERT(silent.failed == 0 && silent.completed == 0 && sched.isIdle(), "removeTransfer is silent");
    return true;
}

static bool test_rejects_incomplete_transfer() {
    TransferScheduler sched(manual_config());
    OutboundTransfer no_channel;
    no_channel.source = std::make_shared<MemoryByteSource>("x");
    TEST_ASSERT(!sched.addTransfer({"c", "f"}, no_channel), "transfer without channel rejected");

    OutboundTransfer no_source;
    no_source.channel = std::make_shared<FakeDataChannel>();
    TEST_ASSERT(!sched.addTransfer({"c", "f"}, no_source), "transfer without source rejected");
    return true;
}

static bool test_unreadable_source() {
    TransferScheduler sched(manual_config());
    auto channel = std::make_shared<FakeDataChannel>();
    Outcome outcome;
    OutboundTransfer t = make_transfer(channel, std::string(), &outcome);
    t.source = std::make_shared<UnreadableSource>();
    sched.addTransfer({"c", "f"}, std::move(t));
    sched.runTick();
    TEST_ASSERT(outcome.failed == 1 && outcome.error == TransferError::SOURCE_UNREADABLE, "read error reported");
    return true;
}

static bool test_background_loop() {
    SchedulerConfig cfg = manual_config();
    cfg.run_loop = true;
    cfg.chunk_size = 1000;
    TransferScheduler sched(cfg);

    auto channel = std::make_shared<FakeDataChannel>();
    std::atomic<int> completed{0};
    OutboundTransfer t;
    t.channel = channel;
    t.source = std::make_shared<MemoryByteSource>(pattern_bytes(50000));
    t.name = "bg.bin";
    t.on_complete = [&completed](const TransferKey&, const TransferStats&) { completed++; };
    sched.addTransfer({"c", "bg"}, std::move(t));

    TEST_ASSERT(wait_until([&] { return completed.load() == 1; }, 5000ms), "loop thread completes the transfer");
    TEST_ASSERT(channel->binaryCount() == 50, "all chunks sent by the loop");
    TEST_ASSERT(wait_until([&] { return sched.isIdle(); }, 1000ms), "loop goes idle");
    sched.cleanup();
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);
    std::cout << "--- TransferScheduler tests ---" << std::endl;

    if (test_chunking_and_marker_order()) std::cout << "PASS: chunking and marker order" << std::endl;
    if (test_fair_share()) std::cout << "PASS: fair share" << std::endl;
    if (test_fair_share_floor_of_one()) std::cout << "PASS: fair share floor" << std::endl;
    if (test_buffer_ceiling()) std::cout << "PASS: buffer ceiling" << std::endl;
    if (test_send_refused_retries_next_tick()) std::cout << "PASS: refused send retried" << std::endl;
    if (test_marker_waits_for_drain()) std::cout << "PASS: marker waits for drain" << std::endl;
    if (test_channel_failure_mid_transfer()) std::cout << "PASS: channel failure" << std::endl;
    if (test_failure_scoped_to_channel()) std::cout << "PASS: failure scoped to channel" << std::endl;
    if (test_close_after_all_chunks_completes()) std::cout << "PASS: close after all chunks" << std::endl;
    if (test_loop_callback_posts_command()) std::cout << "PASS: callback posts command" << std::endl;
    if (test_empty_file()) std::cout << "PASS: empty file" << std::endl;
    if (test_waits_for_open_channel()) std::cout << "PASS: waits for open channel" << std::endl;
    if (test_cancel_paths()) std::cout << "PASS: cancel paths" << std::endl;
    if (test_rejects_incomplete_transfer()) std::cout << "PASS: rejects incomplete transfer" << std::endl;
    if (test_unreadable_source()) std::cout << "PASS: unreadable source" << std::endl;
    if (test_background_loop()) std::cout << "PASS: background loop" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
