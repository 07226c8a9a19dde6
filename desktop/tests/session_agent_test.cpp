#include "byte_source.h"
#include "local_transport.h"
#include "logger.h"
#include "session_agent.h"
#include "session_coordinator.h"
#include "test_support.h"

#include <chrono>
#include <iostream>
#include <memory>
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

using namespace std::chrono_literals;

struct ManualClock {
    std::shared_ptr<std::chrono::steady_clock::time_point> now =
        std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());

    SessionCoordinator::Clock fn() const {
        auto t = now;
        return [t] { return *t; };
    }
    void advance(std::chrono::milliseconds d) { *now += d; }
};

static SchedulerConfig manual_scheduler() {
    SchedulerConfig cfg;
    cfg.run_loop = false;
    cfg.completion_backoff = 0ms;
    return cfg;
}

static AgentConfig manual_agent() {
    AgentConfig cfg;
    cfg.run_poll_loop = false;
    return cfg;
}

// Everything one peer needs, wired the way the desktop node wires it.
struct Peer {
    std::string id;
    LocalTransport transport;
    LoopbackNegotiator negotiator;
    TransferScheduler scheduler;
    std::shared_ptr<MemoryFileSink> sink;
    TransferReceiver receiver;
    SessionAgent agent;

    std::vector<SessionEndReason> ended;
    std::vector<std::pair<TransferKey, TransferError>> upload_failures;
    int uploads_completed = 0;
    int files_updates = 0;

    Peer(ISessionCoordinator& coordinator, std::shared_ptr<LoopbackNegotiator::Hub> hub, std::string peerId)
        : id(std::move(peerId)),
          transport(coordinator),
          negotiator(std::move(hub)),
          scheduler(manual_scheduler()),
          sink(std::make_shared<MemoryFileSink>()),
          receiver(ReceiverConfig(), sink),
          agent(manual_agent(), id, transport, negotiator, scheduler, receiver) {
        agent.setSessionEndedCallback([this](SessionEndReason reason) { ended.push_back(reason); });
        agent.setFilesUpdatedCallback([this](const std::vector<FileDescriptor>&) { files_updates++; });
        agent.setUploadCallbacks(
            [this](const TransferKey&, const TransferStats&) { uploads_completed++; },
            [this](const TransferKey& key, TransferError error, const std::string&) {
                upload_failures.emplace_back(key, error);
            });
    }

    bool connect() { return transport.connect(id, nullptr); }
};

static HostedFile hosted(const std::string& name, const std::string& bytes) {
    HostedFile file;
    file.descriptor.name = name;
    file.descriptor.mime_type = "application/octet-stream";
    file.source = std::make_shared<MemoryByteSource>(bytes);
    return file;
}

static std::string pattern(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) {
        s[i] = static_cast<char>(i % 251);
    }
    return s;
}

// Host and client in one room, client has requested `fileId` and both sides
// have exchanged offer and answer, so the host's scheduler holds the transfer.
static bool negotiate_download(Peer& host, Peer& client, const std::string& fileId) {
    std::string err;
    TEST_ASSERT(client.agent.requestFile(fileId, &err), "request: " + err);
    TEST_ASSERT(host.agent.pollOnce(), "host sees the request");
    TEST_ASSERT(host.negotiator.initiatedCount() >= 1, "host initiated a channel");
    TEST_ASSERT(client.agent.pollOnce(), "client takes the offer");
    TEST_ASSERT(client.receiver.isActive({host.id, fileId}), "receiver buffer opened for the host");
    TEST_ASSERT(host.agent.pollOnce(), "host takes the answer");
    return true;
}

static bool test_full_download() {
    SessionCoordinator coordinator;
    auto hub = std::make_shared<LoopbackNegotiator::Hub>();
    Peer host(coordinator, hub, "host-peer");
    Peer client(coordinator, hub, "client-peer");
    TEST_ASSERT(host.connect() && client.connect(), "connect");

    std::string room, err;
    TEST_ASSERT(host.agent.createRoom(&room, &err), "create: " + err);
    TEST_ASSERT(room.size() == 8, "room code");
    TEST_ASSERT(host.agent.role() == SessionRole::HOST && host.agent.hostId() == "host-peer", "host role");

    const std::string data = pattern(150000);
    TEST_ASSERT(host.agent.offerFiles({hosted("photo.raw", data)}, &err), "offer: " + err);
    const std::vector<FileDescriptor> offered = host.agent.files();
    TEST_ASSERT(offered.size() == 1 && offered[0].size == data.size() && !offered[0].id.empty(),
                "descriptor sized from its source");
    const std::string fileId = offered[0].id;

    TEST_ASSERT(client.agent.joinRoom(room, &err), "join: " + err);
    TEST_ASSERT(client.agent.role() == SessionRole::CLIENT && client.agent.hostId() == "host-peer", "client role");
    TEST_ASSERT(client.agent.files() == offered, "client sees the file list on join");
    TEST_ASSERT(client.files_updates == 1, "files-updated on join");

    if (!negotiate_download(host, client, fileId)) return false;
    TEST_ASSERT(host.agent.peerCounts().at(fileId) == 1, "host sees one active download");
    TEST_ASSERT(host.agent.clientCount() == 1, "host sees one client");

    for (int i = 0; i < 5 && client.sink->files().empty(); ++i) {
        host.scheduler.runTick();
    }
    const auto received = client.sink->files();
    TEST_ASSERT(received.size() == 1, "file delivered");
    TEST_ASSERT(received[0].bytes == data, "bytes intact");
    TEST_ASSERT(received[0].name == "photo.raw", "name carried by metadata");
    TEST_ASSERT(host.uploads_completed == 1 && host.upload_failures.empty(), "host upload completed");
    TEST_ASSERT(!client.receiver.isActive({host.id, fileId}), "receiver buffer released");

    // The completion reaches the coordinator from the poll thread, not the channel handler.
    TEST_ASSERT(coordinator.activeDownloadCounts(room).at(fileId) == 1, "download-complete not sent inline");
    TEST_ASSERT(client.agent.pollOnce(), "client polls");
    const DownloadCounts counts = coordinator.activeDownloadCounts(room);
    TEST_ASSERT(counts.count(fileId) == 0 || counts.at(fileId) == 0, "download-complete recorded");
    return true;
}

static bool test_file_list_refresh() {
    SessionCoordinator coordinator;
    auto hub = std::make_shared<LoopbackNegotiator::Hub>();
    Peer host(coordinator, hub, "host-peer");
    Peer client(coordinator, hub, "client-peer");
    TEST_ASSERT(host.connect() && client.connect(), "connect");

    std::string room, err;
    TEST_ASSERT(host.agent.createRoom(&room, &err), "create: " + err);
    TEST_ASSERT(host.agent.offerFiles({hosted("a.bin", "aaaa")}, &err), "offer: " + err);
    TEST_ASSERT(client.agent.joinRoom(room, &err), "join: " + err);
    TEST_ASSERT(client.agent.pollOnce(), "client poll");

    // File list stamps have millisecond resolution.
    std::this_thread::sleep_for(5ms);
    TEST_ASSERT(host.agent.offerFiles({hosted("a.bin", "aaaa"), hosted("b.bin", "bb")}, &err), "re-offer: " + err);
    const int before = client.files_updates;
    TEST_ASSERT(client.agent.pollOnce(), "client poll after change");
    TEST_ASSERT(client.agent.files().size() == 2, "client picked up the new list");
    TEST_ASSERT(client.files_updates == before + 1, "one files-updated for the change");

    TEST_ASSERT(client.agent.pollOnce(), "quiet poll");
    TEST_ASSERT(client.files_updates == before + 1, "unchanged list is not re-announced");
    return true;
}

static bool test_host_leaves() {
    SessionCoordinator coordinator;
    auto hub = std::make_shared<LoopbackNegotiator::Hub>();
    Peer host(coordinator, hub, "host-peer");
    Peer client(coordinator, hub, "client-peer");
    TEST_ASSERT(host.connect() && client.connect(), "connect");

    std::string room, err;
    TEST_ASSERT(host.agent.createRoom(&room, &err), "create: " + err);
    TEST_ASSERT(client.agent.joinRoom(room, &err), "join: " + err);

    host.agent.leave();
    TEST_ASSERT(!host.agent.isActive(), "host inactive");
    TEST_ASSERT(host.ended.size() == 1 && host.ended[0] == SessionEndReason::LEFT, "host ended by leaving");
    TEST_ASSERT(coordinator.roomCount() == 0, "room closed");

    TEST_ASSERT(!client.agent.pollOnce(), "client session ends on the next poll");
    TEST_ASSERT(client.ended.size() == 1 && client.ended[0] == SessionEndReason::ROOM_NOT_FOUND,
                "client told the room is gone");
    TEST_ASSERT(!client.agent.pollOnce(), "ended session stays ended");
    return true;
}

static bool test_host_goes_stale() {
    ManualClock clock;
    SessionCoordinator coordinator(CoordinatorConfig(), clock.fn());
    auto hub = std::make_shared<LoopbackNegotiator::Hub>();
    Peer host(coordinator, hub, "host-peer");
    Peer client(coordinator, hub, "client-peer");
    TEST_ASSERT(host.connect() && client.connect(), "connect");

    std::string room, err;
    TEST_ASSERT(host.agent.createRoom(&room, &err), "create: " + err);
    TEST_ASSERT(client.agent.joinRoom(room, &err), "join: " + err);
    TEST_ASSERT(client.agent.pollOnce(), "host alive");

    clock.advance(coordinator.config().stale_timeout + 1000ms);
    TEST_ASSERT(!client.agent.pollOnce(), "session ends once the host is stale");
    TEST_ASSERT(client.ended.size() == 1 && client.ended[0] == SessionEndReason::HOST_OFFLINE,
                "client told the host is offline");

    Peer late(coordinator, hub, "late-peer");
    TEST_ASSERT(late.connect(), "connect");
    TEST_ASSERT(!late.agent.joinRoom(room, &err), "cannot join a room whose host is offline");
    return true;
}

static bool test_vanished_client_cancels_upload() {
    SessionCoordinator coordinator;
    auto hub = std::make_shared<LoopbackNegotiator::Hub>();
    Peer host(coordinator, hub, "host-peer");
    Peer client(coordinator, hub, "client-peer");
    TEST_ASSERT(host.connect() && client.connect(), "connect");

    std::string room, err;
    TEST_ASSERT(host.agent.createRoom(&room, &err), "create: " + err);
    TEST_ASSERT(host.agent.offerFiles({hosted("big.bin", pattern(4096))}, &err), "offer: " + err);
    TEST_ASSERT(client.agent.joinRoom(room, &err), "join: " + err);
    const std::string fileId = host.agent.files().at(0).id;
    if (!negotiate_download(host, client, fileId)) return false;

    // The client drops out of the room while its channel is still open.
    client.transport.leave();

    TEST_ASSERT(host.agent.pollOnce(), "host notices the departure");
    TEST_ASSERT(host.agent.clientCount() == 0, "client count dropped");
    host.scheduler.runTick();
    TEST_ASSERT(host.upload_failures.size() == 1, "upload cancelled");
    TEST_ASSERT(host.upload_failures[0].first == TransferKey({"client-peer", fileId}), "cancelled the right key");
    TEST_ASSERT(host.upload_failures[0].second == TransferError::CANCELLED, "reported as cancelled");
    TEST_ASSERT(host.scheduler.activeCount() == 0, "scheduler empty");
    TEST_ASSERT(client.sink->files().empty(), "nothing delivered");
    return true;
}

static bool test_client_closes_channel() {
    SessionCoordinator coordinator;
    auto hub = std::make_shared<LoopbackNegotiator::Hub>();
    Peer host(coordinator, hub, "host-peer");
    Peer client(coordinator, hub, "client-peer");
    TEST_ASSERT(host.connect() && client.connect(), "connect");

    std::string room, err;
    TEST_ASSERT(host.agent.createRoom(&room, &err), "create: " + err);
    TEST_ASSERT(host.agent.offerFiles({hosted("big.bin", pattern(4096))}, &err), "offer: " + err);
    TEST_ASSERT(client.agent.joinRoom(room, &err), "join: " + err);
    const std::string fileId = host.agent.files().at(0).id;
    if (!negotiate_download(host, client, fileId)) return false;
    TEST_ASSERT(host.scheduler.activeCount() == 1, "upload registered");

    client.agent.leave();
    TEST_ASSERT(client.ended.size() == 1 && client.ended[0] == SessionEndReason::LEFT, "client left");

    // The closed channel alone ends the upload, before the host polls.
    host.scheduler.runTick();
    TEST_ASSERT(host.upload_failures.size() == 1, "upload failed once");
    TEST_ASSERT(host.upload_failures[0].first == TransferKey({"client-peer", fileId}), "failed the right key");
    TEST_ASSERT(host.upload_failures[0].second == TransferError::CHANNEL_FAILURE, "reported as channel failure");
    TEST_ASSERT(host.scheduler.activeCount() == 0, "scheduler empty");

    TEST_ASSERT(host.agent.pollOnce(), "host notices the departure");
    host.scheduler.runTick();
    TEST_ASSERT(host.upload_failures.size() == 1, "no second report");
    return true;
}

static bool test_errors() {
    SessionCoordinator coordinator;
    auto hub = std::make_shared<LoopbackNegotiator::Hub>();
    Peer host(coordinator, hub, "host-peer");
    Peer client(coordinator, hub, "client-peer");
    TEST_ASSERT(host.connect() && client.connect(), "connect");

    std::string err;
    TEST_ASSERT(!client.agent.joinRoom("deadbeef", &err) && !err.empty(), "join of a missing room");
    TEST_ASSERT(!client.agent.isActive(), "failed join leaves the agent idle");
    TEST_ASSERT(!client.agent.requestFile("x", &err), "request outside a room");
    TEST_ASSERT(!host.agent.offerFiles({hosted("a", "a")}, &err), "offer outside a room");

    std::string room;
    TEST_ASSERT(host.agent.createRoom(&room, &err), "create: " + err);
    TEST_ASSERT(!host.agent.createRoom(&room, &err), "second room while hosting");

    HostedFile sourceless;
    sourceless.descriptor.name = "ghost";
    TEST_ASSERT(!host.agent.offerFiles({sourceless}, &err), "file without a source");

    HostedFile a = hosted("a", "a");
    HostedFile b = hosted("b", "b");
    a.descriptor.id = "same";
    b.descriptor.id = "same";
    TEST_ASSERT(!host.agent.offerFiles({a, b}, &err), "duplicate ids");

    TEST_ASSERT(host.agent.offerFiles({hosted("real", "r")}, &err), "offer: " + err);
    TEST_ASSERT(client.agent.joinRoom(room, &err), "join: " + err);
    TEST_ASSERT(!client.agent.requestFile("not-offered", &err) && !err.empty(), "unknown file id");
    TEST_ASSERT(!client.agent.offerFiles({hosted("c", "c")}, &err), "client cannot offer");
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);
    std::cout << "--- SessionAgent tests ---" << std::endl;

    if (test_full_download()) std::cout << "PASS: full download" << std::endl;
    if (test_file_list_refresh()) std::cout << "PASS: file list refresh" << std::endl;
    if (test_host_leaves()) std::cout << "PASS: host leaves" << std::endl;
    if (test_host_goes_stale()) std::cout << "PASS: host goes stale" << std::endl;
    if (test_vanished_client_cancels_upload()) std::cout << "PASS: vanished client cancels upload" << std::endl;
    if (test_client_closes_channel()) std::cout << "PASS: client closes channel" << std::endl;
    if (test_errors()) std::cout << "PASS: errors" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
