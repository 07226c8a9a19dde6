#include "channel_negotiator.h"
#include "config_manager.h"
#include "logger.h"
#include "session_agent.h"
#include "session_coordinator.h"
#include "telemetry.h"
#include "transfer_receiver.h"
#include "transfer_scheduler.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool test_defaults() {
    ConfigManager& cm = ConfigManager::getInstance();
    cm.reset();
    TEST_ASSERT(cm.getStaleTimeoutMs() == 30000, "stale timeout default");
    TEST_ASSERT(cm.getSweepIntervalMs() == 10000, "sweep interval default");
    TEST_ASSERT(cm.getRoomIdLength() == 8, "room id length default");
    TEST_ASSERT(cm.getListenPort() == 3001, "listen port default");
    TEST_ASSERT(cm.getSignalingTransport() == "poll", "transport default");
    TEST_ASSERT(cm.getChunkSize() == 65536, "chunk size default");
    TEST_ASSERT(cm.getMaxBufferBytes() == 2 * 1024 * 1024, "buffer ceiling default");
    TEST_ASSERT(cm.getCompletionDrainThreshold() == 1000, "drain threshold default");
    TEST_ASSERT(!cm.acceptShortComplete(), "strict completion by default");
    TEST_ASSERT(cm.getAdvertiseHosts() == std::vector<std::string>{"127.0.0.1"}, "advertise host default");
    return true;
}

static bool test_load_file() {
    const auto path = std::filesystem::temp_directory_path() / "droproom_config_test.json";
    {
        std::ofstream out(path);
        out << R"({
            // comments are accepted
            "coordinator": { "stale_timeout_ms": 5000, "room_id_length": 6 },
            "transfer": { "chunk_size": 1024, "accept_short_complete": true },
            "channel": { "advertise_hosts": ["10.0.0.5", 7, "192.168.1.2"] }
        })";
    }

    ConfigManager& cm = ConfigManager::getInstance();
    cm.reset();
    TEST_ASSERT(cm.loadConfig(path.string()), "config file loads");
    TEST_ASSERT(cm.getStaleTimeoutMs() == 5000, "stale timeout read");
    TEST_ASSERT(cm.getRoomIdLength() == 6, "room id length read");
    TEST_ASSERT(cm.getSweepIntervalMs() == 10000, "absent key keeps its default");
    TEST_ASSERT(cm.getChunkSize() == 1024 && cm.acceptShortComplete(), "transfer section read");
    const auto hosts = cm.getAdvertiseHosts();
    TEST_ASSERT(hosts.size() == 2 && hosts[0] == "10.0.0.5" && hosts[1] == "192.168.1.2",
                "non-string hosts skipped");

    std::error_code ec;
    std::filesystem::remove(path, ec);
    TEST_ASSERT(!cm.loadConfig(path.string()), "missing file reported");
    TEST_ASSERT(cm.getStaleTimeoutMs() == 5000, "failed load keeps the previous values");

    TEST_ASSERT(!cm.loadFromString("[1, 2]"), "non-object rejected");
    TEST_ASSERT(!cm.loadFromString("{ broken"), "malformed text rejected");
    cm.reset();
    return true;
}

static bool test_overrides() {
    ConfigManager& cm = ConfigManager::getInstance();
    cm.reset();
    TEST_ASSERT(cm.setValueAtPath({"signaling", "poll_interval_ms"}, 250), "nested value set");
    TEST_ASSERT(cm.getPollIntervalMs() == 250, "override visible");
    TEST_ASSERT(cm.setValueAtPath({"transfer", "chunk_size"}, "big"), "wrong type stored");
    TEST_ASSERT(cm.getChunkSize() == 65536, "wrong type falls back to the default");

    TEST_ASSERT(!cm.setValueAtPath({"signaling", "poll_interval_ms", "x"}, 1), "cannot descend into a number");
    TEST_ASSERT(!cm.setValueAtPath({}, 1), "empty path rejected");

    TEST_ASSERT(cm.eraseValueAtPath({"signaling", "poll_interval_ms"}), "erase");
    TEST_ASSERT(cm.getPollIntervalMs() == 2000, "default after erase");
    TEST_ASSERT(!cm.eraseValueAtPath({"signaling", "poll_interval_ms"}), "second erase finds nothing");
    TEST_ASSERT(!cm.eraseValueAtPath({"nowhere", "key"}), "missing section");
    cm.reset();
    return true;
}

static bool test_component_configs() {
    ConfigManager& cm = ConfigManager::getInstance();
    TEST_ASSERT(cm.loadFromString(R"({
        "coordinator": { "stale_timeout_ms": 1500, "sweep_interval_ms": 500, "room_id_length": 10 },
        "signaling": { "poll_interval_ms": 1, "request_poll_delay_ms": -5 },
        "transfer": { "chunk_size": 4096, "chunks_per_tick": 0, "completion_backoff_ms": 3,
                      "accept_short_complete": true },
        "channel": { "advertise_hosts": ["10.1.1.1", "10.1.1.2"], "connect_timeout_ms": 900 }
    })"), "config text loads");

    const CoordinatorConfig coord = CoordinatorConfig::fromConfigManager();
    TEST_ASSERT(coord.stale_timeout.count() == 1500 && coord.sweep_interval.count() == 500, "coordinator timings");
    TEST_ASSERT(coord.room_id_length == 10, "coordinator room id length");

    const SchedulerConfig sched = SchedulerConfig::fromConfigManager();
    TEST_ASSERT(sched.chunk_size == 4096, "chunk size");
    TEST_ASSERT(sched.chunks_per_tick == 1, "chunks per tick clamped to at least one");
    TEST_ASSERT(sched.completion_backoff.count() == 3, "completion backoff");

    TEST_ASSERT(ReceiverConfig::fromConfigManager().accept_short_complete, "receiver leniency");

    const ChannelConfig chan = ChannelConfig::fromConfigManager();
    TEST_ASSERT(chan.advertise_hosts.size() == 2 && chan.advertise_hosts[0] == "10.1.1.1", "advertised hosts");
    TEST_ASSERT(chan.connect_timeout.count() == 900, "connect timeout");

    const AgentConfig agent = AgentConfig::fromConfigManager();
    TEST_ASSERT(agent.poll_interval.count() == 10, "poll interval floor");
    TEST_ASSERT(agent.request_poll_delay.count() == 0, "negative delay clamped");
    TEST_ASSERT(agent.run_poll_loop, "loop on by default");

    cm.reset();
    return true;
}

static bool test_telemetry() {
    ConfigManager& cm = ConfigManager::getInstance();
    Telemetry& t = Telemetry::getInstance();
    t.reset();

    t.inc_counter("rooms_total");
    TEST_ASSERT(t.counter("rooms_total") == 0, "nothing recorded while disabled");
    TEST_ASSERT(t.snapshot_json() == "{}", "disabled snapshot is empty");

    TEST_ASSERT(cm.loadFromString(R"({ "telemetry": { "enabled": true, "flush_interval_ms": 0 } })"),
                "telemetry section loads");
    const Telemetry::Config tcfg = Telemetry::Config::fromConfigManager();
    TEST_ASSERT(tcfg.enabled && tcfg.flush_interval.count() == 0 && tcfg.file_path.empty(), "telemetry config read");

    t.initialize("config-test", tcfg);
    t.inc_counter("rooms_total");
    t.inc_counter("bytes_sent", 40);
    t.set_gauge("rooms_active", 3);
    t.observe_hist_ms("transfer_duration_ms", 10);
    t.observe_hist_ms("transfer_duration_ms", 30);
    TEST_ASSERT(t.counter("rooms_total") == 1 && t.counter("bytes_sent") == 40, "counters accumulate");
    t.tick();

    const nlohmann::json snap = nlohmann::json::parse(t.snapshot_json("check"));
    TEST_ASSERT(snap["process"] == "config-test" && snap["reason"] == "check", "report header");
    TEST_ASSERT(snap["gauges"]["rooms_active"] == 3, "gauge reported");
    const auto& timing = snap["timings_ms"]["transfer_duration_ms"];
    TEST_ASSERT(timing["count"] == 2 && timing["avg"] == 20, "timing count and average");
    TEST_ASSERT(timing["min"] == 10 && timing["max"] == 30, "timing bounds");

    t.initialize("renamed", tcfg);
    TEST_ASSERT(t.counter("bytes_sent") == 40, "re-initialize keeps values");

    t.reset();
    cm.reset();
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "--- Config tests ---" << std::endl;

    if (test_defaults()) std::cout << "PASS: defaults" << std::endl;
    if (test_load_file()) std::cout << "PASS: load file" << std::endl;
    if (test_overrides()) std::cout << "PASS: overrides" << std::endl;
    if (test_component_configs()) std::cout << "PASS: component configs" << std::endl;
    if (test_telemetry()) std::cout << "PASS: telemetry" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
