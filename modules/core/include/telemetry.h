#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

// Process-wide counters for a coordinator or peer process.
//
// Nothing is exported over the network. A report is one JSON line that goes
// to the log and, when file_path is set, is appended to a JSONL file. Reports
// are written by tick() once flush_interval has passed, and by flush().
// Recording calls are no-ops until initialize() enables the registry.
class Telemetry final {
public:
    struct Config {
        bool enabled = false;
        std::chrono::milliseconds flush_interval{30000};   // <= 0 disables periodic reports
        std::string file_path;

        // Reads the "telemetry" section of config.json.
        static Config fromConfigManager();
    };

    static Telemetry& getInstance();

    // May be called again; the latest config wins and recorded values are kept.
    void initialize(const std::string& process_tag, const Config& cfg);
    bool is_enabled() const;

    void tick();
    void flush(const std::string& reason);
    std::string snapshot_json(const std::string& reason = "snapshot") const;

    void inc_counter(const std::string& name, int64_t delta = 1);
    void set_gauge(const std::string& name, int64_t value);
    void observe_hist_ms(const std::string& name, int64_t ms);

    int64_t counter(const std::string& name) const;

    // Disables recording and drops every value. For tests.
    void reset();

private:
    Telemetry() = default;
    Telemetry(const Telemetry&) = delete;
    Telemetry& operator=(const Telemetry&) = delete;

    struct Timing {
        int64_t count = 0;
        int64_t total = 0;
        int64_t lowest = 0;
        int64_t highest = 0;
    };

    std::string reportLocked(const std::string& reason) const;
    void writeReport(const std::string& line, const std::string& path) const;

    mutable std::mutex m_mutex;
    bool m_enabled = false;
    Config m_config;
    std::string m_tag;
    std::chrono::steady_clock::time_point m_started;
    std::chrono::steady_clock::time_point m_last_report;

    std::map<std::string, int64_t> m_counters;
    std::map<std::string, int64_t> m_gauges;
    std::map<std::string, Timing> m_timings;
};
