#include "telemetry.h"

#include "config_manager.h"
#include "logger.h"

#include <nlohmann/json.hpp>

#include <fstream>

Telemetry::Config Telemetry::Config::fromConfigManager() {
    const ConfigManager& cm = ConfigManager::getInstance();
    Config cfg;
    cfg.enabled = cm.isTelemetryEnabled();
    cfg.flush_interval = std::chrono::milliseconds(cm.getTelemetryFlushIntervalMs());
    cfg.file_path = cm.getTelemetryFilePath();
    return cfg;
}

Telemetry& Telemetry::getInstance() {
    static Telemetry instance;
    return instance;
}

void Telemetry::initialize(const std::string& process_tag, const Config& cfg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = std::chrono::steady_clock::now();
    if (!m_enabled) {
        m_started = now;
        m_last_report = now;
    }
    m_tag = process_tag;
    m_config = cfg;
    m_enabled = cfg.enabled;
}

bool Telemetry::is_enabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_enabled;
}

void Telemetry::tick() {
    std::string line;
    std::string path;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_enabled || m_config.flush_interval.count() <= 0) return;
        const auto now = std::chrono::steady_clock::now();
        if (now - m_last_report < m_config.flush_interval) return;
        m_last_report = now;
        line = reportLocked("periodic");
        path = m_config.file_path;
    }
    writeReport(line, path);
}

void Telemetry::flush(const std::string& reason) {
    std::string line;
    std::string path;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_enabled) return;
        m_last_report = std::chrono::steady_clock::now();
        line = reportLocked(reason);
        path = m_config.file_path;
    }
    writeReport(line, path);
}

std::string Telemetry::snapshot_json(const std::string& reason) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_enabled) return "{}";
    return reportLocked(reason);
}

void Telemetry::inc_counter(const std::string& name, int64_t delta) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_enabled) m_counters[name] += delta;
}

void Telemetry::set_gauge(const std::string& name, int64_t value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_enabled) m_gauges[name] = value;
}

void Telemetry::observe_hist_ms(const std::string& name, int64_t ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_enabled) return;
    Timing& t = m_timings[name];
    if (t.count == 0 || ms < t.lowest) t.lowest = ms;
    if (t.count == 0 || ms > t.highest) t.highest = ms;
    t.count++;
    t.total += ms;
}

int64_t Telemetry::counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_counters.find(name);
    return it == m_counters.end() ? 0 : it->second;
}

void Telemetry::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_enabled = false;
    m_config = Config();
    m_tag.clear();
    m_counters.clear();
    m_gauges.clear();
    m_timings.clear();
}

std::string Telemetry::reportLocked(const std::string& reason) const {
    using namespace std::chrono;
    nlohmann::json report;
    report["process"] = m_tag;
    report["reason"] = reason;
    report["ts_ms"] = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    report["uptime_ms"] = duration_cast<milliseconds>(steady_clock::now() - m_started).count();
    report["counters"] = m_counters;
    report["gauges"] = m_gauges;

    nlohmann::json timings = nlohmann::json::object();
    for (const auto& entry : m_timings) {
        const Timing& t = entry.second;
        timings[entry.first] = {
            {"count", t.count},
            {"avg", t.count == 0 ? 0 : t.total / t.count},
            {"min", t.lowest},
            {"max", t.highest},
        };
    }
    report["timings_ms"] = std::move(timings);
    return report.dump();
}

void Telemetry::writeReport(const std::string& line, const std::string& path) const {
    LOG_INFO("TELEMETRY: " + line);
    if (path.empty()) return;

    std::ofstream out(path, std::ios::app);
    if (!out) {
        LOG_WARN("TELEMETRY: cannot append to " + path);
        return;
    }
    out << line << '\n';
}
