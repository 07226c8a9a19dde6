#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <initializer_list>

using json = nlohmann::json;

// Process-wide configuration backed by config.json.
// Every getter falls back to a built-in default when the key is absent,
// so a partial (or missing) config file still yields a working setup.
class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& json_text);
    void reset();

    // Overrides used by tests and CLI flags
    bool setValueAtPath(const std::vector<std::string>& key_path, const json& value);
    bool eraseValueAtPath(const std::vector<std::string>& key_path);

    // Coordinator
    int getStaleTimeoutMs() const;
    int getSweepIntervalMs() const;
    int getRoomIdLength() const;
    std::string getListenAddress() const;
    int getListenPort() const;
    int getIoThreads() const;

    // Signaling
    std::string getSignalingTransport() const;
    std::string getServerUrl() const;
    int getPollIntervalMs() const;
    int getRequestPollDelayMs() const;
    int getRequestTimeoutMs() const;

    // Transfer
    int getChunkSize() const;
    int getMaxBufferBytes() const;
    int getChunksPerTick() const;
    int getTickIntervalMs() const;
    int getCompletionDrainThreshold() const;
    int getCompletionBackoffMs() const;
    bool acceptShortComplete() const;

    // Data channel
    std::vector<std::string> getAdvertiseHosts() const;
    int getConnectTimeoutMs() const;
    int getSendQueueLimitBytes() const;

    // Logging
    std::string getLogLevel() const;
    bool isAsyncLogging() const;

    // Telemetry
    bool isTelemetryEnabled() const;
    int getTelemetryFlushIntervalMs() const;
    std::string getTelemetryFilePath() const;

private:
    ConfigManager() = default;

    const json* find(std::initializer_list<const char*> path) const;
    int intAt(std::initializer_list<const char*> path, int fallback) const;
    bool boolAt(std::initializer_list<const char*> path, bool fallback) const;
    std::string stringAt(std::initializer_list<const char*> path, const std::string& fallback) const;

    mutable std::mutex m_mutex;
    json m_config = json::object();
};
