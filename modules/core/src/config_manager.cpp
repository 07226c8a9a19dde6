#include "config_manager.h"
#include "logger.h"
#include <fstream>

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        LOG_WARN("CONFIG: Failed to open config file: " + config_path);
        return false;
    }

    try {
        json parsed = json::parse(config_file, nullptr, true, true);
        if (!parsed.is_object()) {
            LOG_ERROR("CONFIG: Top-level value in " + config_path + " is not an object");
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
    } catch (const json::exception& e) {
        LOG_ERROR("CONFIG: Config loading failed: " + std::string(e.what()));
        return false;
    }

    LOG_INFO("CONFIG: Configuration loaded from: " + config_path);
    return true;
}

bool ConfigManager::loadFromString(const std::string& json_text) {
    json parsed = json::parse(json_text, nullptr, false, true);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LOG_ERROR("CONFIG: Rejected malformed configuration text");
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = std::move(parsed);
    return true;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = json::object();
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& key_path, const json& value) {
    if (key_path.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < key_path.size(); ++i) {
        json& child = (*node)[key_path[i]];
        if (child.is_null()) {
            child = json::object();
        }
        if (!child.is_object()) {
            return false;
        }
        node = &child;
    }
    (*node)[key_path.back()] = value;
    return true;
}

bool ConfigManager::eraseValueAtPath(const std::vector<std::string>& key_path) {
    if (key_path.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < key_path.size(); ++i) {
        auto it = node->find(key_path[i]);
        if (it == node->end() || !it->is_object()) {
            return false;
        }
        node = &(*it);
    }
    return node->erase(key_path.back()) > 0;
}

// Caller holds m_mutex.
const json* ConfigManager::find(std::initializer_list<const char*> path) const {
    const json* node = &m_config;
    for (const char* key : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(key);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node;
}

int ConfigManager::intAt(std::initializer_list<const char*> path, int fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const json* node = find(path);
    if (node == nullptr || !node->is_number()) {
        return fallback;
    }
    return node->get<int>();
}

bool ConfigManager::boolAt(std::initializer_list<const char*> path, bool fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const json* node = find(path);
    if (node == nullptr || !node->is_boolean()) {
        return fallback;
    }
    return node->get<bool>();
}

std::string ConfigManager::stringAt(std::initializer_list<const char*> path, const std::string& fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const json* node = find(path);
    if (node == nullptr || !node->is_string()) {
        return fallback;
    }
    return node->get<std::string>();
}

int ConfigManager::getStaleTimeoutMs() const {
    return intAt({"coordinator", "stale_timeout_ms"}, 30000);
}

int ConfigManager::getSweepIntervalMs() const {
    return intAt({"coordinator", "sweep_interval_ms"}, 10000);
}

int ConfigManager::getRoomIdLength() const {
    return intAt({"coordinator", "room_id_length"}, 8);
}

std::string ConfigManager::getListenAddress() const {
    return stringAt({"coordinator", "listen_address"}, "0.0.0.0");
}

int ConfigManager::getListenPort() const {
    return intAt({"coordinator", "listen_port"}, 3001);
}

int ConfigManager::getIoThreads() const {
    return intAt({"coordinator", "io_threads"}, 2);
}

std::string ConfigManager::getSignalingTransport() const {
    return stringAt({"signaling", "transport"}, "poll");
}

std::string ConfigManager::getServerUrl() const {
    return stringAt({"signaling", "server_url"}, "http://127.0.0.1:3001");
}

int ConfigManager::getPollIntervalMs() const {
    return intAt({"signaling", "poll_interval_ms"}, 2000);
}

int ConfigManager::getRequestPollDelayMs() const {
    return intAt({"signaling", "request_poll_delay_ms"}, 500);
}

int ConfigManager::getRequestTimeoutMs() const {
    return intAt({"signaling", "request_timeout_ms"}, 5000);
}

int ConfigManager::getChunkSize() const {
    return intAt({"transfer", "chunk_size"}, 65536);
}

int ConfigManager::getMaxBufferBytes() const {
    return intAt({"transfer", "max_buffer_bytes"}, 2 * 1024 * 1024);
}

int ConfigManager::getChunksPerTick() const {
    return intAt({"transfer", "chunks_per_tick"}, 16);
}

int ConfigManager::getTickIntervalMs() const {
    return intAt({"transfer", "tick_interval_ms"}, 1);
}

int ConfigManager::getCompletionDrainThreshold() const {
    return intAt({"transfer", "completion_drain_threshold"}, 1000);
}

int ConfigManager::getCompletionBackoffMs() const {
    return intAt({"transfer", "completion_backoff_ms"}, 10);
}

bool ConfigManager::acceptShortComplete() const {
    return boolAt({"transfer", "accept_short_complete"}, false);
}

std::vector<std::string> ConfigManager::getAdvertiseHosts() const {
    std::vector<std::string> hosts;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const json* node = find({"channel", "advertise_hosts"});
        if (node != nullptr && node->is_array()) {
            for (const auto& host : *node) {
                if (host.is_string()) {
                    hosts.push_back(host.get<std::string>());
                }
            }
        }
    }
    if (hosts.empty()) {
        hosts.push_back("127.0.0.1");
    }
    return hosts;
}

int ConfigManager::getConnectTimeoutMs() const {
    return intAt({"channel", "connect_timeout_ms"}, 5000);
}

int ConfigManager::getSendQueueLimitBytes() const {
    return intAt({"channel", "send_queue_limit_bytes"}, 16 * 1024 * 1024);
}

std::string ConfigManager::getLogLevel() const {
    return stringAt({"logging", "level"}, "info");
}

bool ConfigManager::isAsyncLogging() const {
    return boolAt({"logging", "async"}, false);
}

bool ConfigManager::isTelemetryEnabled() const {
    return boolAt({"telemetry", "enabled"}, false);
}

int ConfigManager::getTelemetryFlushIntervalMs() const {
    return intAt({"telemetry", "flush_interval_ms"}, 30000);
}

std::string ConfigManager::getTelemetryFilePath() const {
    return stringAt({"telemetry", "file_path"}, "");
}
