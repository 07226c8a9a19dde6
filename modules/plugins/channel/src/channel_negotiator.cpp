#include "channel_negotiator.h"
#include "config_manager.h"

#include <algorithm>

ChannelConfig ChannelConfig::fromConfigManager() {
    const ConfigManager& cm = ConfigManager::getInstance();
    ChannelConfig cfg;
    auto hosts = cm.getAdvertiseHosts();
    if (!hosts.empty()) {
        cfg.advertise_hosts = std::move(hosts);
    }
    cfg.connect_timeout = std::chrono::milliseconds(std::max(1, cm.getConnectTimeoutMs()));
    cfg.send_queue_limit = static_cast<size_t>(std::max(1, cm.getSendQueueLimitBytes()));
    return cfg;
}
