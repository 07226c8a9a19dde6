#include "app_bootstrap.h"
#include "config_manager.h"
#include "telemetry.h"

#include <filesystem>
#include <iostream>
#include <system_error>

std::string load_config_with_fallbacks(const std::string& config_path, const char* argv0,
                                       std::vector<std::string>* tried) {
    std::vector<std::string> candidates;
    candidates.push_back(config_path);
    candidates.push_back("../config.json");
    candidates.push_back("../../config.json");
    candidates.push_back("../../../config.json");

    // Also attempt paths relative to the executable location
    std::error_code ec;
    const std::filesystem::path exe_path = std::filesystem::absolute(argv0, ec);
    if (!ec) {
        const std::filesystem::path exe_dir = exe_path.parent_path();
        candidates.push_back((exe_dir / "config.json").string());
        candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
        candidates.push_back((exe_dir / "../../config.json").lexically_normal().string());
    }

    for (const auto& c : candidates) {
        if (tried) tried->push_back(c);
        if (!std::filesystem::exists(c, ec)) continue;
        if (ConfigManager::getInstance().loadConfig(c)) {
            return c;
        }
    }
    return "";
}

void apply_logging_config(const std::string& cli_level) {
    const ConfigManager& cfg = ConfigManager::getInstance();
    const std::string level = cli_level.empty() ? cfg.getLogLevel() : cli_level;
    set_log_level(parse_log_level(level, LogLevel::INFO));
    if (cfg.isAsyncLogging()) {
        enable_async_logging();
    }
}

void init_telemetry(const std::string& process_tag) {
    Telemetry::getInstance().initialize(process_tag, Telemetry::Config::fromConfigManager());
}

bool take_arg_value(int argc, char* argv[], int* i, std::string* out) {
    if (*i + 1 >= argc) {
        std::cerr << "Error: " << argv[*i] << " requires an argument" << std::endl;
        return false;
    }
    *out = argv[++(*i)];
    return true;
}
