#include "app_bootstrap.h"
#include "config_manager.h"
#include "coordinator_server.h"
#include "logger.h"
#include "poll_gateway.h"
#include "push_gateway.h"
#include "session_coordinator.h"
#include "stale_sweeper.h"
#include "telemetry.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_stop_requested(false);

static void handle_signal(int) {
    g_stop_requested = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --port PORT     Listen port (default: 3001, or coordinator.listen_port)\n"
              << "  --config FILE   Path to configuration file (default: config.json)\n"
              << "  --log-level LVL Log level: debug|info|warning|error|none (default: info)\n"
              << "  --help          Show this help message\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    // Ignore SIGPIPE to prevent process termination on socket write errors
    signal(SIGPIPE, SIG_IGN);

    std::string config_path = "config.json";
    bool explicit_config = false;
    std::string log_level;
    int port = -1;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (!take_arg_value(argc, argv, &i, &config_path)) return 1;
            explicit_config = true;
        } else if (arg == "--log-level") {
            if (!take_arg_value(argc, argv, &i, &log_level)) return 1;
        } else if (arg == "--port") {
            std::string value;
            if (!take_arg_value(argc, argv, &i, &value)) return 1;
            try {
                int p = std::stoi(value);
                if (p < 0 || p > 65535) {
                    std::cerr << "Error: Port must be between 0 and 65535" << std::endl;
                    return 1;
                }
                port = p;
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid port number: " << e.what() << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    std::vector<std::string> tried;
    const std::string chosen_config = load_config_with_fallbacks(config_path, argv[0], &tried);
    if (chosen_config.empty() && explicit_config) {
        std::cerr << "CRITICAL ERROR: Failed to load configuration. Tried paths:" << std::endl;
        for (const auto& c : tried) {
            std::cerr << "  - " << c << std::endl;
        }
        return 1;
    }

    set_log_tag("server");
    apply_logging_config(log_level);
    init_telemetry("droproom-server");

    const ConfigManager& cfg = ConfigManager::getInstance();
    if (port < 0) port = cfg.getListenPort();

    SessionCoordinator coordinator(CoordinatorConfig::fromConfigManager());
    PollGateway poll(coordinator);
    PushGateway push(coordinator);
    // Poll-side changes reach pushed peers in mixed rooms.
    poll.setObserver(&push);

    StaleSweeper sweeper(coordinator, coordinator.config().sweep_interval);
    sweeper.setReportListener([&push](const SweepReport& report) { push.onSweepReport(report); });

    CoordinatorServer server(poll, push);
    std::string err;
    if (!server.start(cfg.getListenAddress(), static_cast<uint16_t>(port), cfg.getIoThreads(), &err)) {
        std::cerr << "Error: Failed to start coordinator: " << err << std::endl;
        return 1;
    }
    if (!sweeper.start()) {
        std::cerr << "Error: Failed to start stale sweeper" << std::endl;
        server.stop();
        return 1;
    }

    signal(SIGINT, handle_signal);
    signal(SIGTERM, handle_signal);

    LOG_INFO("MAIN: droproom coordinator listening on " + cfg.getListenAddress() + ":" +
             std::to_string(server.port()) + (chosen_config.empty() ? " (built-in defaults)" : ""));
    std::cout << "droproom coordinator on port " << server.port() << std::endl;

    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        Telemetry::getInstance().tick();
    }

    LOG_INFO("MAIN: Shutting down");
    sweeper.stop();
    server.stop();
    push.detachAll();
    coordinator.shutdown();
    Telemetry::getInstance().flush("shutdown");
    disable_async_logging();
    return 0;
}
