#include "app_bootstrap.h"
#include "config_manager.h"
#include "logger.h"
#include "peer_node.h"
#include "terminal_cli.h"

#include <iostream>
#include <signal.h>
#include <string>
#include <vector>

static TerminalCLI* g_cli = nullptr;

static void handle_signal(int) {
    if (g_cli) g_cli->stop();
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " (--host [--room ID] --file PATH... | --join ROOM) [OPTIONS]\n\n"
              << "Roles:\n"
              << "  --host              Host a room (a fresh code unless --room is given)\n"
              << "  --room ID           Room code to host under\n"
              << "  --file PATH         File to offer (repeatable)\n"
              << "  --join ROOM         Join a room as a client\n"
              << "\nOptions:\n"
              << "  --download-dir DIR  Where downloads are saved (default: downloads)\n"
              << "  --transport MODE    poll|push (default: from config, else poll)\n"
              << "  --server URL        Coordinator url (default: http://127.0.0.1:3001)\n"
              << "  --id ID             Explicit peer id (useful for testing)\n"
              << "  --config FILE       Path to configuration file (default: config.json)\n"
              << "  --log-level LVL     debug|info|warning|error|none\n"
              << "  --daemon            No interactive prompt (background/testing)\n"
              << "  --help              Show this help message\n"
              << "\nInteractive commands: files, get <id>, status, logfilter, leave, quit\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    // Ignore SIGPIPE to prevent process termination on socket write errors
    signal(SIGPIPE, SIG_IGN);

    bool host = false;
    std::string room_id;
    std::string join_room;
    std::vector<std::string> files;
    PeerNode::Options options;
    std::string config_path = "config.json";
    bool explicit_config = false;
    std::string log_level;
    bool daemon_mode = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--host") {
            host = true;
        } else if (arg == "--room") {
            if (!take_arg_value(argc, argv, &i, &room_id)) return 1;
        } else if (arg == "--file") {
            std::string path;
            if (!take_arg_value(argc, argv, &i, &path)) return 1;
            files.push_back(path);
        } else if (arg == "--join") {
            if (!take_arg_value(argc, argv, &i, &join_room)) return 1;
        } else if (arg == "--download-dir") {
            if (!take_arg_value(argc, argv, &i, &options.download_dir)) return 1;
        } else if (arg == "--transport") {
            if (!take_arg_value(argc, argv, &i, &options.transport)) return 1;
        } else if (arg == "--server") {
            if (!take_arg_value(argc, argv, &i, &options.server_url)) return 1;
        } else if (arg == "--id") {
            if (!take_arg_value(argc, argv, &i, &options.peer_id)) return 1;
        } else if (arg == "--config") {
            if (!take_arg_value(argc, argv, &i, &config_path)) return 1;
            explicit_config = true;
        } else if (arg == "--log-level") {
            if (!take_arg_value(argc, argv, &i, &log_level)) return 1;
        } else if (arg == "--daemon") {
            daemon_mode = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (host == !join_room.empty()) {
        std::cerr << "Error: pick exactly one of --host or --join" << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    if (host && files.empty()) {
        std::cerr << "Error: --host needs at least one --file" << std::endl;
        return 1;
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
    apply_logging_config(log_level);

    PeerNode node;
    // CLI first so its log callback sees startup lines.
    TerminalCLI cli(node, daemon_mode);
    g_cli = &cli;
    signal(SIGINT, handle_signal);
    signal(SIGTERM, handle_signal);

    std::string err;
    if (!node.start(options, &err)) {
        std::cerr << "Error: Failed to start peer: " << err << std::endl;
        g_cli = nullptr;
        return 1;
    }
    init_telemetry(node.getPeerId());
    if (chosen_config.empty()) {
        LOG_INFO("MAIN: No config.json found, using built-in defaults");
    }

    if (host) {
        std::string room;
        if (!node.hostRoom(room_id, &room, &err)) {
            std::cerr << "Error: Cannot host room: " << err << std::endl;
            g_cli = nullptr;
            return 1;
        }
        if (!node.shareFiles(files, &err)) {
            std::cerr << "Error: Cannot share files: " << err << std::endl;
            g_cli = nullptr;
            return 1;
        }
        std::cout << "Room code: " << room << std::endl;
    } else {
        if (!node.joinRoom(join_room, &err)) {
            std::cerr << "Error: Cannot join room " << join_room << ": " << err << std::endl;
            g_cli = nullptr;
            return 1;
        }
    }

    cli.run();

    g_cli = nullptr;
    node.leave();
    node.stop();
    return 0;
}
