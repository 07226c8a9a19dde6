/**
 * terminal_cli.cpp - Line-oriented droproom console
 *
 * All output goes through add_output() so log lines from engine threads and
 * command results never interleave mid-line.
 */

#include "terminal_cli.h"
#include "file_sink.h"
#include "logger.h"
#include "peer_node.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace {

std::string human_size(uint64_t bytes) {
    std::ostringstream out;
    if (bytes >= 1024ull * 1024ull) {
        out << std::fixed << std::setprecision(2) << (static_cast<double>(bytes) / (1024.0 * 1024.0)) << " MB";
    } else if (bytes >= 1024ull) {
        out << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / 1024.0) << " KB";
    } else {
        out << bytes << " B";
    }
    return out.str();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// TERMINAL CLI
// ═══════════════════════════════════════════════════════════════════════════

TerminalCLI::TerminalCLI(PeerNode& peer_node, bool daemon_mode)
    : node(peer_node)
    , daemon_mode_(daemon_mode)
    , running(false)
    , last_progress_decile(-1)
{
    // Set up log callback EARLY so we capture logs even during node startup.
    set_log_sink([this](LogLevel, const std::string& line) {
        this->capture_log_line(line);
    });

    // Wire node events. These callbacks may be invoked from engine threads.
    node.setFilesUpdatedCallback([this](const std::vector<FileDescriptor>& files) {
        add_output("Files available: " + std::to_string(files.size()) + " (type 'files')");
    });
    node.setDownloadCallbacks(
        [this](const TransferKey& key, double percent) {
            const int decile = static_cast<int>(percent / 10.0);
            {
                std::lock_guard<std::mutex> lock(progress_mutex);
                const std::string k = key.toString();
                if (k == last_progress_key && decile == last_progress_decile) return;
                last_progress_key = k;
                last_progress_decile = decile;
            }
            add_output("  " + key.file_id.substr(0, 8) + " " + std::to_string(decile * 10) + "%");
        },
        [this](const ReceivedFile& file) {
            add_output("Downloaded " + file.name + " (" + human_size(file.bytes.size()) + ")");
        },
        [this](const TransferKey& key, const std::string& reason) {
            add_output("Download of " + key.file_id + " failed: " + reason);
        });
    node.setUploadCallbacks(
        [this](const TransferKey& key, const TransferStats& stats) {
            std::ostringstream out;
            out << "Sent " << key.file_id.substr(0, 8) << " to " << key.peer_id << " ("
                << human_size(stats.bytes) << ", " << std::fixed << std::setprecision(2)
                << stats.megabytesPerSecond() << " MB/s)";
            add_output(out.str());
        },
        [this](const TransferKey& key, const std::string& reason) {
            add_output("Upload of " + key.file_id + " to " + key.peer_id + " failed: " + reason);
        });
    node.setSessionEndedCallback([this](SessionEndReason reason) {
        switch (reason) {
            case SessionEndReason::ROOM_NOT_FOUND:
                add_output("Room no longer exists. Type 'quit' to exit.");
                break;
            case SessionEndReason::HOST_OFFLINE:
                add_output("Host went offline. Type 'quit' to exit.");
                break;
            case SessionEndReason::LEFT:
                add_output("Left the room.");
                break;
        }
    });
}

TerminalCLI::~TerminalCLI() {
    // Prevent callbacks into a destroyed UI.
    node.clearEventCallbacks();
    set_log_sink(nullptr);
}

void TerminalCLI::run() {
    running = true;
    if (daemon_mode_) {
        run_daemon();
    } else {
        run_plain();
    }
}

void TerminalCLI::run_plain() {
    add_output("droproom. Type 'help' for commands. Ctrl-D to exit.");

    std::string line;
    while (running) {
        {
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << "droproom> " << std::flush;
        }
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line.empty()) {
            continue;
        }
        process_command(line);
    }
    running = false;
    add_output("Goodbye!");
}

void TerminalCLI::run_daemon() {
    // No stdin: suitable for background processes and automated testing.
    add_output("droproom daemon mode started. Use 'kill -TERM " + std::to_string(getpid()) + "' to stop.");
    add_output("Peer ID: " + node.getPeerId());

    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    add_output("Goodbye!");
}

void TerminalCLI::stop() {
    running = false;
}

void TerminalCLI::add_output(const std::string& msg) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << msg << std::endl;
}

void TerminalCLI::capture_log_line(const std::string& line) {
    // Level filtering already happened in the LOG_* macros.
    add_output(line);
}

std::string TerminalCLI::get_log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERR";
        case LogLevel::WARNING: return "WRN";
        case LogLevel::INFO: return "INF";
        case LogLevel::DEBUG: return "ALL";
        case LogLevel::NONE: return "OFF";
    }
    return "ALL";
}

// ═══════════════════════════════════════════════════════════════════════════
// COMMANDS
// ═══════════════════════════════════════════════════════════════════════════

void TerminalCLI::process_command(const std::string& input) {
    std::istringstream iss(input);
    std::string cmd;
    iss >> cmd;
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), ::tolower);

    if (cmd == "help" || cmd == "h" || cmd == "?") {
        cmd_help();
    } else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        cmd_quit();
    } else if (cmd == "files" || cmd == "ls") {
        cmd_files();
    } else if (cmd == "get" || cmd == "g") {
        std::string file_id;
        iss >> file_id;
        cmd_get(file_id);
    } else if (cmd == "status" || cmd == "stat" || cmd == "s") {
        cmd_status();
    } else if (cmd == "logfilter" || cmd == "log" || cmd == "lf") {
        std::string level;
        iss >> level;
        cmd_log_filter(level);
    } else if (cmd == "leave") {
        cmd_leave();
    } else if (!cmd.empty()) {
        add_output("Unknown: " + cmd + " (type 'help')");
    }
}

void TerminalCLI::cmd_help() {
    add_output("files        List the room's files");
    add_output("get <id>     Download a file (unique id prefix is enough)");
    add_output("status       Show room and transfer status");
    add_output("logfilter l  error/warn/info/debug/none");
    add_output("leave        Leave (or close) the room");
    add_output("quit         Exit");
}

void TerminalCLI::cmd_files() {
    const std::vector<FileDescriptor> files = node.getFiles();
    if (files.empty()) {
        add_output("No files.");
        return;
    }
    for (const FileDescriptor& f : files) {
        add_output(f.id.substr(0, 8) + "  " + f.name + "  " + human_size(f.size) + "  " + f.mime_type);
    }
}

void TerminalCLI::cmd_get(const std::string& file_id) {
    if (file_id.empty()) {
        add_output("Usage: get <file_id>");
        return;
    }
    std::string err;
    if (!node.requestFile(file_id, &err)) {
        add_output("get: " + err);
        return;
    }
    add_output("Requested " + file_id);
}

void TerminalCLI::cmd_status() {
    add_output(node.getStatusSummary());
    add_output("Log Filter: " + get_log_level_name(get_log_level()));
}

void TerminalCLI::cmd_log_filter(const std::string& level) {
    std::string lvl = level;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::tolower);

    if (lvl.empty()) {
        add_output("Current: " + get_log_level_name(get_log_level()));
        return;
    }

    if (lvl == "error" || lvl == "e") set_log_level(LogLevel::ERROR);
    else if (lvl == "warn" || lvl == "warning" || lvl == "w") set_log_level(LogLevel::WARNING);
    else if (lvl == "info" || lvl == "i") set_log_level(LogLevel::INFO);
    else if (lvl == "debug" || lvl == "d" || lvl == "all" || lvl == "a") set_log_level(LogLevel::DEBUG);
    else if (lvl == "none" || lvl == "off" || lvl == "n") set_log_level(LogLevel::NONE);
    else {
        add_output("Use: error, warn, info, debug, none");
        return;
    }
    add_output("Filter: " + get_log_level_name(get_log_level()));
}

void TerminalCLI::cmd_leave() {
    node.leave();
}

void TerminalCLI::cmd_quit() {
    add_output("Shutting down...");
    running = false;
}
