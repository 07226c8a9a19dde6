/**
 * terminal_cli.h - Line-oriented droproom console
 *
 * Reads commands from stdin (plain mode) or just keeps the process alive
 * (daemon mode). Engine logs and transfer events are written to stdout as
 * they arrive; 'logfilter' changes the process log level.
 */

#ifndef TERMINAL_CLI_H
#define TERMINAL_CLI_H

#include "logger.h"

#include <atomic>
#include <mutex>
#include <string>

class PeerNode;

class TerminalCLI {
public:
    explicit TerminalCLI(PeerNode& node, bool daemon_mode = false);
    ~TerminalCLI();

    void run();
    void stop();
    bool isRunning() const { return running; }

    // Called by the logger callback
    void capture_log_line(const std::string& line);

    // Exposed for scripted use and tests
    void process_command(const std::string& input);

private:
    PeerNode& node;
    bool daemon_mode_;
    std::atomic<bool> running;
    std::mutex output_mutex;
    // Last progress decile printed per transfer, to keep output readable.
    std::mutex progress_mutex;
    std::string last_progress_key;
    int last_progress_decile;

    void run_plain();
    void run_daemon();

    void add_output(const std::string& msg);
    static std::string get_log_level_name(LogLevel level);

    // Commands
    void cmd_help();
    void cmd_files();
    void cmd_get(const std::string& file_id);
    void cmd_status();
    void cmd_log_filter(const std::string& level);
    void cmd_leave();
    void cmd_quit();
};

#endif // TERMINAL_CLI_H
