#include "logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

namespace {

struct PendingLine {
    LogLevel level;
    std::string text;
};

std::atomic<LogLevel> g_level{LogLevel::INFO};

// Guards the tag and the sink; held while a line is handed to the sink so
// lines from different threads never interleave.
std::mutex g_output_mutex;
std::string g_tag = "droproom";
LogSink g_sink;

struct AsyncWriter {
    std::mutex mutex;
    std::condition_variable wake;
    std::deque<PendingLine> queue;
    bool stopping = false;
    std::thread worker;
};

std::atomic<bool> g_async{false};
AsyncWriter g_writer;

void deliver(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    if (g_sink) {
        g_sink(level, line);
    } else {
        std::cerr << line << '\n';
    }
}

void drain_queue() {
    std::unique_lock<std::mutex> lock(g_writer.mutex);
    for (;;) {
        g_writer.wake.wait(lock, [] { return g_writer.stopping || !g_writer.queue.empty(); });
        while (!g_writer.queue.empty()) {
            PendingLine next = std::move(g_writer.queue.front());
            g_writer.queue.pop_front();
            lock.unlock();
            deliver(next.level, next.text);
            lock.lock();
        }
        if (g_writer.stopping) return;
    }
}

} // namespace

void set_log_tag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    g_tag = tag;
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    g_sink = std::move(sink);
}

void set_log_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel get_log_level() {
    return g_level.load(std::memory_order_relaxed);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::NONE: return "NONE";
    }
    return "INFO";
}

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none") return LogLevel::NONE;
    return fallback;
}

void write_log(LogLevel level, const std::string& message) {
    std::string line;
    {
        std::lock_guard<std::mutex> lock(g_output_mutex);
        line = "[" + g_tag + "] ";
    }
    line += log_level_name(level);
    line += ' ';
    line += message;

    if (g_async.load(std::memory_order_acquire)) {
        {
            std::lock_guard<std::mutex> lock(g_writer.mutex);
            if (!g_writer.stopping) {
                g_writer.queue.push_back(PendingLine{level, std::move(line)});
                g_writer.wake.notify_one();
                return;
            }
        }
    }
    deliver(level, line);
}

void enable_async_logging() {
    std::lock_guard<std::mutex> lock(g_writer.mutex);
    if (g_async.load()) return;
    g_writer.stopping = false;
    g_writer.worker = std::thread(drain_queue);
    g_async.store(true, std::memory_order_release);
}

void disable_async_logging() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(g_writer.mutex);
        if (!g_async.load()) return;
        g_async.store(false, std::memory_order_release);
        g_writer.stopping = true;
        worker = std::move(g_writer.worker);
    }
    g_writer.wake.notify_all();
    if (worker.joinable()) worker.join();
}

bool is_async_logging_enabled() {
    return g_async.load(std::memory_order_acquire);
}
