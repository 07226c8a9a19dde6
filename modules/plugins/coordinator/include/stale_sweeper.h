#ifndef STALE_SWEEPER_H
#define STALE_SWEEPER_H

#include "session_coordinator.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// Runs ISessionCoordinator::sweepStale on a fixed cadence, independent of request traffic.
class StaleSweeper {
public:
    using ReportListener = std::function<void(const SweepReport&)>;

    StaleSweeper(ISessionCoordinator& coordinator, std::chrono::milliseconds interval);
    ~StaleSweeper();

    StaleSweeper(const StaleSweeper&) = delete;
    StaleSweeper& operator=(const StaleSweeper&) = delete;

    // Only non-empty reports reach the listener.
    void setReportListener(ReportListener listener);

    bool start();
    void stop();
    bool isRunning() const { return m_running.load(); }

    // One sweep on the caller's thread.
    SweepReport sweepNow();

private:
    void run();

    ISessionCoordinator& m_coordinator;
    std::chrono::milliseconds m_interval;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    ReportListener m_listener;
    std::atomic<bool> m_running{false};
    std::thread m_thread;
};

#endif // STALE_SWEEPER_H
