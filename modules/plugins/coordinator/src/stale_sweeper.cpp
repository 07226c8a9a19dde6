#include "stale_sweeper.h"
#include "logger.h"
#include "telemetry.h"

StaleSweeper::StaleSweeper(ISessionCoordinator& coordinator, std::chrono::milliseconds interval)
    : m_coordinator(coordinator), m_interval(interval) {
    if (m_interval.count() <= 0) {
        m_interval = std::chrono::milliseconds(10000);
    }
}

StaleSweeper::~StaleSweeper() {
    stop();
}

void StaleSweeper::setReportListener(ReportListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

bool StaleSweeper::start() {
    if (m_running.exchange(true)) {
        return false;
    }
    m_thread = std::thread(&StaleSweeper::run, this);
    LOG_INFO("SWEEP: Started, interval " + std::to_string(m_interval.count()) + "ms");
    return true;
}

void StaleSweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running.exchange(false)) {
            return;
        }
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    LOG_INFO("SWEEP: Stopped");
}

SweepReport StaleSweeper::sweepNow() {
    SweepReport report = m_coordinator.sweepStale(std::chrono::steady_clock::now());
    if (!report.empty()) {
        LOG_INFO("SWEEP: Evicted " + std::to_string(report.rooms.size()) + " rooms, " +
                 std::to_string(report.clients.size()) + " clients");
        ReportListener listener;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            listener = m_listener;
        }
        if (listener) {
            listener(report);
        }
    }
    return report;
}

void StaleSweeper::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_running.load()) {
        if (m_cv.wait_for(lock, m_interval, [this] { return !m_running.load(); })) {
            break;
        }
        lock.unlock();
        sweepNow();
        Telemetry::getInstance().tick();
        lock.lock();
    }
}
