#ifndef XPECONOMY_MONITOR_MONITOR_SCHEDULER_HPP
#define XPECONOMY_MONITOR_MONITOR_SCHEDULER_HPP

#include "monitor/ledger_monitor.hpp"
#include "util/logger.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace xpeconomy {
namespace monitor {

/**
 * @class MonitorScheduler
 * @brief Runs LedgerMonitor::RunCycle() on a background thread at a fixed interval.
 *
 * The first cycle runs as soon as scheduling starts. StopScheduling() wakes the
 * thread and joins it; a cycle already in progress finishes first.
 */
class MonitorScheduler {
  public:
    explicit MonitorScheduler(LedgerMonitor& monitor)
        : m_monitor(monitor), m_isRunning(false), m_interval(std::chrono::seconds(300)), m_cycles(0) {}

    ~MonitorScheduler() { StopScheduling(); }

    MonitorScheduler(const MonitorScheduler&) = delete;
    MonitorScheduler& operator=(const MonitorScheduler&) = delete;

    void ConfigureInterval(std::chrono::milliseconds interval) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_interval = interval;
    }

    bool StartScheduling() {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_isRunning) {
            util::logger::warn("[MonitorScheduler] StartScheduling called but scheduler is already running.");
            return true;
        }

        m_isRunning = true;
        m_schedulerThread = std::thread(&MonitorScheduler::schedulerLoop, this);

        util::logger::info("[MonitorScheduler] Scheduling thread started (interval "
                           + std::to_string(m_interval.count()) + " ms).");
        return true;
    }

    bool StopScheduling() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_isRunning) {
                return true;
            }
            m_isRunning = false;
            m_cv.notify_all();
        }

        if (m_schedulerThread.joinable()) {
            m_schedulerThread.join();
        }

        util::logger::info("[MonitorScheduler] Scheduling thread stopped.");
        return true;
    }

    bool IsRunning() const { return m_isRunning; }

    /// Number of completed cycles since construction.
    uint64_t CompletedCycles() const { return m_cycles; }

    // Forced cycle outside the schedule
    MonitorReport RunNow() {
        MonitorReport report = m_monitor.RunCycle();
        ++m_cycles;
        return report;
    }

  private:
    void schedulerLoop() {
        util::logger::info("[MonitorScheduler] Entering main scheduling loop.");

        while (true) {
            MonitorReport report = m_monitor.RunCycle();
            ++m_cycles;
            if (report.violations > 0) {
                util::logger::warn("[MonitorScheduler] Cycle found " + std::to_string(report.violations)
                                   + " invariant violation(s).");
            }

            // Wait until next interval or until stopped
            std::unique_lock<std::mutex> lock(m_mutex);
            auto nextWake = std::chrono::steady_clock::now() + m_interval;
            m_cv.wait_until(lock, nextWake, [this] { return !m_isRunning; });
            if (!m_isRunning) {
                break;
            }
        }

        util::logger::info("[MonitorScheduler] Exiting main scheduling loop.");
    }

    LedgerMonitor& m_monitor;
    std::atomic<bool> m_isRunning;
    std::chrono::milliseconds m_interval;
    std::atomic<uint64_t> m_cycles;
    std::thread m_schedulerThread;
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace monitor
} // namespace xpeconomy

#endif // XPECONOMY_MONITOR_MONITOR_SCHEDULER_HPP
