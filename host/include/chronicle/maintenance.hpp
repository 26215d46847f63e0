#pragma once

#include "chronicle/history.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace chronicle {

struct SweepReport {
    int64_t pruned_entries {0};
    int64_t capped_entries {0};
    int expired_sessions {0};
};

// Background sweeper: audit retention, the audit entry cap and session expiry.
class MaintenanceScheduler {
public:
    MaintenanceScheduler(HistoryService& history, std::chrono::seconds interval)
        : history_(history), interval_(interval) {}
    ~MaintenanceScheduler() { stop(); }

    MaintenanceScheduler(const MaintenanceScheduler&) = delete;
    MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;

    void start() {
        if (running_.exchange(true)) return;
        worker_ = std::thread([this] { run(); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) return;
        }
        wake_.notify_all();
        if (worker_.joinable()) worker_.join();
    }

    bool running() const { return running_.load(); }
    int sweepCount() const { return sweeps_.load(); }

    // One synchronous sweep, independent of the background thread.
    SweepReport runOnce();

private:
    void run();

    HistoryService& history_;
    std::chrono::seconds interval_ {3600};
    std::atomic<bool> running_ {false};
    std::atomic<int> sweeps_ {0};
    std::mutex mutex_;
    std::condition_variable wake_;
    std::thread worker_;
};

} // namespace chronicle
