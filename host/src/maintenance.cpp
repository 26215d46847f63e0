#include "chronicle/maintenance.hpp"

namespace chronicle {

SweepReport MaintenanceScheduler::runOnce() {
    const EngineConfig& cfg = history_.config();
    SweepReport report;
    report.pruned_entries = history_.audit().pruneAuditLog(cfg.audit.retention_days);
    report.capped_entries = history_.audit().enforceMaxEntries();
    report.expired_sessions = history_.lifecycle().clearExpiredSessions(cfg.lifecycle.session_max_age_hours);
    sweeps_.fetch_add(1);
    return report;
}

void MaintenanceScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        lock.unlock();
        runOnce();
        lock.lock();
        wake_.wait_for(lock, interval_, [this] { return !running_.load(); });
    }
}

} // namespace chronicle
