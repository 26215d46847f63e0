#pragma once

#include "chronicle/config.hpp"
#include "chronicle/storage.hpp"
#include "chronicle/types.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/logger.h>

namespace chronicle {

// Append-only audit trail over an IStorage port.
//
// logAction() stamps and queues entries; with a positive batch delay a background
// writer coalesces everything queued within the window into one transaction.
// Entries whose flush fails stay queued, in order, for the next attempt.
// Storage faults never escape a public method: they are logged and a safe
// default is returned.
class AuditLogStore {
public:
    AuditLogStore(IStorage& storage, AuditConfig config, Clock clock = system_clock(),
                  std::shared_ptr<spdlog::logger> logger = nullptr);
    ~AuditLogStore();

    AuditLogStore(const AuditLogStore&) = delete;
    AuditLogStore& operator=(const AuditLogStore&) = delete;

    // Returns the new entry id, or std::nullopt when the action category is disabled.
    std::optional<std::string> logAction(const std::string& session_id, const AuditLogInput& input);

    // Writes every queued entry. Returns false if the write failed (entries stay queued).
    bool flush();
    size_t pendingCount() const;

    std::vector<AuditLogEntry> query(const AuditQueryOptions& options);
    std::optional<AuditLogEntry> getEntry(const std::string& id);
    std::vector<AuditLogEntry> getRecentActions(int limit = 50);
    std::vector<AuditLogEntry> getActionsByType(ActionType type, int limit = 50);
    std::vector<AuditLogEntry> getActionsForTarget(TargetType type, const std::string& target_id, int limit = 50);

    AuditStats getStats();
    ActivitySummary getActivity(const std::string& since_date, const std::string& until_date);
    std::vector<PathCount> getMostEditedPaths(int limit = 10);

    // Deletes entries older than now - retention_days. Non-positive retention is rejected.
    int64_t pruneAuditLog(int retention_days);
    // Deletes the oldest entries beyond max_log_entries.
    int64_t enforceMaxEntries();

    const AuditConfig& config() const { return config_; }

private:
    bool shouldLog(ActionType type) const;
    std::string nextTimestamp();
    void insertEntry(const AuditLogEntry& e);
    void drainPending();
    int64_t deleteBeyondCap();
    void startWriter();
    void stopWriter();
    void run();

    IStorage& storage_;
    AuditConfig config_;
    Clock clock_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex stamp_mutex_;
    TimePoint last_stamp_ {};

    mutable std::mutex pending_mutex_;
    std::condition_variable pending_cv_;
    std::vector<AuditLogEntry> pending_;

    std::mutex flush_mutex_;
    std::atomic<bool> pruning_ {false};

    std::atomic<bool> running_ {false};
    std::thread writer_;
};

// Row -> entry; rows with unknown categories yield std::nullopt.
std::optional<AuditLogEntry> audit_entry_from_row(const Row& row);

} // namespace chronicle
