#pragma once

#include "chronicle/audit_log.hpp"
#include "chronicle/clock.hpp"
#include "chronicle/storage.hpp"
#include "chronicle/undo_stack.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace chronicle {

// Reclaims undo memory of sessions that went quiet. Audit history is never touched.
class SessionLifecycle {
public:
    SessionLifecycle(IStorage& storage, AuditLogStore& audit, UndoRedoStack& stack, Clock clock = system_clock(),
                     std::shared_ptr<spdlog::logger> logger = nullptr);

    // Sessions holding undo entries whose latest audit activity is older than the cutoff,
    // or that have no audit activity left at all.
    std::vector<std::string> expiredSessions(int max_age_hours = 24);

    // Clears the undo stack of every expired session; returns how many were cleared.
    // Each session is re-checked under its lock, so one that became active meanwhile is kept.
    int clearExpiredSessions(int max_age_hours = 24);

private:
    std::optional<std::string> cutoffFor(int max_age_hours);
    std::vector<std::string> staleSessions(const std::string& cutoff);
    bool isStale(const std::string& session_id, const std::string& cutoff);

    IStorage& storage_;
    AuditLogStore& audit_;
    UndoRedoStack& stack_;
    Clock clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace chronicle
