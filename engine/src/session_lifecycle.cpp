#include "chronicle/session_lifecycle.hpp"
#include "chronicle/logging.hpp"

namespace chronicle {

SessionLifecycle::SessionLifecycle(IStorage& storage, AuditLogStore& audit, UndoRedoStack& stack, Clock clock,
                                   std::shared_ptr<spdlog::logger> logger)
    : storage_(storage),
      audit_(audit),
      stack_(stack),
      clock_(clock ? std::move(clock) : system_clock()),
      logger_(logger_or_default(std::move(logger))) {}

std::optional<std::string> SessionLifecycle::cutoffFor(int max_age_hours) {
    if (max_age_hours <= 0) {
        logger_->warn("refusing session expiry with non-positive max age ({} h)", max_age_hours);
        return std::nullopt;
    }
    // Activity still queued in the batch writer is recent by definition.
    if (!audit_.flush()) logger_->debug("session expiry running with queued audit entries");
    return format_timestamp(hours_before(clock_(), max_age_hours));
}

bool SessionLifecycle::isStale(const std::string& session_id, const std::string& cutoff) {
    auto row = storage_.queryOne("SELECT MAX(timestamp) AS last_activity FROM audit_log WHERE session_id = ?",
                                 {session_id});
    if (!row || row->isNull("last_activity")) return true;
    return row->text("last_activity").value_or("") < cutoff;
}

std::vector<std::string> SessionLifecycle::staleSessions(const std::string& cutoff) {
    std::vector<std::string> out;
    // No audit rows at all (pruned, capped or never logged) counts as stale.
    for (const auto& row : storage_.queryMany(
             "SELECT session_id FROM ("
             " SELECT s.session_id AS session_id,"
             " (SELECT MAX(a.timestamp) FROM audit_log a WHERE a.session_id = s.session_id) AS last_activity"
             " FROM (SELECT DISTINCT session_id FROM undo_stack) s)"
             " WHERE last_activity IS NULL OR last_activity < ? ORDER BY session_id",
             {cutoff})) {
        if (auto id = row.text("session_id")) out.push_back(std::move(*id));
    }
    return out;
}

std::vector<std::string> SessionLifecycle::expiredSessions(int max_age_hours) {
    const auto cutoff = cutoffFor(max_age_hours);
    if (!cutoff) return {};
    try {
        return staleSessions(*cutoff);
    } catch (const StorageError& err) {
        logger_->error("expired session lookup failed: {}", err.what());
        return {};
    }
}

int SessionLifecycle::clearExpiredSessions(int max_age_hours) {
    const auto cutoff = cutoffFor(max_age_hours);
    if (!cutoff) return 0;
    std::vector<std::string> candidates;
    try {
        candidates = staleSessions(*cutoff);
    } catch (const StorageError& err) {
        logger_->error("expired session lookup failed: {}", err.what());
        return 0;
    }

    int cleared = 0;
    for (const auto& session : candidates) {
        // Re-checked under the session lock: the user may have come back since the lookup.
        const ClearOutcome outcome = stack_.clearStackIf(session, [&] {
            if (!audit_.flush()) logger_->debug("re-checking session {} with queued audit entries", session);
            return isStale(session, *cutoff);
        });
        switch (outcome) {
        case ClearOutcome::Cleared:
            stack_.forgetSession(session);
            ++cleared;
            break;
        case ClearOutcome::Kept:
            logger_->debug("session {} became active again, keeping its undo stack", session);
            break;
        case ClearOutcome::Failed:
            logger_->warn("could not reclaim undo stack of expired session {}", session);
            break;
        }
    }
    if (cleared > 0) logger_->info("reclaimed undo stacks of {} expired sessions", cleared);
    return cleared;
}

} // namespace chronicle
