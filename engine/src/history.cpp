#include "chronicle/history.hpp"
#include "chronicle/clock.hpp"
#include "chronicle/logging.hpp"

namespace chronicle {

HistoryService::HistoryService(IStorage& storage, EngineConfig config, std::shared_ptr<spdlog::logger> logger)
    : storage_(storage),
      config_(std::move(config)),
      logger_(logger_or_default(std::move(logger))),
      audit_(storage, config_.audit, config_.clock, logger_),
      stack_(storage, config_.undo, logger_),
      lifecycle_(storage, audit_, stack_, config_.clock, logger_) {}

bool HistoryService::open() {
    try {
        ensure_schema(storage_);
    } catch (const StorageError& err) {
        logger_->error("history schema setup failed: {}", err.what());
        ready_ = false;
        return false;
    }
    ready_ = true;
    return true;
}

std::string HistoryService::newSessionId() { return make_id("session"); }

std::string HistoryService::newUndoGroupId() { return make_id("group"); }

bool HistoryService::beginSession(const std::string& session_id) {
    if (config_.undo.persist_across_refresh) {
        logger_->debug("resuming session {} with {} stored undo entries", session_id,
                       stack_.getUndoStackInfo(session_id).total_entries);
        return true;
    }
    return stack_.clearStack(session_id);
}

std::optional<std::string> HistoryService::recordAction(const std::string& session_id, const AuditLogInput& input) {
    return audit_.logAction(session_id, input);
}

std::optional<std::string> HistoryService::recordUndoableAction(const std::string& session_id, AuditLogInput input,
                                                                const std::string& before_state,
                                                                const std::string& after_state) {
    input.is_undoable = true;
    if (!input.old_value) input.old_value = before_state;
    if (!input.new_value) input.new_value = after_state;
    auto audit_id = audit_.logAction(session_id, input);

    UndoStackInput undo;
    undo.target_type = input.target_type;
    undo.target_id = input.target_id.value_or("");
    undo.before_state = before_state;
    undo.after_state = after_state;
    undo.audit_log_id = audit_id;
    return stack_.pushUndoableAction(session_id, undo);
}

std::optional<std::string> HistoryService::pushUndoableAction(const std::string& session_id,
                                                              const UndoStackInput& input) {
    return stack_.pushUndoableAction(session_id, input);
}

std::optional<std::string> HistoryService::groupOf(const UndoStackEntry& entry) {
    if (!entry.audit_log_id) return std::nullopt;
    auto audited = audit_.getEntry(*entry.audit_log_id);
    if (!audited || !audited->undo_group_id || audited->undo_group_id->empty()) return std::nullopt;
    return audited->undo_group_id;
}

void HistoryService::recordReversal(const std::string& session_id, const UndoStackEntry& entry, bool is_undo) {
    if (!entry.audit_log_id) return;
    auto original = audit_.getEntry(*entry.audit_log_id);
    if (!original) return; // pruned since the action was recorded

    AuditLogInput input;
    input.action_type = original->action_type;
    input.action_name = original->action_name;
    input.target_type = original->target_type;
    input.target_id = original->target_id;
    input.target_path = original->target_path;
    input.old_value = is_undo ? entry.after_state : entry.before_state;
    input.new_value = is_undo ? entry.before_state : entry.after_state;
    input.source = is_undo ? Source::Undo : Source::Redo;
    if (!audit_.logAction(session_id, input)) {
        logger_->debug("{} of {} not audited ({} actions disabled)", is_undo ? "undo" : "redo", entry.id,
                       to_string(input.action_type));
    }
}

UndoRedoResult HistoryService::step(const std::string& session_id, bool is_undo) {
    UndoRedoResult result = is_undo ? stack_.undo(session_id) : stack_.redo(session_id);
    if (!result.success) return result;
    recordReversal(session_id, *result.entry, is_undo);

    const auto group = groupOf(*result.entry);
    int steps = 1;
    while (group) {
        auto next = is_undo ? stack_.peekUndo(session_id) : stack_.peekRedo(session_id);
        if (!next || groupOf(*next) != group) break;
        UndoRedoResult more = is_undo ? stack_.undo(session_id) : stack_.redo(session_id);
        if (!more.success) {
            logger_->warn("{} of group {} stopped after {} entries: {}", is_undo ? "undo" : "redo", *group, steps,
                          more.error.value_or("unknown error"));
            break;
        }
        recordReversal(session_id, *more.entry, is_undo);
        result = std::move(more);
        ++steps;
    }
    result.steps = steps;
    return result;
}

UndoRedoResult HistoryService::undo(const std::string& session_id) { return step(session_id, true); }

UndoRedoResult HistoryService::redo(const std::string& session_id) { return step(session_id, false); }

bool HistoryService::clearStack(const std::string& session_id) { return stack_.clearStack(session_id); }

std::vector<AuditLogEntry> HistoryService::getRecentActions(int limit) { return audit_.getRecentActions(limit); }

std::vector<AuditLogEntry> HistoryService::getActionsByType(ActionType type, int limit) {
    return audit_.getActionsByType(type, limit);
}

std::vector<AuditLogEntry> HistoryService::getActionsForTarget(TargetType type, const std::string& target_id,
                                                               int limit) {
    return audit_.getActionsForTarget(type, target_id, limit);
}

AuditStats HistoryService::getStats() { return audit_.getStats(); }

UndoStackInfo HistoryService::getStackInfo(const std::string& session_id) {
    return stack_.getUndoStackInfo(session_id);
}

} // namespace chronicle
