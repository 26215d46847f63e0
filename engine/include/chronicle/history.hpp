#pragma once

#include "chronicle/audit_log.hpp"
#include "chronicle/config.hpp"
#include "chronicle/session_lifecycle.hpp"
#include "chronicle/storage.hpp"
#include "chronicle/undo_stack.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace chronicle {

// Consumer-facing entry point tying the audit log, the undo stacks and session
// expiry to one storage port. Every call takes the session explicitly.
class HistoryService {
public:
    HistoryService(IStorage& storage, EngineConfig config, std::shared_ptr<spdlog::logger> logger = nullptr);

    // Creates the schema. Returns false (and stays not ready) if the store is unusable.
    bool open();
    bool isReady() const { return ready_.load(); }

    static std::string newSessionId();
    static std::string newUndoGroupId();

    // Starts (or resumes) a session. Without persist_across_refresh any stack left
    // over from a previous run is discarded.
    bool beginSession(const std::string& session_id);

    std::optional<std::string> recordAction(const std::string& session_id, const AuditLogInput& input);
    // Logs `input` as undoable and pushes the paired stack entry; returns the stack entry id.
    std::optional<std::string> recordUndoableAction(const std::string& session_id, AuditLogInput input,
                                                    const std::string& before_state,
                                                    const std::string& after_state);
    std::optional<std::string> pushUndoableAction(const std::string& session_id, const UndoStackInput& input);

    // Undo/redo one logical step: a whole undo group when the entry belongs to one.
    UndoRedoResult undo(const std::string& session_id);
    UndoRedoResult redo(const std::string& session_id);
    bool clearStack(const std::string& session_id);

    std::vector<AuditLogEntry> getRecentActions(int limit = 50);
    std::vector<AuditLogEntry> getActionsByType(ActionType type, int limit = 50);
    std::vector<AuditLogEntry> getActionsForTarget(TargetType type, const std::string& target_id, int limit = 50);
    AuditStats getStats();
    UndoStackInfo getStackInfo(const std::string& session_id);

    AuditLogStore& audit() { return audit_; }
    UndoRedoStack& stack() { return stack_; }
    SessionLifecycle& lifecycle() { return lifecycle_; }
    const EngineConfig& config() const { return config_; }

private:
    std::optional<std::string> groupOf(const UndoStackEntry& entry);
    void recordReversal(const std::string& session_id, const UndoStackEntry& entry, bool is_undo);
    UndoRedoResult step(const std::string& session_id, bool is_undo);

    IStorage& storage_;
    EngineConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    AuditLogStore audit_;
    UndoRedoStack stack_;
    SessionLifecycle lifecycle_;
    std::atomic<bool> ready_ {false};
};

} // namespace chronicle
