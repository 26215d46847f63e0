#pragma once

#include "chronicle/config.hpp"
#include "chronicle/storage.hpp"
#include "chronicle/types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <spdlog/logger.h>

namespace chronicle {

// Host callback that materializes `state` into the live document model.
// Must tolerate being called again with the same state.
using ApplyStateHandler = std::function<bool(TargetType target_type, const std::string& target_id,
                                             const std::string& state, bool is_undo)>;

enum class ClearOutcome : uint8_t { Cleared, Kept, Failed };

// Per-session linear undo history persisted in undo_stack / undo_metadata.
//
// Active entries always form a contiguous run from the lowest stored position up to
// the cursor; everything above the cursor is redo-able. Mutations of one session are
// serialized by that session's mutex, different sessions never share a lock.
class UndoRedoStack {
public:
    UndoRedoStack(IStorage& storage, UndoConfig config, std::shared_ptr<spdlog::logger> logger = nullptr);

    UndoRedoStack(const UndoRedoStack&) = delete;
    UndoRedoStack& operator=(const UndoRedoStack&) = delete;

    void registerHandler(TargetType target_type, ApplyStateHandler handler);
    void setFallbackHandler(ApplyStateHandler handler);

    // Returns the new entry id, or std::nullopt on storage failure.
    std::optional<std::string> pushUndoableAction(const std::string& session_id, const UndoStackInput& input);
    UndoRedoResult undo(const std::string& session_id);
    UndoRedoResult redo(const std::string& session_id);
    bool clearStack(const std::string& session_id);
    // Clears the stack only if `condition` still holds once the session lock is held.
    // A StorageError thrown by `condition` yields ClearOutcome::Failed.
    ClearOutcome clearStackIf(const std::string& session_id, const std::function<bool()>& condition);

    UndoStackInfo getUndoStackInfo(const std::string& session_id);
    std::vector<UndoStackEntry> listEntries(const std::string& session_id);
    // Next entry undo()/redo() would apply, without applying it.
    std::optional<UndoStackEntry> peekUndo(const std::string& session_id);
    std::optional<UndoStackEntry> peekRedo(const std::string& session_id);

    std::optional<std::string> setMetadata(const std::string& undo_stack_id, const std::string& key,
                                           const std::string& value);
    std::map<std::string, std::string> getMetadata(const std::string& undo_stack_id);

    // Drops the session's lock object if no caller currently holds it.
    void forgetSession(const std::string& session_id);

    const UndoConfig& config() const { return config_; }

private:
    std::shared_ptr<std::mutex> sessionLock(const std::string& session_id);
    bool apply(const UndoStackEntry& entry, const std::string& state, bool is_undo);

    int64_t cursor(const std::string& session_id);
    std::optional<UndoStackEntry> topActive(const std::string& session_id);
    std::optional<UndoStackEntry> nextRedo(const std::string& session_id);
    void deleteAbove(const std::string& session_id, int64_t position);
    void evictOldest(const std::string& session_id, int64_t count);
    void deleteSession(const std::string& session_id);

    IStorage& storage_;
    UndoConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex handlers_mutex_;
    std::unordered_map<TargetType, ApplyStateHandler> handlers_;
    ApplyStateHandler fallback_;

    std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> session_locks_;
};

std::optional<UndoStackEntry> undo_entry_from_row(const Row& row);

} // namespace chronicle
