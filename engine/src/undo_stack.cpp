#include "chronicle/undo_stack.hpp"
#include "chronicle/clock.hpp"
#include "chronicle/logging.hpp"
#include <exception>

namespace chronicle {

namespace {

constexpr const char* kSelectEntry =
    "SELECT id, session_id, stack_position, audit_log_id, target_type, target_id,"
    " before_state, after_state, is_active FROM undo_stack";

} // namespace

std::optional<UndoStackEntry> undo_entry_from_row(const Row& row) {
    auto id = row.text("id");
    auto target_type = parse_target_type(row.text("target_type").value_or(""));
    auto position = row.integer("stack_position");
    if (!id || !target_type || !position) return std::nullopt;

    UndoStackEntry e;
    e.id = *id;
    e.session_id = row.text("session_id").value_or("");
    e.stack_position = *position;
    e.audit_log_id = row.text("audit_log_id");
    e.target_type = *target_type;
    e.target_id = row.text("target_id").value_or("");
    e.before_state = row.text("before_state").value_or("");
    e.after_state = row.text("after_state").value_or("");
    e.is_active = row.integer("is_active").value_or(0) != 0;
    return e;
}

UndoRedoStack::UndoRedoStack(IStorage& storage, UndoConfig config, std::shared_ptr<spdlog::logger> logger)
    : storage_(storage), config_(config), logger_(logger_or_default(std::move(logger))) {}

void UndoRedoStack::registerHandler(TargetType target_type, ApplyStateHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[target_type] = std::move(handler);
}

void UndoRedoStack::setFallbackHandler(ApplyStateHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    fallback_ = std::move(handler);
}

std::shared_ptr<std::mutex> UndoRedoStack::sessionLock(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto& slot = session_locks_[session_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void UndoRedoStack::forgetSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = session_locks_.find(session_id);
    if (it != session_locks_.end() && it->second.use_count() == 1) session_locks_.erase(it);
}

int64_t UndoRedoStack::cursor(const std::string& session_id) {
    auto row = storage_.queryOne(
        "SELECT MAX(stack_position) AS pos FROM undo_stack WHERE session_id = ? AND is_active = 1", {session_id});
    if (!row || row->isNull("pos")) return -1;
    return row->integer("pos").value_or(-1);
}

std::optional<UndoStackEntry> UndoRedoStack::topActive(const std::string& session_id) {
    auto row = storage_.queryOne(std::string(kSelectEntry) +
                                     " WHERE session_id = ? AND is_active = 1 ORDER BY stack_position DESC LIMIT 1",
                                 {session_id});
    if (!row) return std::nullopt;
    return undo_entry_from_row(*row);
}

std::optional<UndoStackEntry> UndoRedoStack::nextRedo(const std::string& session_id) {
    auto row = storage_.queryOne(std::string(kSelectEntry) +
                                     " WHERE session_id = ? AND is_active = 0 AND stack_position > ?"
                                     " ORDER BY stack_position ASC LIMIT 1",
                                 {session_id, cursor(session_id)});
    if (!row) return std::nullopt;
    return undo_entry_from_row(*row);
}

void UndoRedoStack::deleteAbove(const std::string& session_id, int64_t position) {
    // Metadata first: the store has no cascading delete.
    storage_.write("DELETE FROM undo_metadata WHERE undo_stack_id IN"
                   " (SELECT id FROM undo_stack WHERE session_id = ? AND stack_position > ?)",
                   {session_id, position});
    storage_.write("DELETE FROM undo_stack WHERE session_id = ? AND stack_position > ?", {session_id, position});
}

void UndoRedoStack::evictOldest(const std::string& session_id, int64_t count) {
    const std::string oldest =
        "(SELECT id FROM undo_stack WHERE session_id = ? ORDER BY stack_position ASC LIMIT ?)";
    storage_.write("DELETE FROM undo_metadata WHERE undo_stack_id IN " + oldest, {session_id, count});
    storage_.write("DELETE FROM undo_stack WHERE id IN " + oldest, {session_id, count});
}

std::optional<std::string> UndoRedoStack::pushUndoableAction(const std::string& session_id,
                                                             const UndoStackInput& input) {
    auto guard = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*guard);

    UndoStackEntry e;
    e.id = make_id("undo");
    e.session_id = session_id;
    e.audit_log_id = input.audit_log_id;
    e.target_type = input.target_type;
    e.target_id = input.target_id;
    e.before_state = input.before_state;
    e.after_state = input.after_state;
    e.is_active = true;

    try {
        in_transaction(storage_, [&] {
            const int64_t pos = cursor(session_id);
            auto counts = storage_.queryOne(
                "SELECT COUNT(*) AS total, COALESCE(SUM(CASE WHEN stack_position > ? THEN 1 ELSE 0 END), 0) AS above"
                " FROM undo_stack WHERE session_id = ?",
                {pos, session_id});
            int64_t total = counts ? counts->integer("total").value_or(0) : 0;
            const int64_t above = counts ? counts->integer("above").value_or(0) : 0;

            // A new action after undo abandons the redo branch.
            if (above > 0) {
                deleteAbove(session_id, pos);
                total -= above;
                logger_->debug("session {}: discarded {} redo entries", session_id, above);
            }
            if (config_.max_stack_size > 0 && total + 1 > config_.max_stack_size) {
                const int64_t excess = total + 1 - config_.max_stack_size;
                evictOldest(session_id, excess);
                logger_->debug("session {}: evicted {} oldest undo entries", session_id, excess);
            }

            e.stack_position = pos + 1;
            storage_.write(
                "INSERT INTO undo_stack(id, session_id, stack_position, audit_log_id, target_type, target_id,"
                " before_state, after_state, is_active) VALUES(?,?,?,?,?,?,?,?,1)",
                {e.id, e.session_id, e.stack_position, to_value(e.audit_log_id),
                 std::string(to_string(e.target_type)), e.target_id, e.before_state, e.after_state});
        });
    } catch (const StorageError& err) {
        logger_->error("push to undo stack of session {} failed: {}", session_id, err.what());
        return std::nullopt;
    }
    return e.id;
}

bool UndoRedoStack::apply(const UndoStackEntry& entry, const std::string& state, bool is_undo) {
    ApplyStateHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(entry.target_type);
        handler = it != handlers_.end() ? it->second : fallback_;
    }
    if (!handler) {
        logger_->warn("no apply-state handler for target type '{}'", to_string(entry.target_type));
        return false;
    }
    try {
        return handler(entry.target_type, entry.target_id, state, is_undo);
    } catch (const std::exception& ex) {
        logger_->error("apply-state handler for {} {} threw: {}", to_string(entry.target_type), entry.target_id,
                       ex.what());
        return false;
    }
}

UndoRedoResult UndoRedoStack::undo(const std::string& session_id) {
    auto guard = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*guard);

    std::optional<UndoStackEntry> entry;
    try {
        entry = topActive(session_id);
    } catch (const StorageError& err) {
        logger_->error("undo lookup for session {} failed: {}", session_id, err.what());
        return UndoRedoResult::failure(std::string("Storage error: ") + err.what());
    }
    if (!entry) return UndoRedoResult::failure("Nothing to undo");

    if (!apply(*entry, entry->before_state, true)) {
        return UndoRedoResult::failure("Failed to apply undo state");
    }

    try {
        storage_.write("UPDATE undo_stack SET is_active = 0 WHERE id = ?", {entry->id});
    } catch (const StorageError& err) {
        // The handler is idempotent, so leaving the entry active lets the caller retry.
        logger_->error("undo of {} applied but cursor update failed: {}", entry->id, err.what());
        return UndoRedoResult::failure(std::string("Storage error: ") + err.what());
    }

    entry->is_active = false;
    UndoRedoResult result;
    result.success = true;
    result.applied_state = entry->before_state;
    result.entry = std::move(entry);
    result.steps = 1;
    return result;
}

UndoRedoResult UndoRedoStack::redo(const std::string& session_id) {
    auto guard = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*guard);

    std::optional<UndoStackEntry> entry;
    try {
        entry = nextRedo(session_id);
    } catch (const StorageError& err) {
        logger_->error("redo lookup for session {} failed: {}", session_id, err.what());
        return UndoRedoResult::failure(std::string("Storage error: ") + err.what());
    }
    if (!entry) return UndoRedoResult::failure("Nothing to redo");

    if (!apply(*entry, entry->after_state, false)) {
        return UndoRedoResult::failure("Failed to apply redo state");
    }

    try {
        storage_.write("UPDATE undo_stack SET is_active = 1 WHERE id = ?", {entry->id});
    } catch (const StorageError& err) {
        logger_->error("redo of {} applied but cursor update failed: {}", entry->id, err.what());
        return UndoRedoResult::failure(std::string("Storage error: ") + err.what());
    }

    entry->is_active = true;
    UndoRedoResult result;
    result.success = true;
    result.applied_state = entry->after_state;
    result.entry = std::move(entry);
    result.steps = 1;
    return result;
}

void UndoRedoStack::deleteSession(const std::string& session_id) {
    in_transaction(storage_, [&] {
        storage_.write("DELETE FROM undo_metadata WHERE undo_stack_id IN"
                       " (SELECT id FROM undo_stack WHERE session_id = ?)",
                       {session_id});
        storage_.write("DELETE FROM undo_stack WHERE session_id = ?", {session_id});
    });
}

bool UndoRedoStack::clearStack(const std::string& session_id) {
    auto guard = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*guard);
    try {
        deleteSession(session_id);
    } catch (const StorageError& err) {
        logger_->error("clearing undo stack of session {} failed: {}", session_id, err.what());
        return false;
    }
    return true;
}

ClearOutcome UndoRedoStack::clearStackIf(const std::string& session_id, const std::function<bool()>& condition) {
    auto guard = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*guard);
    try {
        if (!condition()) return ClearOutcome::Kept;
        deleteSession(session_id);
    } catch (const StorageError& err) {
        logger_->error("conditional clear of session {} failed: {}", session_id, err.what());
        return ClearOutcome::Failed;
    }
    return ClearOutcome::Cleared;
}

UndoStackInfo UndoRedoStack::getUndoStackInfo(const std::string& session_id) {
    UndoStackInfo info;
    try {
        auto row = storage_.queryOne(
            "SELECT COUNT(*) AS total, COALESCE(SUM(is_active), 0) AS active,"
            " MAX(CASE WHEN is_active = 1 THEN stack_position END) AS pos"
            " FROM undo_stack WHERE session_id = ?",
            {session_id});
        if (row) {
            info.total_entries = row->integer("total").value_or(0);
            info.active_entries = row->integer("active").value_or(0);
            info.current_position = row->isNull("pos") ? -1 : row->integer("pos").value_or(-1);
        }
    } catch (const StorageError& err) {
        logger_->error("undo stack info for session {} failed: {}", session_id, err.what());
        return UndoStackInfo {};
    }
    return info;
}

std::vector<UndoStackEntry> UndoRedoStack::listEntries(const std::string& session_id) {
    std::vector<UndoStackEntry> out;
    try {
        for (const auto& row : storage_.queryMany(
                 std::string(kSelectEntry) + " WHERE session_id = ? ORDER BY stack_position ASC", {session_id})) {
            if (auto e = undo_entry_from_row(row)) out.push_back(std::move(*e));
        }
    } catch (const StorageError& err) {
        logger_->error("listing undo stack of session {} failed: {}", session_id, err.what());
        return {};
    }
    return out;
}

std::optional<UndoStackEntry> UndoRedoStack::peekUndo(const std::string& session_id) {
    try {
        return topActive(session_id);
    } catch (const StorageError& err) {
        logger_->error("undo peek for session {} failed: {}", session_id, err.what());
        return std::nullopt;
    }
}

std::optional<UndoStackEntry> UndoRedoStack::peekRedo(const std::string& session_id) {
    try {
        return nextRedo(session_id);
    } catch (const StorageError& err) {
        logger_->error("redo peek for session {} failed: {}", session_id, err.what());
        return std::nullopt;
    }
}

std::optional<std::string> UndoRedoStack::setMetadata(const std::string& undo_stack_id, const std::string& key,
                                                      const std::string& value) {
    std::optional<std::string> id;
    try {
        in_transaction(storage_, [&] {
            auto owner = storage_.queryOne("SELECT id FROM undo_stack WHERE id = ?", {undo_stack_id});
            if (!owner) return;
            auto existing = storage_.queryOne("SELECT id FROM undo_metadata WHERE undo_stack_id = ? AND key = ?",
                                              {undo_stack_id, key});
            if (existing) {
                id = existing->text("id");
                storage_.write("UPDATE undo_metadata SET value = ? WHERE id = ?", {value, id.value_or("")});
            } else {
                id = make_id("meta");
                storage_.write("INSERT INTO undo_metadata(id, undo_stack_id, key, value) VALUES(?,?,?,?)",
                               {*id, undo_stack_id, key, value});
            }
        });
    } catch (const StorageError& err) {
        logger_->error("writing metadata for undo entry {} failed: {}", undo_stack_id, err.what());
        return std::nullopt;
    }
    if (!id) logger_->warn("metadata '{}' for unknown undo entry {} ignored", key, undo_stack_id);
    return id;
}

std::map<std::string, std::string> UndoRedoStack::getMetadata(const std::string& undo_stack_id) {
    std::map<std::string, std::string> out;
    try {
        for (const auto& row : storage_.queryMany(
                 "SELECT key, value FROM undo_metadata WHERE undo_stack_id = ?",
                 {undo_stack_id})) {
            out[row.text("key").value_or("")] = row.text("value").value_or("");
        }
    } catch (const StorageError& err) {
        logger_->error("reading metadata for undo entry {} failed: {}", undo_stack_id, err.what());
        return {};
    }
    return out;
}

} // namespace chronicle
