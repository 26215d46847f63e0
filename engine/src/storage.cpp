#include "chronicle/storage.hpp"

namespace chronicle {

void Row::set(std::string column, Value value) {
    for (auto& kv : columns_) {
        if (kv.first == column) {
            kv.second = std::move(value);
            return;
        }
    }
    columns_.emplace_back(std::move(column), std::move(value));
}

const Value* Row::find(const std::string& column) const {
    for (const auto& kv : columns_) {
        if (kv.first == column) return &kv.second;
    }
    return nullptr;
}

bool Row::has(const std::string& column) const { return find(column) != nullptr; }

bool Row::isNull(const std::string& column) const {
    const Value* v = find(column);
    return v == nullptr || std::holds_alternative<std::monostate>(*v);
}

std::optional<std::string> Row::text(const std::string& column) const {
    const Value* v = find(column);
    if (!v) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(v)) return *s;
    if (const auto* i = std::get_if<int64_t>(v)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(v)) return std::to_string(*d);
    return std::nullopt;
}

std::optional<int64_t> Row::integer(const std::string& column) const {
    const Value* v = find(column);
    if (!v) return std::nullopt;
    if (const auto* i = std::get_if<int64_t>(v)) return *i;
    if (const auto* d = std::get_if<double>(v)) return static_cast<int64_t>(*d);
    if (const auto* s = std::get_if<std::string>(v)) {
        try {
            return std::stoll(*s);
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

Value to_value(const std::optional<std::string>& v) {
    if (!v) return std::monostate {};
    return *v;
}

Value to_value(const std::optional<int64_t>& v) {
    if (!v) return std::monostate {};
    return *v;
}

void ensure_schema(IStorage& storage) {
    storage.execute(
        "CREATE TABLE IF NOT EXISTS audit_log("
        " id TEXT PRIMARY KEY,"
        " timestamp TEXT NOT NULL,"
        " session_id TEXT NOT NULL,"
        " action_type TEXT NOT NULL,"
        " action_name TEXT NOT NULL,"
        " target_type TEXT NOT NULL,"
        " target_id TEXT,"
        " target_path TEXT,"
        " old_value TEXT,"
        " new_value TEXT,"
        " is_undoable INTEGER NOT NULL DEFAULT 0,"
        " undo_group_id TEXT,"
        " duration_ms INTEGER,"
        " source TEXT NOT NULL DEFAULT 'user')");
    storage.execute("CREATE INDEX IF NOT EXISTS idx_audit_log_timestamp ON audit_log(timestamp)");
    storage.execute("CREATE INDEX IF NOT EXISTS idx_audit_log_session ON audit_log(session_id)");
    storage.execute("CREATE INDEX IF NOT EXISTS idx_audit_log_action_type ON audit_log(action_type)");
    storage.execute("CREATE INDEX IF NOT EXISTS idx_audit_log_target_path ON audit_log(target_path)");
    storage.execute("CREATE INDEX IF NOT EXISTS idx_audit_log_undoable ON audit_log(is_undoable)");

    storage.execute(
        "CREATE TABLE IF NOT EXISTS undo_stack("
        " id TEXT PRIMARY KEY,"
        " session_id TEXT NOT NULL,"
        " stack_position INTEGER NOT NULL,"
        " audit_log_id TEXT,"
        " target_type TEXT NOT NULL,"
        " target_id TEXT NOT NULL,"
        " before_state TEXT NOT NULL,"
        " after_state TEXT NOT NULL,"
        " is_active INTEGER NOT NULL DEFAULT 1)");
    storage.execute("CREATE INDEX IF NOT EXISTS idx_undo_stack_position ON undo_stack(session_id, stack_position)");
    storage.execute("CREATE INDEX IF NOT EXISTS idx_undo_stack_active ON undo_stack(session_id, is_active)");

    storage.execute(
        "CREATE TABLE IF NOT EXISTS undo_metadata("
        " id TEXT PRIMARY KEY,"
        " undo_stack_id TEXT NOT NULL,"
        " key TEXT NOT NULL,"
        " value TEXT NOT NULL)");
    storage.execute("CREATE INDEX IF NOT EXISTS idx_undo_metadata_stack ON undo_metadata(undo_stack_id)");
}

} // namespace chronicle
