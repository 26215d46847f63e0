#include "documents/document_store.hpp"
#include "chronicle/logging.hpp"

namespace chronicle {

DocumentStore::DocumentStore(IStorage& storage) : storage_(storage) {}

void DocumentStore::ensureTable() {
    storage_.execute(
        "CREATE TABLE IF NOT EXISTS documents("
        " target_type TEXT NOT NULL,"
        " target_id TEXT NOT NULL,"
        " state TEXT NOT NULL,"
        " PRIMARY KEY(target_type, target_id))");
}

void DocumentStore::put(TargetType type, const std::string& id, const std::string& state) {
    storage_.write("INSERT INTO documents(target_type, target_id, state) VALUES(?,?,?)"
                   " ON CONFLICT(target_type, target_id) DO UPDATE SET state = excluded.state",
                   {std::string(to_string(type)), id, state});
}

std::optional<std::string> DocumentStore::get(TargetType type, const std::string& id) {
    auto row = storage_.queryOne("SELECT state FROM documents WHERE target_type = ? AND target_id = ?",
                                 {std::string(to_string(type)), id});
    if (!row) return std::nullopt;
    return row->text("state");
}

ApplyStateHandler DocumentStore::applyHandler() {
    return [this](TargetType type, const std::string& id, const std::string& state, bool is_undo) {
        try {
            put(type, id, state);
        } catch (const StorageError& err) {
            default_logger()->error("{} of {} {} failed: {}", is_undo ? "undo" : "redo", to_string(type), id,
                                    err.what());
            return false;
        }
        ++applied_;
        return true;
    };
}

} // namespace chronicle
