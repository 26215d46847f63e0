#include "chronicle/cli.hpp"
#include "chronicle/history.hpp"
#include "chronicle/logging.hpp"
#include "chronicle/maintenance.hpp"
#include "chronicle/sqlite_storage.hpp"
#include "documents/document_store.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

using namespace chronicle;

int main(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) {
        std::cout << runner_usage();
        return 0;
    }

    RunnerOptions options;
    try {
        options = options_from_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << runner_usage();
        return 2;
    }
    if (!set_log_level(options.log_level)) {
        std::cerr << "unknown log level '" << options.log_level << "'\n" << runner_usage();
        return 2;
    }

    std::unique_ptr<SqliteStorage> storage;
    try {
        storage = std::make_unique<SqliteStorage>(options.db_path);
    } catch (const StorageError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    HistoryService history(*storage, options.engine);
    if (!history.open()) {
        std::cerr << "could not initialise history tables in " << options.db_path << "\n";
        return 1;
    }

    DocumentStore documents(*storage);
    try {
        documents.ensureTable();
    } catch (const StorageError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    history.stack().setFallbackHandler(documents.applyHandler());

    std::optional<MaintenanceScheduler> maintenance;
    if (options.maintain) {
        maintenance.emplace(history, options.engine.lifecycle.sweep_interval);
        maintenance->start();
    }

    const std::string session = HistoryService::newSessionId();
    if (!history.beginSession(session)) {
        std::cerr << "could not start session " << session << "\n";
        return 1;
    }

    AuditLogInput edit;
    edit.action_type = ActionType::Content;
    edit.action_name = "update";
    edit.target_type = TargetType::Strand;
    edit.target_id = "strand-demo";
    edit.target_path = "/notes/demo.md";

    const std::pair<const char*, const char*> edits[] = {{"{\"v\":1}", "{\"v\":2}"}, {"{\"v\":2}", "{\"v\":3}"}};
    for (const auto& e : edits) {
        if (!history.recordUndoableAction(session, edit, e.first, e.second)) {
            std::cerr << "could not record update " << e.first << " -> " << e.second << "\n";
            return 1;
        }
        std::cout << "Recorded update " << e.first << " -> " << e.second << "\n";
    }

    auto undone = history.undo(session);
    std::cout << "Undo: " << (undone.success ? undone.applied_state.value_or("") : undone.error.value_or("")) << "\n";
    auto redone = history.redo(session);
    std::cout << "Redo: " << (redone.success ? redone.applied_state.value_or("") : redone.error.value_or("")) << "\n";

    const auto info = history.getStackInfo(session);
    std::cout << "Stack: total=" << info.total_entries << " active=" << info.active_entries
              << " position=" << info.current_position << "\n";

    const auto stats = history.getStats();
    std::cout << "Audit: total=" << stats.total_entries << " undoable=" << stats.undoable_entries
              << " sessions=" << stats.unique_sessions << "\n";
    for (const auto& kv : stats.entries_by_type) {
        std::cout << "  " << kv.first << ": " << kv.second << "\n";
    }

    if (maintenance.has_value()) maintenance->stop();
    return 0;
}
