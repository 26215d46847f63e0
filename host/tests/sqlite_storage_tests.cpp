#include "chronicle/sqlite_storage.hpp"
#include "chronicle/undo_stack.hpp"
#include <cassert>
#include <filesystem>
#include <sqlite3.h>
#include <string>
#include <thread>
#include <vector>

using namespace chronicle;

static int count(sqlite3* db, const char* table) {
    std::string q = std::string("SELECT COUNT(*) FROM ") + table;
    sqlite3_stmt* st = nullptr;
    assert(sqlite3_prepare_v2(db, q.c_str(), -1, &st, nullptr) == SQLITE_OK);
    assert(sqlite3_step(st) == SQLITE_ROW);
    int c = sqlite3_column_int(st, 0);
    sqlite3_finalize(st);
    return c;
}

static bool throws_storage_error(void (*fn)(SqliteStorage&), SqliteStorage& storage) {
    try {
        fn(storage);
    } catch (const StorageError&) {
        return true;
    }
    return false;
}

int main() {
    namespace fs = std::filesystem;
    fs::create_directories("test_tmp");
    const std::string dbpath = "test_tmp/chronicle_storage.db";
    fs::remove(dbpath);
    fs::remove(dbpath + "-wal");
    fs::remove(dbpath + "-shm");

    std::string undo_id;
    {
        SqliteStorage storage(dbpath);
        assert(storage.dbPath() == dbpath);
        ensure_schema(storage);
        ensure_schema(storage); // idempotent

        // Parameter binding and typed rows
        storage.execute("CREATE TABLE kv(k TEXT PRIMARY KEY, i INTEGER, d REAL, n TEXT)");
        assert(storage.write("INSERT INTO kv(k, i, d, n) VALUES(?,?,?,?)",
                             {std::string("a"), int64_t {7}, 2.5, std::monostate {}}) == 1);
        auto row = storage.queryOne("SELECT * FROM kv WHERE k = ?", {std::string("a")});
        assert(row.has_value());
        assert(row->integer("i") == 7);
        assert(row->isNull("n"));
        assert(row->text("k") == std::string("a"));
        assert(!storage.queryOne("SELECT * FROM kv WHERE k = ?", {std::string("zz")}).has_value());
        assert(storage.write("UPDATE kv SET i = i + 1", {}) == 1);
        assert(storage.write("DELETE FROM kv WHERE k = ?", {std::string("nope")}) == 0);

        // Rollback discards, commit keeps
        storage.begin();
        storage.write("INSERT INTO kv(k) VALUES(?)", {std::string("b")});
        storage.rollback();
        storage.begin();
        storage.write("INSERT INTO kv(k) VALUES(?)", {std::string("c")});
        storage.commit();
        assert(storage.queryMany("SELECT k FROM kv ORDER BY k", {}).size() == 2);

        // Errors surface as StorageError
        assert(throws_storage_error([](SqliteStorage& s) { s.execute("SELEKT nonsense"); }, storage));
        assert(throws_storage_error([](SqliteStorage& s) { s.queryMany("SELECT * FROM missing_table", {}); },
                                    storage));
        assert(throws_storage_error([](SqliteStorage& s) { s.commit(); }, storage));
        assert(throws_storage_error([](SqliteStorage& s) { s.rollback(); }, storage));
        assert(throws_storage_error(
            [](SqliteStorage& s) {
                in_transaction(s, [&] {
                    s.write("INSERT INTO kv(k) VALUES(?)", {std::string("d")});
                    s.write("INSERT INTO kv(k) VALUES(?)", {std::string("d")}); // duplicate key
                });
            },
            storage));
        assert(!storage.queryOne("SELECT k FROM kv WHERE k = 'd'", {}).has_value());

        // A transaction on one thread keeps other threads out until it ends
        storage.begin();
        storage.write("INSERT INTO kv(k) VALUES(?)", {std::string("e")});
        bool seen = false;
        std::thread reader([&] {
            auto r = storage.queryOne("SELECT k FROM kv WHERE k = 'e'", {});
            seen = r.has_value();
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        storage.commit();
        reader.join();
        assert(seen);

        UndoRedoStack stack(storage, UndoConfig {});
        UndoStackInput in;
        in.target_type = TargetType::Bookmark;
        in.target_id = "bm1";
        in.before_state = "null";
        in.after_state = "{\"url\":\"x\"}";
        auto id = stack.pushUndoableAction("persisted", in);
        assert(id.has_value());
        undo_id = *id;
    }

    // Reopen: the stack survived on disk
    {
        sqlite3* db = nullptr;
        assert(sqlite3_open(dbpath.c_str(), &db) == SQLITE_OK);
        assert(count(db, "undo_stack") == 1);
        assert(count(db, "audit_log") == 0);
        sqlite3_close(db);

        SqliteStorage storage(dbpath);
        ensure_schema(storage);
        UndoRedoStack stack(storage, UndoConfig {});
        auto entries = stack.listEntries("persisted");
        assert(entries.size() == 1 && entries[0].id == undo_id);
        assert(entries[0].target_type == TargetType::Bookmark);
        assert(!entries[0].audit_log_id.has_value());
    }

    // Unopenable path
    bool failed = false;
    try {
        SqliteStorage bad("test_tmp/no/such/dir/x.db");
    } catch (const StorageError&) {
        failed = true;
    }
    assert(failed);

    return 0;
}
