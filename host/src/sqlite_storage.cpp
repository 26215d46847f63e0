#include "chronicle/sqlite_storage.hpp"
#include <string>

namespace chronicle {

namespace {

void exec_or_throw(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown sqlite error";
        sqlite3_free(err);
        throw StorageError(msg);
    }
}

// Finalizes the prepared statement on every exit path.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("prepare failed: ") + sqlite3_errmsg(db) + " [" + sql + "]");
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(const Params& params) {
        for (size_t i = 0; i < params.size(); ++i) {
            const int idx = static_cast<int>(i + 1);
            const Value& v = params[i];
            int rc = SQLITE_OK;
            if (const auto* n = std::get_if<int64_t>(&v)) {
                rc = sqlite3_bind_int64(stmt_, idx, *n);
            } else if (const auto* d = std::get_if<double>(&v)) {
                rc = sqlite3_bind_double(stmt_, idx, *d);
            } else if (const auto* s = std::get_if<std::string>(&v)) {
                rc = sqlite3_bind_text(stmt_, idx, s->c_str(), static_cast<int>(s->size()), SQLITE_TRANSIENT);
            } else {
                rc = sqlite3_bind_null(stmt_, idx);
            }
            if (rc != SQLITE_OK) {
                throw StorageError(std::string("bind failed: ") + sqlite3_errmsg(db_));
            }
        }
    }

    // Returns true while a row is available.
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    Row row() const {
        Row r;
        const int n = sqlite3_column_count(stmt_);
        for (int i = 0; i < n; ++i) {
            const char* name = sqlite3_column_name(stmt_, i);
            switch (sqlite3_column_type(stmt_, i)) {
            case SQLITE_INTEGER: r.set(name, static_cast<int64_t>(sqlite3_column_int64(stmt_, i))); break;
            case SQLITE_FLOAT: r.set(name, sqlite3_column_double(stmt_, i)); break;
            case SQLITE_NULL: r.set(name, std::monostate {}); break;
            default: {
                const unsigned char* txt = sqlite3_column_text(stmt_, i);
                const int len = sqlite3_column_bytes(stmt_, i);
                r.set(name, txt ? std::string(reinterpret_cast<const char*>(txt), static_cast<size_t>(len))
                                : std::string());
                break;
            }
            }
        }
        return r;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ {nullptr};
};

} // namespace

SqliteStorage::SqliteStorage(const std::string& db_path) : db_path_(db_path) {
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("failed to open sqlite database '" + db_path + "': " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    try {
        exec_or_throw(db_, "PRAGMA foreign_keys=ON;");
        if (db_path != ":memory:") {
            exec_or_throw(db_, "PRAGMA journal_mode=WAL;");
            exec_or_throw(db_, "PRAGMA synchronous=NORMAL;");
        }
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStorage::~SqliteStorage() {
    if (db_) sqlite3_close(db_);
}

void SqliteStorage::execute(const std::string& statement) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    exec_or_throw(db_, statement.c_str());
}

int64_t SqliteStorage::write(const std::string& statement, const Params& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, statement);
    stmt.bind(params);
    while (stmt.step()) {
    }
    return sqlite3_changes(db_);
}

std::vector<Row> SqliteStorage::queryMany(const std::string& statement, const Params& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, statement);
    stmt.bind(params);
    std::vector<Row> out;
    while (stmt.step()) out.push_back(stmt.row());
    return out;
}

std::optional<Row> SqliteStorage::queryOne(const std::string& statement, const Params& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement stmt(db_, statement);
    stmt.bind(params);
    if (!stmt.step()) return std::nullopt;
    return stmt.row();
}

void SqliteStorage::begin() {
    mutex_.lock();
    if (in_transaction_) {
        mutex_.unlock();
        throw StorageError("transaction already open on this connection");
    }
    try {
        exec_or_throw(db_, "BEGIN IMMEDIATE");
    } catch (...) {
        mutex_.unlock();
        throw;
    }
    in_transaction_ = true;
}

void SqliteStorage::commit() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!in_transaction_) throw StorageError("commit without an open transaction");
    exec_or_throw(db_, "COMMIT");
    in_transaction_ = false;
    mutex_.unlock(); // releases the hold taken in begin()
}

void SqliteStorage::rollback() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!in_transaction_) throw StorageError("rollback without an open transaction");
    in_transaction_ = false;
    mutex_.unlock(); // releases the hold taken in begin()
    // SQLite may already have rolled back on its own (e.g. after SQLITE_FULL).
    if (sqlite3_get_autocommit(db_) == 0) exec_or_throw(db_, "ROLLBACK");
}

} // namespace chronicle
