#pragma once

#include "chronicle/storage.hpp"
#include <mutex>
#include <sqlite3.h>
#include <string>

namespace chronicle {

// IStorage over a single SQLite connection ("path/to/file.db" or ":memory:").
// An open transaction holds the connection for its thread until commit()/rollback().
class SqliteStorage : public IStorage {
public:
    explicit SqliteStorage(const std::string& db_path);
    ~SqliteStorage() override;

    SqliteStorage(const SqliteStorage&) = delete;
    SqliteStorage& operator=(const SqliteStorage&) = delete;

    void execute(const std::string& statement) override;
    int64_t write(const std::string& statement, const Params& params) override;
    std::vector<Row> queryMany(const std::string& statement, const Params& params) override;
    std::optional<Row> queryOne(const std::string& statement, const Params& params) override;
    void begin() override;
    void commit() override;
    void rollback() override;

    const std::string& dbPath() const { return db_path_; }

private:
    std::string db_path_;
    sqlite3* db_ {nullptr};
    std::recursive_mutex mutex_;
    bool in_transaction_ {false};
};

} // namespace chronicle
