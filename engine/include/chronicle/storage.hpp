#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace chronicle {

// Column / parameter value: NULL, INTEGER, REAL or TEXT.
using Value = std::variant<std::monostate, int64_t, double, std::string>;
using Params = std::vector<Value>;

// Thrown by storage adapters when the backing store is unreachable or a statement fails.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Row {
public:
    void set(std::string column, Value value);

    bool has(const std::string& column) const;
    bool isNull(const std::string& column) const;
    std::optional<std::string> text(const std::string& column) const;
    std::optional<int64_t> integer(const std::string& column) const;

    const std::vector<std::pair<std::string, Value>>& columns() const { return columns_; }

private:
    const Value* find(const std::string& column) const;

    std::vector<std::pair<std::string, Value>> columns_;
};

// Abstract storage port. Statements are SQL text with positional '?' parameters.
// begin() must be closed by commit() or rollback() on the same thread.
class IStorage {
public:
    virtual ~IStorage() = default;
    virtual void execute(const std::string& statement) = 0; // schema statements
    virtual int64_t write(const std::string& statement, const Params& params) = 0; // returns affected rows
    virtual std::vector<Row> queryMany(const std::string& statement, const Params& params) = 0;
    virtual std::optional<Row> queryOne(const std::string& statement, const Params& params) = 0;
    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// Runs fn inside begin()/commit(); rolls back and rethrows if anything in fn or commit throws.
template <typename Fn>
void in_transaction(IStorage& storage, Fn&& fn) {
    storage.begin();
    try {
        fn();
        storage.commit();
    } catch (...) {
        storage.rollback();
        throw;
    }
}

// Creates the audit_log, undo_stack and undo_metadata tables and their indexes if missing.
void ensure_schema(IStorage& storage);

// Value helpers for building parameter lists from optional fields.
Value to_value(const std::optional<std::string>& v);
Value to_value(const std::optional<int64_t>& v);

} // namespace chronicle
