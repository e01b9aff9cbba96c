#pragma once

#include "grants.h"

#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace storage {

/**
 * Raised by the storage layer when SQLite reports an error.
 * Component entry points turn it into Error::StorageUnavailable.
 */
class StorageError : public std::runtime_error {
public:
    StorageError(const std::string& what, int code)
        : std::runtime_error(what), code_(code) {}

    /**
     * SQLite primary result code
     */
    [[nodiscard]] int code() const { return code_; }

    /**
     * True if a constraint (UNIQUE, CHECK, trigger RAISE) rejected the write
     */
    [[nodiscard]] bool is_constraint() const;

private:
    int code_;
};

/**
 * Prepared statement, finalized on destruction
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Parameters are 1-based, as in SQLite
    Statement& bind_int(int index, int64_t value);
    Statement& bind_text(int index, const std::string& value);
    Statement& bind_blob(int index, std::span<const uint8_t> value);

    /**
     * Advance the statement
     * Returns true if a row is available, false when done
     */
    bool step();

    /**
     * Run a statement that returns no rows
     */
    void execute();

    /**
     * Rewind for re-execution, keeping bindings
     */
    void reset();

    // Columns are 0-based, as in SQLite
    [[nodiscard]] int64_t column_int(int index) const;
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] std::vector<uint8_t> column_blob(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * One SQLite connection.
 *
 * A connection opened with grants only runs statements those grants
 * permit; one opened without grants is unrestricted and is used for
 * schema migration only.
 */
class Connection {
public:
    Connection(const std::string& path,
               std::shared_ptr<const Grants> grants,
               int busy_timeout_ms);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * Execute one or more statements that return no rows
     */
    void exec(const std::string& sql);

    Statement prepare(const std::string& sql);

    /**
     * Rows changed by the most recent INSERT/UPDATE/DELETE
     */
    [[nodiscard]] int changes() const;

    /**
     * Checkpoint the write-ahead log into the database file and truncate
     * it to zero bytes.
     *
     * Returns false if a reader or writer on another connection kept the
     * log from being emptied; throws StorageError on any other failure.
     * Runs through the C API, so grants do not apply.
     */
    bool truncate_log();

    [[nodiscard]] const Grants* grants() const { return grants_.get(); }

private:
    sqlite3* db_ = nullptr;
    std::shared_ptr<const Grants> grants_;
};

enum class TransactionMode {
    Deferred,   // snapshot read, takes the write lock lazily
    Immediate   // takes the write lock up front
};

/**
 * Unit of work on one connection.
 * Rolls back on destruction unless committed.
 */
class Transaction {
public:
    Transaction(Connection& connection, TransactionMode mode);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

    [[nodiscard]] Connection& connection() { return connection_; }

    // Shorthand for connection().prepare()
    Statement prepare(const std::string& sql) { return connection_.prepare(sql); }

private:
    Connection& connection_;
    bool active_ = true;
};

} // namespace storage
