#include "database.h"
#include "../core/log.h"

#include <sqlite3.h>

#include <utility>

namespace storage {

namespace {

[[noreturn]] void raise(sqlite3* db, int code, const std::string& context) {
    std::string message = context + ": ";
    message += db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(code);
    throw StorageError(message, code & 0xff);
}

}

bool StorageError::is_constraint() const {
    return code_ == SQLITE_CONSTRAINT;
}

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        raise(db_, rc, "prepare failed");
    }
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        db_ = other.db_;
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Statement& Statement::bind_int(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK) {
        raise(db_, rc, "bind failed");
    }
    return *this;
}

Statement& Statement::bind_text(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        raise(db_, rc, "bind failed");
    }
    return *this;
}

Statement& Statement::bind_blob(int index, std::span<const uint8_t> value) {
    // A zero-length blob must not be bound as NULL
    static const uint8_t empty = 0;
    const void* data = value.empty() ? &empty : value.data();
    int rc = sqlite3_bind_blob(stmt_, index, data, static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        raise(db_, rc, "bind failed");
    }
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    raise(db_, rc, "step failed");
}

void Statement::execute() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
}

int64_t Statement::column_int(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

std::string Statement::column_text(int index) const {
    const auto* text = sqlite3_column_text(stmt_, index);
    int len = sqlite3_column_bytes(stmt_, index);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text), len);
}

std::vector<uint8_t> Statement::column_blob(int index) const {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, index));
    int len = sqlite3_column_bytes(stmt_, index);
    if (data == nullptr) {
        return {};
    }
    return std::vector<uint8_t>(data, data + len);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

Connection::Connection(const std::string& path,
                       std::shared_ptr<const Grants> grants,
                       int busy_timeout_ms)
    : grants_(std::move(grants)) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = "open " + path + ": " + sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(message, rc & 0xff);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);
    sqlite3_extended_result_codes(db_, 1);

    try {
        exec("PRAGMA foreign_keys = ON");
        exec("PRAGMA synchronous = FULL");
        // Freed cells and pages are zeroed, not left for a file reader
        exec("PRAGMA secure_delete = ON");
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    // Pragmas above run before the authorizer, which denies PRAGMA
    if (grants_) {
        sqlite3_set_authorizer(db_, &authorize, const_cast<Grants*>(grants_.get()));
    }
}

Connection::~Connection() {
    sqlite3_close(db_);
}

void Connection::exec(const std::string& sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = "exec failed: ";
        message += error != nullptr ? error : sqlite3_errstr(rc);
        sqlite3_free(error);
        throw StorageError(message, rc & 0xff);
    }
}

Statement Connection::prepare(const std::string& sql) {
    return Statement(db_, sql);
}

int Connection::changes() const {
    return sqlite3_changes(db_);
}

bool Connection::truncate_log() {
    int log_frames = 0;
    int checkpointed = 0;
    int rc = sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE,
                                       &log_frames, &checkpointed);
    if ((rc & 0xff) == SQLITE_BUSY || (rc & 0xff) == SQLITE_LOCKED) {
        return false;
    }
    if (rc != SQLITE_OK) {
        raise(db_, rc, "checkpoint failed");
    }
    return true;
}

Transaction::Transaction(Connection& connection, TransactionMode mode)
    : connection_(connection) {
    connection_.exec(mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED");
}

Transaction::~Transaction() {
    if (!active_) {
        return;
    }
    try {
        connection_.exec("ROLLBACK");
    } catch (const StorageError& e) {
        // SQLite may already have rolled back on its own after an I/O error
        core::get_logger("storage")->warn("rollback failed: {}", e.what());
    }
}

void Transaction::commit() {
    connection_.exec("COMMIT");
    active_ = false;
}

} // namespace storage
