#pragma once

#include "core/clock.h"
#include "storage/database.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <system_error>

namespace test_support {

/**
 * Fresh database file in the temp directory, removed with its WAL files
 */
class TempDatabase {
public:
    TempDatabase() : path_(make_path()) {}
    ~TempDatabase() {
        for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
            std::error_code ignored;
            std::filesystem::remove(path_ + suffix, ignored);
        }
    }

    TempDatabase(const TempDatabase&) = delete;
    TempDatabase& operator=(const TempDatabase&) = delete;

    [[nodiscard]] const std::string& path() const { return path_; }

    /**
     * Unrestricted connection, standing in for someone with file access
     */
    [[nodiscard]] std::unique_ptr<storage::Connection> raw() const {
        return std::make_unique<storage::Connection>(path_, nullptr, 5000);
    }

private:
    static std::string make_path() {
        static std::atomic<uint64_t> counter{0};
        std::random_device device;
        auto name = "sealvote_test_" + std::to_string(device()) + "_" +
                    std::to_string(counter.fetch_add(1)) + ".db";
        return (std::filesystem::temp_directory_path() / name).string();
    }

    std::string path_;
};

/**
 * Clock that only moves when told to
 */
class ManualClock {
public:
    explicit ManualClock(uint64_t start = 1700000000) : now_(start) {}

    [[nodiscard]] core::Clock clock() {
        return [this] { return now_.load(); };
    }

    void advance(uint64_t seconds) { now_ += seconds; }

    [[nodiscard]] uint64_t now() const { return now_.load(); }

private:
    std::atomic<uint64_t> now_;
};

/**
 * Insert an election row directly, bypassing the registry.
 * status: 0 draft, 1 open, 2 closed
 */
inline void insert_election(storage::Connection& connection, const std::string& election_id,
                            int status = 1) {
    auto stmt = connection.prepare(
        "INSERT INTO elections (election_id, title, status, public_key, token_ttl_seconds, created_at) "
        "VALUES (?1, ?2, ?3, zeroblob(32), 3600, 0)");
    stmt.bind_text(1, election_id).bind_text(2, "test " + election_id).bind_int(3, status);
    stmt.execute();
}

/**
 * Size of the database's write-ahead log, 0 if there is none
 */
inline uintmax_t wal_size(const std::string& db_path) {
    std::error_code missing;
    auto size = std::filesystem::file_size(db_path + "-wal", missing);
    return missing ? 0 : size;
}

inline int64_t count_rows(storage::Connection& connection, const std::string& sql) {
    auto stmt = connection.prepare(sql);
    stmt.step();
    return stmt.column_int(0);
}

} // namespace test_support
