#pragma once

#include "pool.h"
#include "schema.h"

#include <array>
#include <memory>
#include <mutex>
#include <string>

namespace storage {

struct StoreOptions {
    std::string path;
    int busy_timeout_ms = 5000;
    size_t pool_size = 8;
};

/**
 * The database file and one connection pool per grant profile.
 *
 * Opening migrates the schema and refuses to continue if the ballot-side
 * tables are not structurally isolated from voter data.
 */
class Store {
public:
    /**
     * Throws StorageError if the file cannot be opened or migrated,
     * or if the isolation check fails
     */
    explicit Store(StoreOptions options);
    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    ConnectionPool& pool(Profile profile);

    /**
     * Fold committed transactions into the database file and empty the
     * write-ahead log, so no earlier commit can be replayed from it.
     *
     * Never waits: returns false if an open transaction elsewhere holds
     * the log, in which case the next call picks the frames up.
     * Thread-safe
     */
    bool truncate_log();

    [[nodiscard]] const std::string& path() const { return options_.path; }

private:
    StoreOptions options_;
    std::mutex log_mutex_;
    std::unique_ptr<Connection> log_connection_;
    std::array<std::unique_ptr<ConnectionPool>, PROFILE_COUNT> pools_;
};

} // namespace storage
