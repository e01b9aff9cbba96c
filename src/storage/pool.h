#pragma once

#include "database.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace storage {

/**
 * Connections of one grant profile.
 * Each unit of work leases its own connection; idle connections are kept
 * up to max_idle and reopened on demand beyond that.
 * Thread-safe
 */
class ConnectionPool {
public:
    /**
     * RAII lease, returns the connection to the pool on destruction
     */
    class Lease {
    public:
        Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
            : pool_(pool), connection_(std::move(connection)) {}
        ~Lease();

        Lease(Lease&& other) noexcept = default;
        Lease& operator=(Lease&& other) noexcept = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Connection& operator*() { return *connection_; }
        Connection* operator->() { return connection_.get(); }

    private:
        ConnectionPool* pool_;
        std::unique_ptr<Connection> connection_;
    };

    ConnectionPool(std::string path,
                   std::shared_ptr<const Grants> grants,
                   int busy_timeout_ms,
                   size_t max_idle);

    /**
     * Take an idle connection or open a new one.
     * Throws StorageError if the database cannot be opened.
     */
    Lease acquire();

    [[nodiscard]] const Grants& grants() const { return *grants_; }

private:
    void release(std::unique_ptr<Connection> connection);

    std::string path_;
    std::shared_ptr<const Grants> grants_;
    int busy_timeout_ms_;
    size_t max_idle_;

    std::mutex mutex_;
    std::vector<std::unique_ptr<Connection>> idle_;
};

} // namespace storage
