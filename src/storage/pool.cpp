#include "pool.h"

namespace storage {

ConnectionPool::Lease::~Lease() {
    if (pool_ != nullptr && connection_) {
        pool_->release(std::move(connection_));
    }
}

ConnectionPool::ConnectionPool(std::string path,
                               std::shared_ptr<const Grants> grants,
                               int busy_timeout_ms,
                               size_t max_idle)
    : path_(std::move(path))
    , grants_(std::move(grants))
    , busy_timeout_ms_(busy_timeout_ms)
    , max_idle_(max_idle) {}

ConnectionPool::Lease ConnectionPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            auto connection = std::move(idle_.back());
            idle_.pop_back();
            return Lease(this, std::move(connection));
        }
    }

    // Open outside the lock, opening may wait on the file
    return Lease(this, std::make_unique<Connection>(path_, grants_, busy_timeout_ms_));
}

void ConnectionPool::release(std::unique_ptr<Connection> connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.size() < max_idle_) {
        idle_.push_back(std::move(connection));
    }
}

} // namespace storage
