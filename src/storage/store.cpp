#include "store.h"
#include "../core/log.h"

#include <sqlite3.h>

namespace storage {

Store::Store(StoreOptions options) : options_(std::move(options)) {
    auto log = core::get_logger("storage");

    {
        Connection admin(options_.path, nullptr, options_.busy_timeout_ms);
        migrate(admin);

        auto violations = verify_ballot_isolation(admin);
        if (!violations.empty()) {
            for (const auto& violation : violations) {
                log->critical("ballot isolation violated: {}", violation);
            }
            throw StorageError("ballot tables are linked to voter data", SQLITE_SCHEMA);
        }
    }

    // No grants and no busy wait: it only ever checkpoints
    log_connection_ = std::make_unique<Connection>(
        options_.path, std::make_shared<const Grants>("checkpoint"), 0);
    // A first read attaches the connection to the log
    log_connection_->exec("SELECT COUNT(*) FROM sqlite_master");
    truncate_log();

    for (size_t i = 0; i < PROFILE_COUNT; ++i) {
        auto profile = static_cast<Profile>(i);
        pools_[i] = std::make_unique<ConnectionPool>(
            options_.path, grants_for(profile), options_.busy_timeout_ms, options_.pool_size);
    }

    log->info("opened {} (schema v{})", options_.path, SCHEMA_VERSION);
}

Store::~Store() {
    if (!truncate_log()) {
        core::get_logger("storage")->warn("closing {} with a non-empty commit log", options_.path);
    }
}

ConnectionPool& Store::pool(Profile profile) {
    return *pools_[static_cast<size_t>(profile)];
}

bool Store::truncate_log() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    try {
        if (log_connection_->truncate_log()) {
            return true;
        }
        core::get_logger("storage")->debug("commit log in use, truncation deferred");
    } catch (const StorageError& e) {
        core::get_logger("storage")->error("truncating commit log failed: {}", e.what());
    }
    return false;
}

} // namespace storage
