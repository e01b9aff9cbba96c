#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace service {

/**
 * Deployment settings of a SealVote core
 */
struct Config {
    std::string database_path = "sealvote.db";

    // Identity tokens live for a week unless the election says otherwise
    uint64_t identity_token_ttl_seconds = 168 * 3600;
    uint64_t ballot_token_ttl_seconds = 3600;

    int busy_timeout_ms = 5000;
    size_t pool_size = 8;

    std::string log_level = "info";
};

} // namespace service
