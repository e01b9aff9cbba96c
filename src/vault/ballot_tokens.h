#pragma once

#include "../core/result.h"
#include "../storage/database.h"

#include <cstdint>
#include <string>

namespace vault {

/**
 * Right to cast exactly one ballot in one election.
 * Carries no reference to any voter: its only association is election_id.
 */
struct BallotToken {
    std::string token;
    std::string election_id;
    uint64_t issued_at = 0;
    uint64_t expires_at = 0;
    bool used = false;
};

/**
 * Ballot-token namespace of the vault. Has no knowledge of voters.
 */
class BallotTokens {
public:
    /**
     * Mint and store a token for an election.
     * Throws storage::StorageError.
     */
    BallotToken issue(storage::Transaction& tx, const std::string& election_id,
                      uint64_t now, uint64_t ttl_seconds) const;

    /**
     * Flip used 0 -> 1. Returns the token's election.
     * Fails with InvalidToken, Expired or AlreadyUsed; of concurrent
     * redemptions of one token exactly one succeeds.
     * Throws storage::StorageError.
     */
    core::Result<std::string> redeem(storage::Transaction& tx, const std::string& token,
                                     uint64_t now) const;
};

} // namespace vault
