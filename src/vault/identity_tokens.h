#pragma once

#include "../core/result.h"
#include "../crypto/hash.h"
#include "../storage/database.h"
#include "../voters/voter_record.h"

#include <cstdint>
#include <string>

namespace vault {

/**
 * A freshly minted identity token. The raw value leaves the core exactly
 * once (to the notification collaborator); only the hash is stored.
 */
struct IdentityToken {
    std::string token;
    crypto::Hash hash{};
    uint64_t issued_at = 0;
    uint64_t expires_at = 0;
};

/**
 * Voter found for an identity token
 */
struct IdentityMatch {
    voters::VoterRef voter;
    bool consumed = false;      // voter already reached Voted
    uint64_t expires_at = 0;
};

/**
 * Identity-token namespace of the vault: the token columns of the voter roll.
 * Has no knowledge of ballot tokens.
 */
class IdentityTokens {
public:
    /**
     * Draw a new token valid for ttl_seconds from now
     */
    IdentityToken mint(uint64_t now, uint64_t ttl_seconds) const;

    /**
     * Find the voter holding a token.
     * Fails with InvalidToken only; state and expiry are left to the caller.
     * Throws storage::StorageError.
     */
    core::Result<IdentityMatch> lookup(storage::Transaction& tx, const std::string& token) const;

    /**
     * Replace the token of a voter still in Invited.
     * Returns false if the voter is unknown or has already authenticated.
     * Throws storage::StorageError.
     */
    bool rotate(storage::Transaction& tx, const voters::VoterRef& voter,
                const IdentityToken& replacement) const;
};

} // namespace vault
