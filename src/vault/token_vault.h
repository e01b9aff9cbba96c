#pragma once

#include "ballot_tokens.h"
#include "identity_tokens.h"
#include "../core/clock.h"
#include "../core/result.h"
#include "../storage/store.h"
#include "../voters/voter_record.h"

#include <cstdint>
#include <string>

namespace vault {

/**
 * Issues and validates the two token kinds.
 *
 * Identity tokens and ballot tokens live in separate namespaces
 * (IdentityTokens, BallotTokens) that share nothing but the CSPRNG: no
 * ballot-token operation takes a voter reference, and no stored ballot
 * token carries one. Raw tokens are returned to the caller once and only
 * their hashes are persisted.
 *
 * The transactional overloads run inside a caller's unit of work and throw
 * storage::StorageError; the standalone ones run their own transaction and
 * report StorageUnavailable instead.
 * Thread-safe
 */
class TokenVault {
public:
    TokenVault(storage::Store& store, core::Clock clock);

    /**
     * Mint an identity token valid for ttl_seconds. Not stored; the caller
     * records its hash on the voter roll.
     */
    IdentityToken mint_identity_token(uint64_t ttl_seconds) const;

    /**
     * Resolve an identity token to its voter, checking only that it exists
     */
    core::Result<voters::VoterRef> lookup_identity(storage::Transaction& tx,
                                                   const std::string& token) const;

    /**
     * Full validation: InvalidToken, then AlreadyUsed once the voter has
     * voted, then Expired past the token's expiry.
     */
    core::Result<voters::VoterRef> validate_identity(storage::Transaction& tx,
                                                     const std::string& token) const;
    core::Result<voters::VoterRef> validate_identity(const std::string& token) const;

    /**
     * Give a voter still in Invited a fresh identity token, invalidating
     * the old one. Fails with InvalidArgument if the voter is unknown or
     * has authenticated.
     */
    core::Result<IdentityToken> rotate_identity_token(storage::Transaction& tx,
                                                      const voters::VoterRef& voter,
                                                      uint64_t ttl_seconds) const;

    /**
     * Mint and store a single-use ballot token for an election
     */
    BallotToken issue_ballot_token(storage::Transaction& tx,
                                   const std::string& election_id,
                                   uint64_t ttl_seconds) const;

    /**
     * Consume a ballot token. Returns the election it belongs to.
     * Of concurrent redemptions of one token exactly one succeeds.
     */
    core::Result<std::string> redeem_ballot_token(storage::Transaction& tx,
                                                  const std::string& token) const;
    core::Status redeem_ballot_token(const std::string& token) const;

private:
    storage::Store& store_;
    core::Clock clock_;
    IdentityTokens identity_;
    BallotTokens ballot_;
};

} // namespace vault
