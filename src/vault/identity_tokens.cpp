#include "identity_tokens.h"
#include "../crypto/token.h"

namespace vault {

IdentityToken IdentityTokens::mint(uint64_t now, uint64_t ttl_seconds) const {
    IdentityToken minted;
    minted.token = crypto::random_token();
    minted.hash = crypto::token_hash(minted.token);
    minted.issued_at = now;
    minted.expires_at = now + ttl_seconds;
    return minted;
}

core::Result<IdentityMatch> IdentityTokens::lookup(storage::Transaction& tx,
                                                   const std::string& token) const {
    if (token.empty()) {
        return core::Error::InvalidToken;
    }

    // The raw token never reaches SQL; the index is over its one-way hash
    auto presented = crypto::token_hash(token);

    auto stmt = tx.prepare(
        "SELECT election_id, voter_id, identity_token_hash, has_voted, expires_at "
        "FROM voters WHERE identity_token_hash = ?1");
    stmt.bind_blob(1, presented);

    if (!stmt.step()) {
        return core::Error::InvalidToken;
    }

    auto stored = stmt.column_blob(2);
    if (!crypto::constant_time_equal(stored, presented)) {
        return core::Error::InvalidToken;
    }

    IdentityMatch match;
    match.voter.election_id = stmt.column_text(0);
    match.voter.voter_id = stmt.column_text(1);
    match.consumed = stmt.column_int(3) != 0;
    match.expires_at = static_cast<uint64_t>(stmt.column_int(4));
    return match;
}

bool IdentityTokens::rotate(storage::Transaction& tx, const voters::VoterRef& voter,
                            const IdentityToken& replacement) const {
    auto update = tx.prepare(
        "UPDATE voters SET identity_token_hash = ?3, issued_at = ?4, expires_at = ?5 "
        "WHERE election_id = ?1 AND voter_id = ?2 AND state = 0");
    update.bind_text(1, voter.election_id)
          .bind_text(2, voter.voter_id)
          .bind_blob(3, replacement.hash)
          .bind_int(4, static_cast<int64_t>(replacement.issued_at))
          .bind_int(5, static_cast<int64_t>(replacement.expires_at));
    update.execute();
    return tx.connection().changes() == 1;
}

} // namespace vault
