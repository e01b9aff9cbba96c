#include "ballot_tokens.h"
#include "../crypto/token.h"

namespace vault {

BallotToken BallotTokens::issue(storage::Transaction& tx, const std::string& election_id,
                                uint64_t now, uint64_t ttl_seconds) const {
    BallotToken minted;
    minted.token = crypto::random_token();
    minted.election_id = election_id;
    minted.issued_at = now;
    minted.expires_at = now + ttl_seconds;

    auto insert = tx.prepare(
        "INSERT INTO ballot_tokens (token_hash, election_id, issued_at, expires_at, used) "
        "VALUES (?1, ?2, ?3, ?4, 0)");
    insert.bind_blob(1, crypto::token_hash(minted.token))
          .bind_text(2, minted.election_id)
          .bind_int(3, static_cast<int64_t>(minted.issued_at))
          .bind_int(4, static_cast<int64_t>(minted.expires_at));
    insert.execute();

    return minted;
}

core::Result<std::string> BallotTokens::redeem(storage::Transaction& tx,
                                               const std::string& token,
                                               uint64_t now) const {
    if (token.empty()) {
        return core::Error::InvalidToken;
    }

    auto presented = crypto::token_hash(token);

    auto stmt = tx.prepare(
        "SELECT token_hash, election_id, expires_at, used "
        "FROM ballot_tokens WHERE token_hash = ?1");
    stmt.bind_blob(1, presented);

    if (!stmt.step() || !crypto::constant_time_equal(stmt.column_blob(0), presented)) {
        return core::Error::InvalidToken;
    }

    auto election_id = stmt.column_text(1);
    auto expires_at = static_cast<uint64_t>(stmt.column_int(2));

    if (stmt.column_int(3) != 0) {
        return core::Error::AlreadyUsed;
    }
    if (now > expires_at) {
        return core::Error::Expired;
    }

    auto update = tx.prepare(
        "UPDATE ballot_tokens SET used = 1, used_at = ?2 WHERE token_hash = ?1 AND used = 0");
    update.bind_blob(1, presented).bind_int(2, static_cast<int64_t>(now));
    update.execute();

    if (tx.connection().changes() != 1) {
        return core::Error::AlreadyUsed;
    }
    return election_id;
}

} // namespace vault
