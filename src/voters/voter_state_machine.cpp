#include "voter_state_machine.h"

namespace voters {

const char* voter_state_to_string(VoterState state) {
    switch (state) {
        case VoterState::Invited: return "invited";
        case VoterState::Authenticated: return "authenticated";
        case VoterState::Voted: return "voted";
        default: return "unknown";
    }
}

VoterStateMachine::VoterStateMachine(core::Clock clock) : clock_(std::move(clock)) {}

core::Status VoterStateMachine::register_voter(storage::Transaction& tx,
                                               const VoterRecord& record) const {
    if (record.election_id.empty() || record.voter_id.empty()) {
        return core::Error::InvalidArgument;
    }

    auto exists = tx.prepare(
        "SELECT 1 FROM voters WHERE election_id = ?1 AND voter_id = ?2");
    exists.bind_text(1, record.election_id).bind_text(2, record.voter_id);
    if (exists.step()) {
        return core::Error::InvalidArgument;
    }

    auto insert = tx.prepare(
        "INSERT INTO voters (election_id, voter_id, identity_token_hash, state, "
        "has_voted, issued_at, expires_at) VALUES (?1, ?2, ?3, 0, 0, ?4, ?5)");
    insert.bind_text(1, record.election_id)
          .bind_text(2, record.voter_id)
          .bind_blob(3, record.identity_token_hash)
          .bind_int(4, static_cast<int64_t>(record.issued_at))
          .bind_int(5, static_cast<int64_t>(record.expires_at));
    insert.execute();
    return core::ok_status();
}

std::optional<VoterRecord> VoterStateMachine::load(storage::Transaction& tx,
                                                   const VoterRef& voter) const {
    auto stmt = tx.prepare(
        "SELECT identity_token_hash, state, has_voted, issued_at, expires_at "
        "FROM voters WHERE election_id = ?1 AND voter_id = ?2");
    stmt.bind_text(1, voter.election_id).bind_text(2, voter.voter_id);

    if (!stmt.step()) {
        return std::nullopt;
    }

    VoterRecord record;
    record.election_id = voter.election_id;
    record.voter_id = voter.voter_id;
    crypto::to_hash(stmt.column_blob(0), record.identity_token_hash);
    record.state = static_cast<VoterState>(stmt.column_int(1));
    record.has_voted = stmt.column_int(2) != 0;
    record.issued_at = static_cast<uint64_t>(stmt.column_int(3));
    record.expires_at = static_cast<uint64_t>(stmt.column_int(4));
    return record;
}

core::Result<VoterState> VoterStateMachine::authenticate(storage::Transaction& tx,
                                                         const VoterRef& voter) const {
    auto record = load(tx, voter);
    if (!record) {
        return core::Error::InvalidToken;
    }

    if (record->has_voted || record->state == VoterState::Voted) {
        return core::Error::AlreadyVoted;
    }

    // Expiry is checked, never extended
    if (clock_() > record->expires_at) {
        return core::Error::Expired;
    }

    if (record->state == VoterState::Authenticated) {
        return VoterState::Authenticated;
    }

    auto update = tx.prepare(
        "UPDATE voters SET state = 1 "
        "WHERE election_id = ?1 AND voter_id = ?2 AND state = 0");
    update.bind_text(1, voter.election_id).bind_text(2, voter.voter_id);
    update.execute();

    if (tx.connection().changes() != 1) {
        return core::Error::AlreadyVoted;
    }
    return VoterState::Authenticated;
}

core::Status VoterStateMachine::mark_voted(storage::Transaction& tx,
                                           const VoterRef& voter) const {
    auto update = tx.prepare(
        "UPDATE voters SET state = 2, has_voted = 1 "
        "WHERE election_id = ?1 AND voter_id = ?2 AND state = 1 AND has_voted = 0");
    update.bind_text(1, voter.election_id).bind_text(2, voter.voter_id);
    update.execute();

    if (tx.connection().changes() == 1) {
        return core::ok_status();
    }

    auto record = load(tx, voter);
    if (!record) {
        return core::Error::InvalidToken;
    }
    if (record->has_voted) {
        return core::Error::AlreadyVoted;
    }
    // Still Invited: issuance without authentication
    return core::Error::InvalidArgument;
}

Turnout VoterStateMachine::turnout(storage::Transaction& tx,
                                   const std::string& election_id) const {
    Turnout turnout;

    auto stmt = tx.prepare(
        "SELECT state, COUNT(voter_id) FROM voters WHERE election_id = ?1 GROUP BY state");
    stmt.bind_text(1, election_id);

    while (stmt.step()) {
        auto count = static_cast<uint64_t>(stmt.column_int(1));
        switch (static_cast<VoterState>(stmt.column_int(0))) {
            case VoterState::Invited: turnout.invited = count; break;
            case VoterState::Authenticated: turnout.authenticated = count; break;
            case VoterState::Voted: turnout.voted = count; break;
        }
    }
    return turnout;
}

} // namespace voters
