#pragma once

#include "voter_record.h"
#include "../core/clock.h"
#include "../core/result.h"
#include "../storage/database.h"

#include <optional>

namespace voters {

/**
 * Per-voter lifecycle Invited -> Authenticated -> Voted.
 *
 * Owns the state columns of the voter roll; nothing else writes them.
 * Every operation runs inside a caller's transaction, and the flip to
 * Voted is a compare-and-set on has_voted, so of any number of concurrent
 * attempts for one voter exactly one succeeds.
 * Operations throw storage::StorageError on database failure.
 */
class VoterStateMachine {
public:
    explicit VoterStateMachine(core::Clock clock);

    /**
     * Add a voter in state Invited.
     * Fails with InvalidArgument if the voter is already on the roll.
     */
    core::Status register_voter(storage::Transaction& tx, const VoterRecord& record) const;

    /**
     * Load a voter's record
     */
    std::optional<VoterRecord> load(storage::Transaction& tx, const VoterRef& voter) const;

    /**
     * Invited -> Authenticated (no-op if already Authenticated).
     * Fails with AlreadyVoted after Voted, with Expired past expires_at.
     */
    core::Result<VoterState> authenticate(storage::Transaction& tx, const VoterRef& voter) const;

    /**
     * Authenticated -> Voted together with the has_voted flip.
     * Fails with AlreadyVoted if another transaction got there first,
     * with InvalidArgument if the voter never authenticated.
     */
    core::Status mark_voted(storage::Transaction& tx, const VoterRef& voter) const;

    /**
     * Count voters of an election per state
     */
    Turnout turnout(storage::Transaction& tx, const std::string& election_id) const;

private:
    core::Clock clock_;
};

} // namespace voters
