#pragma once

#include "config.h"
#include "../audit/audit_ledger.h"
#include "../ballots/ballot_store.h"
#include "../core/clock.h"
#include "../core/result.h"
#include "../elections/election_registry.h"
#include "../storage/store.h"
#include "../vault/token_vault.h"
#include "../voters/voter_state_machine.h"

#include <optional>
#include <span>
#include <string>

namespace service {

/**
 * The core's interface to voter-management, election-management,
 * notification and presentation layers.
 *
 * Owns the store and every component. Each call is one unit of work;
 * callers never observe an intermediate state.
 * Thread-safe
 */
class VotingService {
public:
    /**
     * Open (and if needed create) the database.
     * Throws storage::StorageError if it cannot be opened or fails the
     * ballot isolation check.
     */
    explicit VotingService(const Config& config, core::Clock clock = core::system_now);

    VotingService(const VotingService&) = delete;
    VotingService& operator=(const VotingService&) = delete;

    /**
     * Authenticate an identity token and issue a ballot token.
     *
     * Authentication, the has_voted flip, the token insert and both audit
     * entries commit as one transaction. Of concurrent calls with one token
     * exactly one succeeds; the rest fail with AlreadyVoted.
     * Fails with InvalidToken, Expired, AlreadyVoted, ElectionNotOpen, or
     * StorageUnavailable (voter left where it was, safe to retry).
     *
     * On success the store's write-ahead log is truncated, so the commit
     * cannot be replayed later to pair the voter with the token.
     */
    core::Result<vault::BallotToken> identity_validate(const std::string& identity_token);

    /**
     * Cast an encrypted ballot with a ballot token
     */
    core::Result<ballots::Receipt> ballot_cast(const std::string& ballot_token,
                                               std::span<const uint8_t> encrypted_choice);

    /**
     * Verify an election's audit chain
     */
    core::Result<audit::ChainReport> audit_verify(const std::string& election_id) const;

    /**
     * Read an election's ballots, only once it is closed
     */
    core::Result<ballots::TallyCursor> tally_read(const std::string& election_id);

    /**
     * Confirm a receipt without revealing the ballot
     */
    core::Result<std::optional<ballots::Receipt>> receipt_check(const std::string& receipt) const;

    core::Result<voters::Turnout> turnout(const std::string& election_id) const;

    elections::ElectionRegistry& registry() { return registry_; }
    audit::AuditLedger& ledger() { return ledger_; }
    vault::TokenVault& vault() { return vault_; }
    ballots::BallotStore& ballots() { return ballots_; }
    storage::Store& store() { return store_; }

    [[nodiscard]] const Config& config() const { return config_; }

private:
    core::Result<vault::BallotToken> authenticate_and_issue(const std::string& identity_token);

    Config config_;
    core::Clock clock_;

    storage::Store store_;
    audit::AuditLedger ledger_;
    vault::TokenVault vault_;
    voters::VoterStateMachine voters_;
    elections::ElectionRegistry registry_;
    ballots::BallotStore ballots_;
};

} // namespace service
