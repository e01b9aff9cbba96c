#include "voting_service.h"
#include "../core/log.h"

namespace service {

namespace {

const char* const ACTOR = "issuance";

}

VotingService::VotingService(const Config& config, core::Clock clock)
    : config_(config)
    , clock_(std::move(clock))
    , store_(storage::StoreOptions{config_.database_path, config_.busy_timeout_ms, config_.pool_size})
    , ledger_(store_, clock_)
    , vault_(store_, clock_)
    , voters_(clock_)
    , registry_(store_, vault_, voters_, ledger_, clock_)
    , ballots_(store_, vault_, ledger_, clock_) {}

core::Result<vault::BallotToken> VotingService::identity_validate(const std::string& identity_token) {
    auto token = authenticate_and_issue(identity_token);
    if (token) {
        // The commit wrote the voter flip and the token row together;
        // keep it from being replayed out of the log
        store_.truncate_log();
    }
    return token;
}

core::Result<vault::BallotToken> VotingService::authenticate_and_issue(const std::string& identity_token) {
    auto log = core::get_logger("service");

    try {
        auto connection = store_.pool(storage::Profile::Issuance).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Immediate);

        auto voter = vault_.lookup_identity(tx, identity_token);
        if (!voter) {
            log->info("identity rejected: {}", core::error_to_string(voter.error()));
            return voter.failure();
        }

        const auto election_id = voter->election_id;

        auto status = elections::ElectionRegistry::status_in(tx, election_id);
        if (!status) {
            return status.failure();
        }
        if (*status != elections::ElectionStatus::Open) {
            log->info("identity rejected: election {} is {}", election_id,
                      elections::election_status_to_string(*status));
            return core::Error::ElectionNotOpen;
        }

        auto authenticated = voters_.authenticate(tx, *voter);
        if (!authenticated) {
            log->info("identity rejected in election {}: {}", election_id,
                      core::error_to_string(authenticated.error()));
            return authenticated.failure();
        }
        ledger_.append(tx, election_id, audit::EventType::VoterAuthenticated, ACTOR);

        auto voted = voters_.mark_voted(tx, *voter);
        if (!voted) {
            return voted.failure();
        }

        // The voter reference ends here; nothing below may see it
        auto token = vault_.issue_ballot_token(tx, election_id, config_.ballot_token_ttl_seconds);
        ledger_.append(tx, election_id, audit::EventType::BallotTokenIssued, ACTOR);

        tx.commit();
        log->info("ballot token issued in election {}", election_id);
        return token;
    } catch (const storage::StorageError& e) {
        log->error("identity validation failed, nothing committed: {}", e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<ballots::Receipt> VotingService::ballot_cast(const std::string& ballot_token,
                                                          std::span<const uint8_t> encrypted_choice) {
    return ballots_.cast(ballot_token, encrypted_choice);
}

core::Result<audit::ChainReport> VotingService::audit_verify(const std::string& election_id) const {
    return ledger_.verify_chain(election_id);
}

core::Result<ballots::TallyCursor> VotingService::tally_read(const std::string& election_id) {
    auto cursor = ballots_.read_for_tally(election_id);
    if (!cursor) {
        core::get_logger("service")->warn("tally of {} refused: {}", election_id,
                                          core::error_to_string(cursor.error()));
    }
    return cursor;
}

core::Result<std::optional<ballots::Receipt>> VotingService::receipt_check(const std::string& receipt) const {
    return ballots_.verify_receipt(receipt);
}

core::Result<voters::Turnout> VotingService::turnout(const std::string& election_id) const {
    return registry_.turnout(election_id);
}

} // namespace service
