#include "ballot_store.h"
#include "../core/encoding.h"
#include "../core/log.h"
#include "../crypto/token.h"
#include "../elections/election_registry.h"

namespace ballots {

namespace {

const char* const ACTOR = "casting";

// Receipt = H(choice || nonce); the nonce keeps equal choices apart and
// the token out of the derivation
std::string make_receipt(std::span<const uint8_t> encrypted_choice) {
    core::ByteWriter writer;
    writer.write_raw(encrypted_choice);
    writer.write_raw(crypto::random_bytes(crypto::TOKEN_ENTROPY_SIZE));
    return crypto::to_hex(crypto::blake2b(writer.data()));
}

}

TallyCursor::TallyCursor(storage::ConnectionPool::Lease lease,
                         std::unique_ptr<storage::Transaction> tx,
                         storage::Statement stmt,
                         std::vector<std::string> options)
    : lease_(std::move(lease))
    , tx_(std::move(tx))
    , stmt_(std::move(stmt))
    , options_(std::move(options)) {}

core::Result<std::optional<EncryptedBallot>> TallyCursor::next() {
    if (failed_) {
        return core::Error::StorageUnavailable;
    }
    if (done_) {
        return std::optional<EncryptedBallot>();
    }

    try {
        if (!stmt_->step()) {
            // SQLite would silently start over on the next step
            done_ = true;
            return std::optional<EncryptedBallot>();
        }

        EncryptedBallot ballot;
        ballot.ballot_id = stmt_->column_int(0);
        ballot.election_id = stmt_->column_text(1);
        ballot.encrypted_choice = stmt_->column_blob(2);
        ballot.cast_at = static_cast<uint64_t>(stmt_->column_int(3));
        return std::optional<EncryptedBallot>(std::move(ballot));
    } catch (const storage::StorageError& e) {
        // The statement has been reset; stepping on would replay from the first ballot
        failed_ = true;
        core::get_logger("ballots")->error("tally read failed: {}", e.what());
        return core::Error::StorageUnavailable;
    }
}

void TallyCursor::restart() {
    stmt_->reset();
    done_ = false;
    failed_ = false;
}

BallotStore::BallotStore(storage::Store& store,
                         vault::TokenVault& vault,
                         audit::AuditLedger& ledger,
                         core::Clock clock)
    : store_(store)
    , vault_(vault)
    , ledger_(ledger)
    , clock_(std::move(clock)) {}

core::Result<Receipt> BallotStore::cast(const std::string& ballot_token,
                                        std::span<const uint8_t> encrypted_choice) {
    auto log = core::get_logger("ballots");

    try {
        auto connection = store_.pool(storage::Profile::Casting).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Immediate);

        auto election_id = vault_.redeem_ballot_token(tx, ballot_token);
        if (!election_id) {
            log->info("ballot rejected: {}", core::error_to_string(election_id.error()));
            return election_id.failure();
        }

        auto status = elections::ElectionRegistry::status_in(tx, *election_id);
        if (!status) {
            return status.failure();
        }
        if (*status != elections::ElectionStatus::Open) {
            log->info("ballot rejected: election {} is {}", *election_id,
                      elections::election_status_to_string(*status));
            return core::Error::ElectionNotOpen;
        }

        if (encrypted_choice.empty()) {
            return core::Error::InvalidArgument;
        }

        Receipt receipt;
        receipt.receipt = make_receipt(encrypted_choice);
        receipt.election_id = *election_id;
        receipt.cast_at = clock_();

        auto insert = tx.prepare(
            "INSERT INTO ballots (ballot_token_hash, election_id, encrypted_choice, receipt, cast_at) "
            "VALUES (?1, ?2, ?3, ?4, ?5)");
        insert.bind_blob(1, crypto::token_hash(ballot_token))
              .bind_text(2, receipt.election_id)
              .bind_blob(3, encrypted_choice)
              .bind_text(4, receipt.receipt)
              .bind_int(5, static_cast<int64_t>(receipt.cast_at));
        insert.execute();

        ledger_.append(tx, receipt.election_id, audit::EventType::BallotCast, ACTOR,
                       {{"receipt", receipt.receipt}});

        tx.commit();
        log->info("ballot cast in election {}", receipt.election_id);
        return receipt;
    } catch (const storage::StorageError& e) {
        // Rolled back: the token is unused again
        log->error("casting ballot failed: {}", e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<TallyCursor> BallotStore::read_for_tally(const std::string& election_id) {
    try {
        auto lease = store_.pool(storage::Profile::Tally).acquire();
        auto tx = std::make_unique<storage::Transaction>(*lease, storage::TransactionMode::Deferred);

        // First read pins the snapshot every pass of the cursor will see
        auto status = elections::ElectionRegistry::status_in(*tx, election_id);
        if (!status) {
            return status.failure();
        }
        if (*status != elections::ElectionStatus::Closed) {
            return core::Error::ElectionNotClosed;
        }

        auto options = elections::ElectionRegistry::options_in(*tx, election_id);

        auto stmt = tx->prepare(
            "SELECT ballot_id, election_id, encrypted_choice, cast_at "
            "FROM ballots WHERE election_id = ?1 ORDER BY ballot_id");
        stmt.bind_text(1, election_id);

        return TallyCursor(std::move(lease), std::move(tx), std::move(stmt), std::move(options));
    } catch (const storage::StorageError& e) {
        core::get_logger("ballots")->error("opening tally of {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<std::optional<Receipt>> BallotStore::verify_receipt(const std::string& receipt) const {
    try {
        auto connection = store_.pool(storage::Profile::Casting).acquire();

        auto stmt = connection->prepare(
            "SELECT election_id, cast_at FROM ballots WHERE receipt = ?1");
        stmt.bind_text(1, receipt);

        if (!stmt.step()) {
            return std::optional<Receipt>();
        }
        return std::optional<Receipt>(
            Receipt{receipt, stmt.column_text(0), static_cast<uint64_t>(stmt.column_int(1))});
    } catch (const storage::StorageError& e) {
        core::get_logger("ballots")->error("receipt lookup failed: {}", e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<uint64_t> BallotStore::count(const std::string& election_id) const {
    try {
        auto connection = store_.pool(storage::Profile::Casting).acquire();

        auto stmt = connection->prepare("SELECT COUNT(ballot_id) FROM ballots WHERE election_id = ?1");
        stmt.bind_text(1, election_id);
        stmt.step();
        return static_cast<uint64_t>(stmt.column_int(0));
    } catch (const storage::StorageError& e) {
        core::get_logger("ballots")->error("counting ballots of {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

} // namespace ballots
