#pragma once

#include "../audit/audit_ledger.h"
#include "../core/clock.h"
#include "../core/result.h"
#include "../storage/store.h"
#include "../vault/token_vault.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ballots {

/**
 * A cast ballot as handed to the tally.
 * Neither the ballot token nor the receipt leaves the store this way.
 */
struct EncryptedBallot {
    int64_t ballot_id = 0;
    std::string election_id;
    std::vector<uint8_t> encrypted_choice;
    uint64_t cast_at = 0;
};

/**
 * Proof of recording. The receipt value is random per ballot and
 * confirms presence without revealing the choice.
 */
struct Receipt {
    std::string receipt;
    std::string election_id;
    uint64_t cast_at = 0;
};

/**
 * Lazy, finite, restartable reader over one election's ballots.
 *
 * Holds its own connection and read transaction, so every pass (including
 * after restart()) sees the same snapshot, and concurrent writers are never
 * blocked. Not thread-safe.
 */
class TallyCursor {
public:
    TallyCursor(storage::ConnectionPool::Lease lease,
                std::unique_ptr<storage::Transaction> tx,
                storage::Statement stmt,
                std::vector<std::string> options = {});

    TallyCursor(TallyCursor&& other) noexcept = default;
    TallyCursor(const TallyCursor&) = delete;
    TallyCursor& operator=(const TallyCursor&) = delete;

    /**
     * Next ballot in cast order, or nullopt once exhausted.
     * After a read failure every call fails with StorageUnavailable
     * until restart().
     */
    core::Result<std::optional<EncryptedBallot>> next();

    /**
     * Rewind to the first ballot
     */
    void restart();

    /**
     * The election's ballot choices, read in the cursor's snapshot
     */
    [[nodiscard]] const std::vector<std::string>& options() const { return options_; }

private:
    storage::ConnectionPool::Lease lease_;
    std::unique_ptr<storage::Transaction> tx_;
    std::optional<storage::Statement> stmt_;
    std::vector<std::string> options_;
    bool done_ = false;
    bool failed_ = false;
};

/**
 * Encrypted ballots keyed only by ballot token.
 * Thread-safe
 */
class BallotStore {
public:
    BallotStore(storage::Store& store,
                vault::TokenVault& vault,
                audit::AuditLedger& ledger,
                core::Clock clock);

    /**
     * Redeem the ballot token and record the ballot.
     *
     * Redemption, ballot insert and the audit entry commit together; if any
     * step fails the token stays unused, so retrying with the same token
     * yields exactly one ballot.
     * Fails with InvalidToken, AlreadyUsed or Expired for the token,
     * ElectionNotOpen outside the voting window, InvalidArgument for an
     * empty choice.
     */
    core::Result<Receipt> cast(const std::string& ballot_token,
                               std::span<const uint8_t> encrypted_choice);

    /**
     * Open a tally reader. Fails with ElectionNotClosed until the
     * election's stored status is closed.
     */
    core::Result<TallyCursor> read_for_tally(const std::string& election_id);

    /**
     * Look up a receipt. nullopt if no ballot carries it.
     */
    core::Result<std::optional<Receipt>> verify_receipt(const std::string& receipt) const;

    /**
     * Number of ballots cast in an election
     */
    core::Result<uint64_t> count(const std::string& election_id) const;

private:
    storage::Store& store_;
    vault::TokenVault& vault_;
    audit::AuditLedger& ledger_;
    core::Clock clock_;
};

} // namespace ballots
