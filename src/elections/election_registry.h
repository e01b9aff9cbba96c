#pragma once

#include "../audit/audit_ledger.h"
#include "../core/clock.h"
#include "../core/result.h"
#include "../crypto/keypair.h"
#include "../storage/store.h"
#include "../vault/token_vault.h"
#include "../voters/voter_state_machine.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace elections {

// Longest identity token lifetime an election may ask for (one year)
constexpr uint64_t MAX_TOKEN_TTL_SECONDS = 366ULL * 24 * 3600;

// An election cannot open with fewer choices than this
constexpr size_t MIN_OPTIONS = 2;

/**
 * Election lifecycle, forward only
 */
enum class ElectionStatus : uint8_t {
    Draft = 0,
    Open = 1,
    Closed = 2
};

const char* election_status_to_string(ElectionStatus status);

struct Election {
    std::string election_id;
    std::string title;
    ElectionStatus status = ElectionStatus::Draft;
    crypto::PublicKey public_key{};
    uint64_t token_ttl_seconds = 0;
    uint64_t created_at = 0;
    std::optional<uint64_t> opened_at;
    std::optional<uint64_t> closed_at;
};

/**
 * A new election together with the trustee's secret key.
 * The secret key is not stored anywhere; this is the only copy.
 */
struct CreatedElection {
    Election election;
    crypto::SecretKey secret_key{};
};

/**
 * Raw identity token for the notification collaborator, handed out once
 */
struct IssuedIdentityToken {
    std::string voter_id;
    std::string token;
    uint64_t expires_at = 0;
};

/**
 * Elections and their voter rolls.
 *
 * Every operation is one transaction on the registrar profile together
 * with its audit entry.
 */
class ElectionRegistry {
public:
    ElectionRegistry(storage::Store& store,
                     vault::TokenVault& vault,
                     voters::VoterStateMachine& voters,
                     audit::AuditLedger& ledger,
                     core::Clock clock);

    /**
     * Create a draft election with a fresh key pair.
     * token_ttl_seconds is the lifetime of its identity tokens.
     * Fails with InvalidArgument on empty fields, a TTL of zero or above
     * MAX_TOKEN_TTL_SECONDS, or an existing id.
     */
    core::Result<CreatedElection> create(const std::string& election_id,
                                         const std::string& title,
                                         uint64_t token_ttl_seconds);

    /**
     * Append choices to a draft election's ballot, all or nothing.
     * Fails with InvalidArgument on an empty list, an empty label or one
     * already on the ballot, and once the election has opened.
     */
    core::Status add_options(const std::string& election_id,
                             const std::vector<std::string>& labels);

    /**
     * Ballot choices in the order they were added
     */
    core::Result<std::vector<std::string>> options(const std::string& election_id) const;

    /**
     * Import voters into a draft or open election, all or nothing.
     * Fails with InvalidArgument on an empty list, an empty or duplicate id,
     * and with ElectionNotOpen once the election is closed.
     */
    core::Result<std::vector<IssuedIdentityToken>> register_voters(
        const std::string& election_id,
        const std::vector<std::string>& voter_ids);

    /**
     * Replace the identity token of a voter that has not authenticated yet.
     * The previous token stops working.
     */
    core::Result<IssuedIdentityToken> reissue_identity_token(const std::string& election_id,
                                                             const std::string& voter_id);

    /**
     * Draft -> Open. Fails with InvalidArgument from any other status or
     * with fewer than MIN_OPTIONS choices. The audit entry carries the
     * final option list.
     */
    core::Status open(const std::string& election_id);

    /**
     * Open -> Closed. Closing a closed election is a no-op;
     * a draft election fails with ElectionNotOpen.
     */
    core::Status close(const std::string& election_id);

    core::Result<Election> get(const std::string& election_id) const;

    /**
     * State of one voter, for operators
     */
    core::Result<voters::VoterRecord> voter(const std::string& election_id,
                                            const std::string& voter_id) const;

    /**
     * Aggregate counts per voter state
     */
    core::Result<voters::Turnout> turnout(const std::string& election_id) const;

    /**
     * Status of an election as seen by an open transaction.
     * Fails with ElectionNotFound. Throws storage::StorageError.
     */
    static core::Result<ElectionStatus> status_in(storage::Transaction& tx,
                                                  const std::string& election_id);

    /**
     * Ballot choices as seen by an open transaction, in position order.
     * Throws storage::StorageError.
     */
    static std::vector<std::string> options_in(storage::Transaction& tx,
                                               const std::string& election_id);

private:
    storage::Store& store_;
    vault::TokenVault& vault_;
    voters::VoterStateMachine& voters_;
    audit::AuditLedger& ledger_;
    core::Clock clock_;
};

} // namespace elections
