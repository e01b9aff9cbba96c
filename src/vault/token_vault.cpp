#include "token_vault.h"
#include "../core/log.h"

namespace vault {

TokenVault::TokenVault(storage::Store& store, core::Clock clock)
    : store_(store), clock_(std::move(clock)) {}

IdentityToken TokenVault::mint_identity_token(uint64_t ttl_seconds) const {
    return identity_.mint(clock_(), ttl_seconds);
}

core::Result<voters::VoterRef> TokenVault::lookup_identity(storage::Transaction& tx,
                                                           const std::string& token) const {
    auto match = identity_.lookup(tx, token);
    if (!match) {
        return match.failure();
    }
    return match->voter;
}

core::Result<voters::VoterRef> TokenVault::validate_identity(storage::Transaction& tx,
                                                             const std::string& token) const {
    auto match = identity_.lookup(tx, token);
    if (!match) {
        return match.failure();
    }
    if (match->consumed) {
        return core::Error::AlreadyUsed;
    }
    if (clock_() > match->expires_at) {
        return core::Error::Expired;
    }
    return match->voter;
}

core::Result<voters::VoterRef> TokenVault::validate_identity(const std::string& token) const {
    try {
        auto connection = store_.pool(storage::Profile::Issuance).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Deferred);
        auto result = validate_identity(tx, token);
        tx.commit();
        return result;
    } catch (const storage::StorageError& e) {
        core::get_logger("vault")->error("identity validation failed: {}", e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<IdentityToken> TokenVault::rotate_identity_token(storage::Transaction& tx,
                                                              const voters::VoterRef& voter,
                                                              uint64_t ttl_seconds) const {
    auto replacement = identity_.mint(clock_(), ttl_seconds);
    if (!identity_.rotate(tx, voter, replacement)) {
        return core::Error::InvalidArgument;
    }
    return replacement;
}

BallotToken TokenVault::issue_ballot_token(storage::Transaction& tx,
                                           const std::string& election_id,
                                           uint64_t ttl_seconds) const {
    auto token = ballot_.issue(tx, election_id, clock_(), ttl_seconds);
    core::get_logger("vault")->debug("ballot token issued for election {}", election_id);
    return token;
}

core::Result<std::string> TokenVault::redeem_ballot_token(storage::Transaction& tx,
                                                          const std::string& token) const {
    return ballot_.redeem(tx, token, clock_());
}

core::Status TokenVault::redeem_ballot_token(const std::string& token) const {
    try {
        auto connection = store_.pool(storage::Profile::Casting).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Immediate);

        auto redeemed = redeem_ballot_token(tx, token);
        if (!redeemed) {
            core::get_logger("vault")->info("ballot token rejected: {}",
                                            core::error_to_string(redeemed.error()));
            return redeemed.failure();
        }

        tx.commit();
        return core::ok_status();
    } catch (const storage::StorageError& e) {
        core::get_logger("vault")->error("ballot token redemption failed: {}", e.what());
        return core::Error::StorageUnavailable;
    }
}

} // namespace vault
