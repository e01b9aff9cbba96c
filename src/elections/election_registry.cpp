#include "election_registry.h"
#include "../core/log.h"

#include <algorithm>
#include <set>

namespace elections {

namespace {

const char* const ACTOR = "registrar";

std::optional<Election> load_election(storage::Transaction& tx, const std::string& election_id) {
    auto stmt = tx.prepare(
        "SELECT title, status, public_key, token_ttl_seconds, created_at, opened_at, closed_at "
        "FROM elections WHERE election_id = ?1");
    stmt.bind_text(1, election_id);

    if (!stmt.step()) {
        return std::nullopt;
    }

    Election election;
    election.election_id = election_id;
    election.title = stmt.column_text(0);
    election.status = static_cast<ElectionStatus>(stmt.column_int(1));

    auto key = stmt.column_blob(2);
    if (key.size() == election.public_key.size()) {
        std::copy(key.begin(), key.end(), election.public_key.begin());
    }

    election.token_ttl_seconds = static_cast<uint64_t>(stmt.column_int(3));
    election.created_at = static_cast<uint64_t>(stmt.column_int(4));
    if (!stmt.column_is_null(5)) {
        election.opened_at = static_cast<uint64_t>(stmt.column_int(5));
    }
    if (!stmt.column_is_null(6)) {
        election.closed_at = static_cast<uint64_t>(stmt.column_int(6));
    }
    return election;
}

}

const char* election_status_to_string(ElectionStatus status) {
    switch (status) {
        case ElectionStatus::Draft: return "draft";
        case ElectionStatus::Open: return "open";
        case ElectionStatus::Closed: return "closed";
        default: return "unknown";
    }
}

ElectionRegistry::ElectionRegistry(storage::Store& store,
                                   vault::TokenVault& vault,
                                   voters::VoterStateMachine& voters,
                                   audit::AuditLedger& ledger,
                                   core::Clock clock)
    : store_(store)
    , vault_(vault)
    , voters_(voters)
    , ledger_(ledger)
    , clock_(std::move(clock)) {}

core::Result<CreatedElection> ElectionRegistry::create(const std::string& election_id,
                                                       const std::string& title,
                                                       uint64_t token_ttl_seconds) {
    if (election_id.empty() || title.empty() || token_ttl_seconds == 0 ||
        token_ttl_seconds > MAX_TOKEN_TTL_SECONDS) {
        return core::Error::InvalidArgument;
    }

    auto log = core::get_logger("elections");

    try {
        auto connection = store_.pool(storage::Profile::Registrar).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Immediate);

        if (load_election(tx, election_id)) {
            return core::Error::InvalidArgument;
        }

        auto keypair = crypto::ElectionKeypair::generate();

        CreatedElection created;
        created.election.election_id = election_id;
        created.election.title = title;
        created.election.public_key = keypair.public_key();
        created.election.token_ttl_seconds = token_ttl_seconds;
        created.election.created_at = clock_();
        created.secret_key = keypair.secret_key();

        auto insert = tx.prepare(
            "INSERT INTO elections (election_id, title, status, public_key, "
            "token_ttl_seconds, created_at) VALUES (?1, ?2, 0, ?3, ?4, ?5)");
        insert.bind_text(1, election_id)
              .bind_text(2, title)
              .bind_blob(3, created.election.public_key)
              .bind_int(4, static_cast<int64_t>(token_ttl_seconds))
              .bind_int(5, static_cast<int64_t>(created.election.created_at));
        insert.execute();

        ledger_.append(tx, election_id, audit::EventType::ElectionCreated, ACTOR,
                       {{"title", title},
                        {"public_key", crypto::to_hex(created.election.public_key)}});

        tx.commit();
        log->info("election {} created", election_id);
        return created;
    } catch (const storage::StorageError& e) {
        log->error("creating election {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Status ElectionRegistry::add_options(const std::string& election_id,
                                          const std::vector<std::string>& labels) {
    if (labels.empty()) {
        return core::Error::InvalidArgument;
    }

    auto log = core::get_logger("elections");

    try {
        auto connection = store_.pool(storage::Profile::Registrar).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Immediate);

        auto status = status_in(tx, election_id);
        if (!status) {
            return status.failure();
        }
        if (*status != ElectionStatus::Draft) {
            log->warn("options of election {} are fixed, it is {}", election_id,
                      election_status_to_string(*status));
            return core::Error::InvalidArgument;
        }

        auto existing = options_in(tx, election_id);
        std::set<std::string> seen(existing.begin(), existing.end());

        auto insert = tx.prepare(
            "INSERT INTO election_options (election_id, position, label) VALUES (?1, ?2, ?3)");
        auto position = static_cast<int64_t>(existing.size());
        for (const auto& label : labels) {
            if (label.empty() || !seen.insert(label).second) {
                // Rolls back the labels inserted so far
                return core::Error::InvalidArgument;
            }
            insert.reset();
            insert.bind_text(1, election_id)
                  .bind_int(2, ++position)
                  .bind_text(3, label);
            insert.execute();
        }

        tx.commit();
        log->info("{} options added to election {}", labels.size(), election_id);
        return core::ok_status();
    } catch (const storage::StorageError& e) {
        log->error("adding options to {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<std::vector<std::string>> ElectionRegistry::options(const std::string& election_id) const {
    try {
        auto connection = store_.pool(storage::Profile::Registrar).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Deferred);

        if (!load_election(tx, election_id)) {
            return core::Error::ElectionNotFound;
        }

        auto labels = options_in(tx, election_id);
        tx.commit();
        return labels;
    } catch (const storage::StorageError& e) {
        core::get_logger("elections")->error("reading options of {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<std::vector<IssuedIdentityToken>> ElectionRegistry::register_voters(
    const std::string& election_id,
    const std::vector<std::string>& voter_ids) {
    if (voter_ids.empty()) {
        return core::Error::InvalidArgument;
    }

    auto log = core::get_logger("elections");

    try {
        auto connection = store_.pool(storage::Profile::Registrar).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Immediate);

        auto election = load_election(tx, election_id);
        if (!election) {
            return core::Error::ElectionNotFound;
        }
        if (election->status == ElectionStatus::Closed) {
            return core::Error::ElectionNotOpen;
        }

        std::vector<IssuedIdentityToken> issued;
        issued.reserve(voter_ids.size());

        for (const auto& voter_id : voter_ids) {
            auto minted = vault_.mint_identity_token(election->token_ttl_seconds);

            voters::VoterRecord record;
            record.election_id = election_id;
            record.voter_id = voter_id;
            record.identity_token_hash = minted.hash;
            record.issued_at = minted.issued_at;
            record.expires_at = minted.expires_at;

            auto registered = voters_.register_voter(tx, record);
            if (!registered) {
                // Rolls back the whole import
                return registered.failure();
            }

            issued.push_back({voter_id, std::move(minted.token), minted.expires_at});
        }

        ledger_.append(tx, election_id, audit::EventType::VotersRegistered, ACTOR,
                       {{"count", std::to_string(issued.size())}});

        tx.commit();
        log->info("{} voters registered for election {}", issued.size(), election_id);
        return issued;
    } catch (const storage::StorageError& e) {
        log->error("voter import for {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<IssuedIdentityToken> ElectionRegistry::reissue_identity_token(
    const std::string& election_id,
    const std::string& voter_id) {
    auto log = core::get_logger("elections");

    try {
        auto connection = store_.pool(storage::Profile::Registrar).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Immediate);

        auto election = load_election(tx, election_id);
        if (!election) {
            return core::Error::ElectionNotFound;
        }
        if (election->status == ElectionStatus::Closed) {
            return core::Error::ElectionNotOpen;
        }

        auto rotated = vault_.rotate_identity_token(
            tx, voters::VoterRef{election_id, voter_id}, election->token_ttl_seconds);
        if (!rotated) {
            return rotated.failure();
        }

        // No voter id in the trail
        ledger_.append(tx, election_id, audit::EventType::IdentityTokenReissued, ACTOR);

        tx.commit();
        log->info("identity token reissued in election {}", election_id);
        return IssuedIdentityToken{voter_id, std::move(rotated->token), rotated->expires_at};
    } catch (const storage::StorageError& e) {
        log->error("token reissue in {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Status ElectionRegistry::open(const std::string& election_id) {
    auto log = core::get_logger("elections");

    try {
        auto connection = store_.pool(storage::Profile::Registrar).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Immediate);

        auto status = status_in(tx, election_id);
        if (!status) {
            return status.failure();
        }
        if (*status != ElectionStatus::Draft) {
            return core::Error::InvalidArgument;
        }

        auto labels = options_in(tx, election_id);
        if (labels.size() < MIN_OPTIONS) {
            log->warn("election {} has {} options, needs {}", election_id, labels.size(), MIN_OPTIONS);
            return core::Error::InvalidArgument;
        }

        auto update = tx.prepare(
            "UPDATE elections SET status = 1, opened_at = ?2 WHERE election_id = ?1 AND status = 0");
        update.bind_text(1, election_id).bind_int(2, static_cast<int64_t>(clock_()));
        update.execute();

        // The ballot as voters will see it
        audit::Payload payload{{"option_count", std::to_string(labels.size())}};
        for (size_t i = 0; i < labels.size(); ++i) {
            payload["option." + std::to_string(i + 1)] = labels[i];
        }
        ledger_.append(tx, election_id, audit::EventType::ElectionOpened, ACTOR, payload);

        tx.commit();
        log->info("election {} opened", election_id);
        return core::ok_status();
    } catch (const storage::StorageError& e) {
        log->error("opening election {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Status ElectionRegistry::close(const std::string& election_id) {
    auto log = core::get_logger("elections");

    try {
        auto connection = store_.pool(storage::Profile::Registrar).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Immediate);

        auto status = status_in(tx, election_id);
        if (!status) {
            return status.failure();
        }
        if (*status == ElectionStatus::Closed) {
            return core::ok_status();
        }
        if (*status == ElectionStatus::Draft) {
            return core::Error::ElectionNotOpen;
        }

        auto update = tx.prepare(
            "UPDATE elections SET status = 2, closed_at = ?2 WHERE election_id = ?1 AND status = 1");
        update.bind_text(1, election_id).bind_int(2, static_cast<int64_t>(clock_()));
        update.execute();

        ledger_.append(tx, election_id, audit::EventType::ElectionClosed, ACTOR);

        tx.commit();
        log->info("election {} closed", election_id);
        return core::ok_status();
    } catch (const storage::StorageError& e) {
        log->error("closing election {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<Election> ElectionRegistry::get(const std::string& election_id) const {
    try {
        auto connection = store_.pool(storage::Profile::Registrar).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Deferred);

        auto election = load_election(tx, election_id);
        tx.commit();

        if (!election) {
            return core::Error::ElectionNotFound;
        }
        return *election;
    } catch (const storage::StorageError& e) {
        core::get_logger("elections")->error("reading election {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<voters::VoterRecord> ElectionRegistry::voter(const std::string& election_id,
                                                          const std::string& voter_id) const {
    try {
        auto connection = store_.pool(storage::Profile::Registrar).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Deferred);

        if (!load_election(tx, election_id)) {
            return core::Error::ElectionNotFound;
        }

        auto record = voters_.load(tx, voters::VoterRef{election_id, voter_id});
        tx.commit();

        if (!record) {
            return core::Error::InvalidArgument;
        }
        return *record;
    } catch (const storage::StorageError& e) {
        core::get_logger("elections")->error("reading voter roll of {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<voters::Turnout> ElectionRegistry::turnout(const std::string& election_id) const {
    try {
        auto connection = store_.pool(storage::Profile::Registrar).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Deferred);

        if (!load_election(tx, election_id)) {
            return core::Error::ElectionNotFound;
        }

        auto counts = voters_.turnout(tx, election_id);
        tx.commit();
        return counts;
    } catch (const storage::StorageError& e) {
        core::get_logger("elections")->error("turnout of {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<ElectionStatus> ElectionRegistry::status_in(storage::Transaction& tx,
                                                         const std::string& election_id) {
    auto stmt = tx.prepare("SELECT status FROM elections WHERE election_id = ?1");
    stmt.bind_text(1, election_id);

    if (!stmt.step()) {
        return core::Error::ElectionNotFound;
    }
    return static_cast<ElectionStatus>(stmt.column_int(0));
}

std::vector<std::string> ElectionRegistry::options_in(storage::Transaction& tx,
                                                      const std::string& election_id) {
    auto stmt = tx.prepare(
        "SELECT label FROM election_options WHERE election_id = ?1 ORDER BY position");
    stmt.bind_text(1, election_id);

    std::vector<std::string> labels;
    while (stmt.step()) {
        labels.push_back(stmt.column_text(0));
    }
    return labels;
}

} // namespace elections
