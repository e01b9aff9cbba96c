#include "schema.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace storage {

namespace {

// Status/state columns are small integers:
//   elections.status  0 draft, 1 open, 2 closed
//   voters.state      0 invited, 1 authenticated, 2 voted
const char* const SCHEMA_SQL = R"sql(
CREATE TABLE IF NOT EXISTS elections (
    election_id       TEXT PRIMARY KEY,
    title             TEXT NOT NULL,
    status            INTEGER NOT NULL DEFAULT 0 CHECK (status IN (0, 1, 2)),
    public_key        BLOB NOT NULL,
    token_ttl_seconds INTEGER NOT NULL CHECK (token_ttl_seconds > 0),
    created_at        INTEGER NOT NULL,
    opened_at         INTEGER,
    closed_at         INTEGER
);

CREATE TRIGGER IF NOT EXISTS elections_status_forward
BEFORE UPDATE OF status ON elections
WHEN NEW.status < OLD.status
BEGIN
    SELECT RAISE(ABORT, 'election status cannot move backwards');
END;

CREATE TRIGGER IF NOT EXISTS elections_no_delete
BEFORE DELETE ON elections
BEGIN
    SELECT RAISE(ABORT, 'elections cannot be deleted');
END;

-- Choices on the ballot, fixed once the election opens
CREATE TABLE IF NOT EXISTS election_options (
    election_id TEXT NOT NULL REFERENCES elections(election_id),
    position    INTEGER NOT NULL CHECK (position >= 1),
    label       TEXT NOT NULL CHECK (length(label) > 0),
    PRIMARY KEY (election_id, position),
    UNIQUE (election_id, label)
);

CREATE TRIGGER IF NOT EXISTS election_options_draft_only
BEFORE INSERT ON election_options
WHEN (SELECT status FROM elections WHERE election_id = NEW.election_id) <> 0
BEGIN
    SELECT RAISE(ABORT, 'options cannot change once the election is open');
END;

CREATE TRIGGER IF NOT EXISTS election_options_no_update
BEFORE UPDATE ON election_options
BEGIN
    SELECT RAISE(ABORT, 'options cannot change once added');
END;

CREATE TRIGGER IF NOT EXISTS election_options_no_delete
BEFORE DELETE ON election_options
BEGIN
    SELECT RAISE(ABORT, 'options cannot change once added');
END;

CREATE TABLE IF NOT EXISTS voters (
    election_id         TEXT NOT NULL REFERENCES elections(election_id),
    voter_id            TEXT NOT NULL,
    identity_token_hash BLOB NOT NULL UNIQUE,
    state               INTEGER NOT NULL DEFAULT 0 CHECK (state IN (0, 1, 2)),
    has_voted           INTEGER NOT NULL DEFAULT 0 CHECK (has_voted IN (0, 1)),
    issued_at           INTEGER NOT NULL,
    expires_at          INTEGER NOT NULL,
    PRIMARY KEY (election_id, voter_id),
    CHECK ((state = 2) = (has_voted = 1))
);

CREATE TRIGGER IF NOT EXISTS voters_has_voted_monotonic
BEFORE UPDATE OF has_voted ON voters
WHEN OLD.has_voted = 1 AND NEW.has_voted = 0
BEGIN
    SELECT RAISE(ABORT, 'has_voted cannot be reset');
END;

CREATE TRIGGER IF NOT EXISTS voters_state_forward
BEFORE UPDATE OF state ON voters
WHEN NEW.state < OLD.state
BEGIN
    SELECT RAISE(ABORT, 'voter state cannot move backwards');
END;

CREATE TRIGGER IF NOT EXISTS voters_token_frozen
BEFORE UPDATE OF identity_token_hash, issued_at, expires_at ON voters
WHEN OLD.state <> 0
BEGIN
    SELECT RAISE(ABORT, 'identity token of an authenticated voter cannot change');
END;

CREATE TRIGGER IF NOT EXISTS voters_no_delete
BEFORE DELETE ON voters
WHEN OLD.state <> 0
BEGIN
    SELECT RAISE(ABORT, 'authenticated voters cannot be deleted');
END;

CREATE TABLE IF NOT EXISTS ballot_tokens (
    token_hash  BLOB PRIMARY KEY,
    election_id TEXT NOT NULL REFERENCES elections(election_id),
    issued_at   INTEGER NOT NULL,
    expires_at  INTEGER NOT NULL,
    used        INTEGER NOT NULL DEFAULT 0 CHECK (used IN (0, 1)),
    used_at     INTEGER
);

CREATE TRIGGER IF NOT EXISTS ballot_tokens_used_monotonic
BEFORE UPDATE OF used ON ballot_tokens
WHEN OLD.used = 1 AND NEW.used = 0
BEGIN
    SELECT RAISE(ABORT, 'ballot token cannot be reused');
END;

CREATE TRIGGER IF NOT EXISTS ballot_tokens_no_delete
BEFORE DELETE ON ballot_tokens
BEGIN
    SELECT RAISE(ABORT, 'ballot tokens cannot be deleted');
END;

CREATE TABLE IF NOT EXISTS ballots (
    ballot_id         INTEGER PRIMARY KEY,
    ballot_token_hash BLOB NOT NULL UNIQUE REFERENCES ballot_tokens(token_hash),
    election_id       TEXT NOT NULL REFERENCES elections(election_id),
    encrypted_choice  BLOB NOT NULL,
    receipt           TEXT NOT NULL UNIQUE,
    cast_at           INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS ballots_by_election ON ballots(election_id, ballot_id);

CREATE TRIGGER IF NOT EXISTS ballots_no_update
BEFORE UPDATE ON ballots
BEGIN
    SELECT RAISE(ABORT, 'ballots are immutable');
END;

CREATE TRIGGER IF NOT EXISTS ballots_no_delete
BEFORE DELETE ON ballots
BEGIN
    SELECT RAISE(ABORT, 'ballots are immutable');
END;

CREATE TABLE IF NOT EXISTS audit_events (
    election_id  TEXT NOT NULL REFERENCES elections(election_id),
    sequence_no  INTEGER NOT NULL CHECK (sequence_no >= 1),
    event_type   TEXT NOT NULL,
    actor_ref    TEXT NOT NULL,
    payload      BLOB NOT NULL,
    payload_hash BLOB NOT NULL,
    prev_hash    BLOB NOT NULL,
    entry_hash   BLOB NOT NULL,
    recorded_at  INTEGER NOT NULL,
    PRIMARY KEY (election_id, sequence_no)
);

CREATE TRIGGER IF NOT EXISTS audit_events_no_update
BEFORE UPDATE ON audit_events
BEGIN
    SELECT RAISE(ABORT, 'audit events are append-only');
END;

CREATE TRIGGER IF NOT EXISTS audit_events_no_delete
BEFORE DELETE ON audit_events
BEGIN
    SELECT RAISE(ABORT, 'audit events are append-only');
END;

CREATE TABLE IF NOT EXISTS audit_heads (
    election_id TEXT PRIMARY KEY REFERENCES elections(election_id),
    sequence_no INTEGER NOT NULL,
    entry_hash  BLOB NOT NULL
);

CREATE TRIGGER IF NOT EXISTS audit_heads_start_at_one
BEFORE INSERT ON audit_heads
WHEN NEW.sequence_no <> 1
BEGIN
    SELECT RAISE(ABORT, 'audit chain must start at sequence 1');
END;

CREATE TRIGGER IF NOT EXISTS audit_heads_advance_by_one
BEFORE UPDATE ON audit_heads
WHEN NEW.sequence_no <> OLD.sequence_no + 1 OR NEW.election_id <> OLD.election_id
BEGIN
    SELECT RAISE(ABORT, 'audit head must advance by exactly one');
END;

CREATE TRIGGER IF NOT EXISTS audit_heads_no_delete
BEFORE DELETE ON audit_heads
BEGIN
    SELECT RAISE(ABORT, 'audit heads cannot be deleted');
END;
)sql";

// Tables that make up the ballot side of the anonymity boundary and the
// only tables they may reference
const std::set<std::string> BALLOT_SIDE_TABLES = {"ballot_tokens", "ballots"};
const std::set<std::string> BALLOT_SIDE_REFERENCES = {"ballot_tokens", "elections"};

bool names_voter(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("voter") != std::string::npos ||
           lower.find("identity") != std::string::npos;
}

}

const char* profile_to_string(Profile profile) {
    switch (profile) {
        case Profile::Registrar: return "registrar";
        case Profile::Issuance: return "issuance";
        case Profile::Casting: return "casting";
        case Profile::Auditor: return "auditor";
        case Profile::Tally: return "tally";
        default: return "unknown";
    }
}

std::shared_ptr<const Grants> grants_for(Profile profile) {
    constexpr Access R = Access::Read;
    constexpr Access I = Access::Insert;
    constexpr Access U = Access::Update;

    auto grants = std::make_shared<Grants>(profile_to_string(profile));

    switch (profile) {
        case Profile::Registrar:
            grants->allow("elections", R | I | U)
                  .allow("election_options", R | I)
                  .allow("voters", R | I | U);
            break;
        case Profile::Issuance:
            // Insert-only on ballot_tokens: the identity side can mint a
            // ballot token but never read one back or join against it
            grants->allow("elections", R)
                  .allow("voters", R | U)
                  .allow("ballot_tokens", I);
            break;
        case Profile::Casting:
            grants->allow("elections", R)
                  .allow("ballot_tokens", R | U)
                  .allow("ballots", R | I);
            break;
        case Profile::Auditor:
            grants->allow("elections", R);
            break;
        case Profile::Tally:
            grants->allow("elections", R)
                  .allow("election_options", R)
                  .allow("ballots", R);
            return grants;
    }

    // Every writer appends to the audit chain
    grants->allow("audit_events", R | I)
          .allow("audit_heads", R | I | U);
    return grants;
}

void migrate(Connection& connection) {
    connection.exec("PRAGMA journal_mode = WAL");

    Transaction tx(connection, TransactionMode::Immediate);
    connection.exec(SCHEMA_SQL);
    connection.exec("PRAGMA user_version = " + std::to_string(SCHEMA_VERSION));
    tx.commit();
}

std::vector<std::string> verify_ballot_isolation(Connection& connection) {
    std::vector<std::string> violations;

    for (const auto& table : BALLOT_SIDE_TABLES) {
        bool exists = false;

        auto columns = connection.prepare("SELECT name FROM pragma_table_info(?1)");
        columns.bind_text(1, table);
        while (columns.step()) {
            exists = true;
            auto name = columns.column_text(0);
            if (names_voter(name)) {
                violations.push_back(table + "." + name + " names voter data");
            }
        }
        if (!exists) {
            violations.push_back(table + " is missing");
            continue;
        }

        auto keys = connection.prepare(
            "SELECT \"table\", \"from\" FROM pragma_foreign_key_list(?1)");
        keys.bind_text(1, table);
        while (keys.step()) {
            auto target = keys.column_text(0);
            if (BALLOT_SIDE_REFERENCES.count(target) == 0) {
                violations.push_back(table + "." + keys.column_text(1) +
                                     " references " + target);
            }
        }

        auto indexes = connection.prepare(
            "SELECT il.name, ii.name FROM pragma_index_list(?1) AS il, "
            "pragma_index_info(il.name) AS ii");
        indexes.bind_text(1, table);
        while (indexes.step()) {
            auto column = indexes.column_text(1);
            if (names_voter(column) || names_voter(indexes.column_text(0))) {
                violations.push_back("index " + indexes.column_text(0) + " on " +
                                     table + " covers " + column);
            }
        }
    }

    return violations;
}

} // namespace storage
