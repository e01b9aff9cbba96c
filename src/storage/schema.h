#pragma once

#include "database.h"
#include "grants.h"

#include <memory>
#include <string>
#include <vector>

namespace storage {

constexpr int SCHEMA_VERSION = 2;

/**
 * Grant profiles, one per component role
 */
enum class Profile {
    Registrar,  // elections, voter import, identity token rotation
    Issuance,   // identity validation, voter state flip, ballot token insert
    Casting,    // ballot token redemption, ballot insert
    Auditor,    // audit append and verification
    Tally       // ballot reads after close
};

constexpr size_t PROFILE_COUNT = 5;

const char* profile_to_string(Profile profile);

/**
 * Table permissions of a profile. Delete is never granted.
 */
std::shared_ptr<const Grants> grants_for(Profile profile);

/**
 * Create tables, indexes and integrity triggers if missing, switch the
 * database to WAL. Must run on an unrestricted connection.
 */
void migrate(Connection& connection);

/**
 * Inspect the ballot-side tables and report every column, index or foreign
 * key that could link them to voter data. Empty means isolated.
 * Must run on an unrestricted connection.
 */
std::vector<std::string> verify_ballot_isolation(Connection& connection);

} // namespace storage
