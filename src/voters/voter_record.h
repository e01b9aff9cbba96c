#pragma once

#include "../crypto/hash.h"

#include <cstdint>
#include <string>

namespace voters {

/**
 * Voter lifecycle. Only moves forward.
 */
enum class VoterState : uint8_t {
    Invited = 0,
    Authenticated = 1,
    Voted = 2
};

/**
 * Convert VoterState to string
 */
const char* voter_state_to_string(VoterState state);

/**
 * Identifies one voter in one election
 */
struct VoterRef {
    std::string election_id;
    std::string voter_id;
};

/**
 * A voter on an election's roll.
 * The identity token itself is never stored, only its hash.
 */
struct VoterRecord {
    std::string election_id;
    std::string voter_id;
    crypto::Hash identity_token_hash{};
    VoterState state = VoterState::Invited;
    bool has_voted = false;
    uint64_t issued_at = 0;
    uint64_t expires_at = 0;
};

/**
 * Aggregate counts per state, never per voter
 */
struct Turnout {
    uint64_t invited = 0;
    uint64_t authenticated = 0;
    uint64_t voted = 0;
};

} // namespace voters
