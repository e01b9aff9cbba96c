#pragma once

#include "ballot_store.h"
#include "../core/result.h"
#include "../crypto/keypair.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ballots {

/**
 * Decrypted result of a closed election
 */
struct TallyResult {
    // One entry per option, in ballot order
    std::vector<std::pair<std::string, uint64_t>> counts;
    uint64_t invalid = 0;        // decrypted to a choice that is not an option
    uint64_t undecryptable = 0;
    uint64_t total = 0;
};

/**
 * Decrypt every ballot behind the cursor with the trustee's key pair and
 * count it against the cursor's options.
 *
 * Choices are checked here rather than at cast time, since the store only
 * ever sees ciphertext. The cursor is rewound first, so a failed count can
 * simply be repeated. Fails with StorageUnavailable if a read fails.
 */
core::Result<TallyResult> count_ballots(TallyCursor& cursor, const crypto::ElectionKeypair& keypair);

} // namespace ballots
