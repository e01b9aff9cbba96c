#pragma once

#include "../crypto/hash.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace audit {

/**
 * Security-relevant state transitions
 */
enum class EventType {
    ElectionCreated,
    VotersRegistered,
    IdentityTokenReissued,
    ElectionOpened,
    VoterAuthenticated,
    BallotTokenIssued,
    BallotCast,
    ElectionClosed
};

/**
 * Convert EventType to its stored name
 */
const char* event_type_to_string(EventType type);

/**
 * Event details. Keys are sorted, so the encoding is canonical.
 * Never put voter identifiers or token values in here.
 */
using Payload = std::map<std::string, std::string>;

std::vector<uint8_t> encode_payload(const Payload& payload);
std::optional<Payload> decode_payload(const std::vector<uint8_t>& data);

/**
 * One entry of an election's hash chain
 */
struct AuditEvent {
    std::string election_id;
    uint64_t sequence_no = 0;
    std::string event_type;
    std::string actor_ref;
    std::vector<uint8_t> payload;   // encode_payload() output
    crypto::Hash payload_hash{};
    crypto::Hash prev_hash{};
    crypto::Hash entry_hash{};
    uint64_t recorded_at = 0;

    /**
     * Canonical encoding of the entry content covered by entry_hash:
     * election_id, event_type, actor_ref, payload_hash, recorded_at
     */
    [[nodiscard]] std::vector<uint8_t> canonical_content() const;

    /**
     * H(prev_hash || canonical_content() || sequence_no)
     * Depends only on this entry's content and the previous entry hash.
     */
    [[nodiscard]] crypto::Hash compute_entry_hash() const;
};

} // namespace audit
