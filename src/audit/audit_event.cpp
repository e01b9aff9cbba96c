#include "audit_event.h"
#include "../core/encoding.h"

namespace audit {

const char* event_type_to_string(EventType type) {
    switch (type) {
        case EventType::ElectionCreated: return "election_created";
        case EventType::VotersRegistered: return "voters_registered";
        case EventType::IdentityTokenReissued: return "identity_token_reissued";
        case EventType::ElectionOpened: return "election_opened";
        case EventType::VoterAuthenticated: return "voter_authenticated";
        case EventType::BallotTokenIssued: return "ballot_token_issued";
        case EventType::BallotCast: return "ballot_cast";
        case EventType::ElectionClosed: return "election_closed";
        default: return "unknown";
    }
}

std::vector<uint8_t> encode_payload(const Payload& payload) {
    core::ByteWriter writer;
    writer.write_u64(payload.size());
    for (const auto& [key, value] : payload) {
        writer.write_string(key);
        writer.write_string(value);
    }
    return writer.take();
}

std::optional<Payload> decode_payload(const std::vector<uint8_t>& data) {
    core::ByteReader reader(data);

    auto count = reader.read_u64();
    if (!count) {
        return std::nullopt;
    }

    Payload payload;
    for (uint64_t i = 0; i < *count; ++i) {
        auto key = reader.read_string();
        auto value = reader.read_string();
        if (!key || !value) {
            return std::nullopt;
        }
        payload.emplace(std::move(*key), std::move(*value));
    }

    if (!reader.at_end()) {
        return std::nullopt;
    }
    return payload;
}

std::vector<uint8_t> AuditEvent::canonical_content() const {
    core::ByteWriter writer;
    writer.write_string(election_id)
          .write_string(event_type)
          .write_string(actor_ref)
          .write_raw(payload_hash)
          .write_u64(recorded_at);
    return writer.take();
}

crypto::Hash AuditEvent::compute_entry_hash() const {
    core::ByteWriter writer;
    writer.write_raw(prev_hash)
          .write_bytes(canonical_content())
          .write_u64(sequence_no);
    return crypto::sha256(writer.data());
}

} // namespace audit
