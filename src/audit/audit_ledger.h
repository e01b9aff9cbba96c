#pragma once

#include "audit_event.h"
#include "../core/clock.h"
#include "../core/result.h"
#include "../storage/store.h"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace audit {

/**
 * Outcome of a successful chain verification
 */
struct ChainReport {
    uint64_t entries = 0;
    crypto::Hash head_hash{};   // ZERO_HASH for an empty chain
};

/**
 * Operator channel for chain breaks: election id, first bad sequence number
 */
using ChainBrokenCallback = std::function<void(const std::string&, uint64_t)>;

/**
 * Append-only, hash-chained record of security-relevant events,
 * one chain per election.
 *
 * The chain head (last sequence number and entry hash) is a row in
 * audit_heads that is read and advanced inside the appending transaction,
 * so appends to one election are totally ordered while appends to
 * different elections touch different rows.
 * Thread-safe
 */
class AuditLedger {
public:
    AuditLedger(storage::Store& store, core::Clock clock);

    /**
     * Append as part of a caller's unit of work. The event becomes durable
     * only when the caller commits, and disappears if it rolls back.
     * Throws storage::StorageError.
     */
    AuditEvent append(storage::Transaction& tx,
                      const std::string& election_id,
                      EventType type,
                      const std::string& actor_ref,
                      const Payload& payload = {});

    /**
     * Append in a transaction of its own
     */
    core::Result<AuditEvent> append(const std::string& election_id,
                                    EventType type,
                                    const std::string& actor_ref,
                                    const Payload& payload = {});

    /**
     * Recompute every entry hash from genesis on a read snapshot.
     * Fails with ChainBroken carrying the first sequence number that does
     * not verify; that failure is also logged and sent to the operator
     * callback. Never repairs anything.
     */
    core::Result<ChainReport> verify_chain(const std::string& election_id) const;

    /**
     * The election's trail in sequence order, for external auditors
     */
    core::Result<std::vector<AuditEvent>> entries(const std::string& election_id) const;

    /**
     * Set callback for chain breaks
     */
    void set_on_chain_broken(ChainBrokenCallback callback);

private:
    core::Result<ChainReport> report_broken(const std::string& election_id,
                                            uint64_t sequence_no) const;

    storage::Store& store_;
    core::Clock clock_;

    mutable std::mutex callback_mutex_;
    ChainBrokenCallback on_chain_broken_;
};

} // namespace audit
