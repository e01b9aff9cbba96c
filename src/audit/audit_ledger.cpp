#include "audit_ledger.h"
#include "../core/log.h"

#include <algorithm>

namespace audit {

namespace {

const char* const SELECT_EVENTS =
    "SELECT sequence_no, event_type, actor_ref, payload, payload_hash, "
    "prev_hash, entry_hash, recorded_at "
    "FROM audit_events WHERE election_id = ?1 ORDER BY sequence_no";

AuditEvent read_event(const storage::Statement& stmt, const std::string& election_id) {
    AuditEvent event;
    event.election_id = election_id;
    event.sequence_no = static_cast<uint64_t>(stmt.column_int(0));
    event.event_type = stmt.column_text(1);
    event.actor_ref = stmt.column_text(2);
    event.payload = stmt.column_blob(3);
    // A hash column of the wrong size stays all-zero and fails verification
    crypto::to_hash(stmt.column_blob(4), event.payload_hash);
    crypto::to_hash(stmt.column_blob(5), event.prev_hash);
    crypto::to_hash(stmt.column_blob(6), event.entry_hash);
    event.recorded_at = static_cast<uint64_t>(stmt.column_int(7));
    return event;
}

bool election_exists(storage::Transaction& tx, const std::string& election_id) {
    auto stmt = tx.prepare("SELECT 1 FROM elections WHERE election_id = ?1");
    stmt.bind_text(1, election_id);
    return stmt.step();
}

}

AuditLedger::AuditLedger(storage::Store& store, core::Clock clock)
    : store_(store), clock_(std::move(clock)) {}

AuditEvent AuditLedger::append(storage::Transaction& tx,
                               const std::string& election_id,
                               EventType type,
                               const std::string& actor_ref,
                               const Payload& payload) {
    AuditEvent event;
    event.election_id = election_id;
    event.event_type = event_type_to_string(type);
    event.actor_ref = actor_ref;
    event.payload = encode_payload(payload);
    event.payload_hash = crypto::sha256(event.payload);
    event.recorded_at = clock_();

    auto head = tx.prepare(
        "SELECT sequence_no, entry_hash FROM audit_heads WHERE election_id = ?1");
    head.bind_text(1, election_id);

    bool has_head = head.step();
    if (has_head) {
        event.sequence_no = static_cast<uint64_t>(head.column_int(0)) + 1;
        if (!crypto::to_hash(head.column_blob(1), event.prev_hash)) {
            throw storage::StorageError("audit head of " + election_id + " is malformed", 0);
        }
    } else {
        event.sequence_no = 1;
        event.prev_hash = crypto::ZERO_HASH;
    }

    event.entry_hash = event.compute_entry_hash();

    auto insert = tx.prepare(
        "INSERT INTO audit_events (election_id, sequence_no, event_type, actor_ref, "
        "payload, payload_hash, prev_hash, entry_hash, recorded_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)");
    insert.bind_text(1, event.election_id)
          .bind_int(2, static_cast<int64_t>(event.sequence_no))
          .bind_text(3, event.event_type)
          .bind_text(4, event.actor_ref)
          .bind_blob(5, event.payload)
          .bind_blob(6, event.payload_hash)
          .bind_blob(7, event.prev_hash)
          .bind_blob(8, event.entry_hash)
          .bind_int(9, static_cast<int64_t>(event.recorded_at));
    insert.execute();

    auto advance = tx.prepare(has_head
        ? "UPDATE audit_heads SET sequence_no = ?2, entry_hash = ?3 WHERE election_id = ?1"
        : "INSERT INTO audit_heads (election_id, sequence_no, entry_hash) VALUES (?1, ?2, ?3)");
    advance.bind_text(1, election_id)
           .bind_int(2, static_cast<int64_t>(event.sequence_no))
           .bind_blob(3, event.entry_hash);
    advance.execute();

    return event;
}

core::Result<AuditEvent> AuditLedger::append(const std::string& election_id,
                                             EventType type,
                                             const std::string& actor_ref,
                                             const Payload& payload) {
    try {
        auto connection = store_.pool(storage::Profile::Auditor).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Immediate);

        if (!election_exists(tx, election_id)) {
            return core::Error::ElectionNotFound;
        }

        auto event = append(tx, election_id, type, actor_ref, payload);
        tx.commit();
        return event;
    } catch (const storage::StorageError& e) {
        core::get_logger("audit")->error("append to {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

core::Result<ChainReport> AuditLedger::verify_chain(const std::string& election_id) const {
    ChainReport report;
    uint64_t broken_at = 0;

    try {
        auto connection = store_.pool(storage::Profile::Auditor).acquire();
        // One read snapshot: concurrent appends are either fully visible or not at all
        storage::Transaction tx(*connection, storage::TransactionMode::Deferred);

        if (!election_exists(tx, election_id)) {
            return core::Error::ElectionNotFound;
        }

        auto stmt = tx.prepare(SELECT_EVENTS);
        stmt.bind_text(1, election_id);

        uint64_t expected = 1;
        crypto::Hash prev = crypto::ZERO_HASH;

        while (stmt.step()) {
            auto event = read_event(stmt, election_id);

            if (event.sequence_no != expected ||
                crypto::sha256(event.payload) != event.payload_hash ||
                event.prev_hash != prev ||
                event.compute_entry_hash() != event.entry_hash) {
                broken_at = expected;
                break;
            }

            prev = event.entry_hash;
            ++expected;
        }

        if (broken_at == 0) {
            uint64_t length = expected - 1;

            // The head catches entries removed from the end of the chain
            auto head = tx.prepare(
                "SELECT sequence_no, entry_hash FROM audit_heads WHERE election_id = ?1");
            head.bind_text(1, election_id);

            if (head.step()) {
                auto head_sequence = static_cast<uint64_t>(head.column_int(0));
                crypto::Hash head_hash{};
                crypto::to_hash(head.column_blob(1), head_hash);

                if (head_sequence != length) {
                    broken_at = std::min(head_sequence, length) + 1;
                } else if (head_hash != prev) {
                    broken_at = length;
                }
            } else if (length > 0) {
                broken_at = 1;
            }

            report.entries = length;
            report.head_hash = prev;
        }

        tx.commit();
    } catch (const storage::StorageError& e) {
        core::get_logger("audit")->error("verify {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }

    if (broken_at != 0) {
        return report_broken(election_id, broken_at);
    }
    return report;
}

core::Result<std::vector<AuditEvent>> AuditLedger::entries(const std::string& election_id) const {
    try {
        auto connection = store_.pool(storage::Profile::Auditor).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Deferred);

        if (!election_exists(tx, election_id)) {
            return core::Error::ElectionNotFound;
        }

        std::vector<AuditEvent> events;
        auto stmt = tx.prepare(SELECT_EVENTS);
        stmt.bind_text(1, election_id);
        while (stmt.step()) {
            events.push_back(read_event(stmt, election_id));
        }

        tx.commit();
        return events;
    } catch (const storage::StorageError& e) {
        core::get_logger("audit")->error("reading trail of {} failed: {}", election_id, e.what());
        return core::Error::StorageUnavailable;
    }
}

void AuditLedger::set_on_chain_broken(ChainBrokenCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_chain_broken_ = std::move(callback);
}

core::Result<ChainReport> AuditLedger::report_broken(const std::string& election_id,
                                                     uint64_t sequence_no) const {
    core::get_logger("audit")->error(
        "hash chain of election {} broken at sequence {}", election_id, sequence_no);

    ChainBrokenCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_chain_broken_;
    }
    if (callback) {
        callback(election_id, sequence_no);
    }

    return core::Failure{core::Error::ChainBroken, sequence_no};
}

} // namespace audit
