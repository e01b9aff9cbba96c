#include <gtest/gtest.h>

#include "audit/audit_ledger.h"
#include "crypto/keypair.h"
#include "test_support.h"

#include <atomic>
#include <thread>

using namespace audit;
using test_support::ManualClock;
using test_support::TempDatabase;

// ============================================================================
// AuditEvent Tests
// ============================================================================

class AuditEventTest : public ::testing::Test {
protected:
    void SetUp() override {
        crypto::init();
    }

    AuditEvent make_event() {
        AuditEvent event;
        event.election_id = "e1";
        event.sequence_no = 1;
        event.event_type = event_type_to_string(EventType::ElectionCreated);
        event.actor_ref = "registrar";
        event.payload = encode_payload({{"title", "Board"}});
        event.payload_hash = crypto::sha256(event.payload);
        event.prev_hash = crypto::ZERO_HASH;
        event.recorded_at = 1000;
        return event;
    }
};

TEST_F(AuditEventTest, EntryHashDependsOnEveryField) {
    auto base = make_event();
    auto hash = base.compute_entry_hash();

    auto changed = base;
    changed.sequence_no = 2;
    EXPECT_NE(changed.compute_entry_hash(), hash);

    changed = base;
    changed.prev_hash[0] = 1;
    EXPECT_NE(changed.compute_entry_hash(), hash);

    changed = base;
    changed.actor_ref = "casting";
    EXPECT_NE(changed.compute_entry_hash(), hash);

    changed = base;
    changed.recorded_at = 1001;
    EXPECT_NE(changed.compute_entry_hash(), hash);

    changed = base;
    changed.payload_hash[5] ^= 0xff;
    EXPECT_NE(changed.compute_entry_hash(), hash);
}

TEST_F(AuditEventTest, FieldBoundariesCannotShift) {
    auto a = make_event();
    a.event_type = "ab";
    a.actor_ref = "c";

    auto b = make_event();
    b.event_type = "a";
    b.actor_ref = "bc";

    EXPECT_NE(a.canonical_content(), b.canonical_content());
}

TEST_F(AuditEventTest, PayloadEncodingIsCanonical) {
    Payload forward;
    forward["a"] = "1";
    forward["b"] = "2";

    Payload backward;
    backward["b"] = "2";
    backward["a"] = "1";

    EXPECT_EQ(encode_payload(forward), encode_payload(backward));

    auto decoded = decode_payload(encode_payload(forward));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, forward);
}

TEST_F(AuditEventTest, DecodeRejectsTruncatedPayload) {
    auto encoded = encode_payload({{"count", "12"}});
    encoded.pop_back();
    EXPECT_FALSE(decode_payload(encoded).has_value());
}

// ============================================================================
// AuditLedger Tests
// ============================================================================

class AuditLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        crypto::init();
        store_ = std::make_unique<storage::Store>(storage::StoreOptions{db_.path()});
        raw_ = db_.raw();
        test_support::insert_election(*raw_, "e1");
        test_support::insert_election(*raw_, "e2");
        ledger_ = std::make_unique<AuditLedger>(*store_, clock_.clock());
    }

    void append_many(const std::string& election_id, int count) {
        for (int i = 0; i < count; ++i) {
            clock_.advance(1);
            auto appended = ledger_->append(election_id, EventType::BallotCast, "casting",
                                            {{"receipt", std::to_string(i)}});
            ASSERT_TRUE(appended.ok());
        }
    }

    // Simulates an operator with file access editing the trail
    void tamper(const std::string& assignment, uint64_t sequence_no) {
        raw_->exec("DROP TRIGGER audit_events_no_update");
        raw_->exec("UPDATE audit_events SET " + assignment +
                   " WHERE election_id = 'e1' AND sequence_no = " + std::to_string(sequence_no));
    }

    void expect_broken_at(uint64_t sequence_no) {
        auto verified = ledger_->verify_chain("e1");
        ASSERT_FALSE(verified.ok());
        EXPECT_EQ(verified.error(), core::Error::ChainBroken);
        EXPECT_EQ(verified.failure().sequence_no, sequence_no);
    }

    TempDatabase db_;
    ManualClock clock_;
    std::unique_ptr<storage::Store> store_;
    std::unique_ptr<storage::Connection> raw_;
    std::unique_ptr<AuditLedger> ledger_;
};

TEST_F(AuditLedgerTest, EmptyChainVerifies) {
    auto verified = ledger_->verify_chain("e1");
    ASSERT_TRUE(verified.ok());
    EXPECT_EQ(verified->entries, 0u);
    EXPECT_EQ(verified->head_hash, crypto::ZERO_HASH);
}

TEST_F(AuditLedgerTest, SequenceStartsAtOneWithGenesisHash) {
    auto first = ledger_->append("e1", EventType::ElectionCreated, "registrar");
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first->sequence_no, 1u);
    EXPECT_EQ(first->prev_hash, crypto::ZERO_HASH);
    EXPECT_EQ(first->entry_hash, first->compute_entry_hash());
}

TEST_F(AuditLedgerTest, EntriesAreChained) {
    append_many("e1", 5);

    auto trail = ledger_->entries("e1");
    ASSERT_TRUE(trail.ok());
    ASSERT_EQ(trail->size(), 5u);

    crypto::Hash prev = crypto::ZERO_HASH;
    for (size_t i = 0; i < trail->size(); ++i) {
        const auto& event = (*trail)[i];
        EXPECT_EQ(event.sequence_no, i + 1);
        EXPECT_EQ(event.prev_hash, prev);
        prev = event.entry_hash;
    }

    auto verified = ledger_->verify_chain("e1");
    ASSERT_TRUE(verified.ok());
    EXPECT_EQ(verified->entries, 5u);
    EXPECT_EQ(verified->head_hash, prev);
}

TEST_F(AuditLedgerTest, ElectionsHaveSeparateChains) {
    append_many("e1", 3);
    append_many("e2", 2);

    auto e2 = ledger_->entries("e2");
    ASSERT_TRUE(e2.ok());
    ASSERT_EQ(e2->size(), 2u);
    EXPECT_EQ((*e2)[0].sequence_no, 1u);
    EXPECT_EQ((*e2)[0].prev_hash, crypto::ZERO_HASH);

    EXPECT_TRUE(ledger_->verify_chain("e1").ok());
    EXPECT_TRUE(ledger_->verify_chain("e2").ok());
}

TEST_F(AuditLedgerTest, UnknownElectionIsRejected) {
    auto appended = ledger_->append("nope", EventType::ElectionOpened, "registrar");
    ASSERT_FALSE(appended.ok());
    EXPECT_EQ(appended.error(), core::Error::ElectionNotFound);

    EXPECT_EQ(ledger_->verify_chain("nope").error(), core::Error::ElectionNotFound);
}

TEST_F(AuditLedgerTest, RolledBackAppendLeavesNoTrace) {
    append_many("e1", 2);
    {
        auto connection = store_->pool(storage::Profile::Auditor).acquire();
        storage::Transaction tx(*connection, storage::TransactionMode::Immediate);
        ledger_->append(tx, "e1", EventType::BallotCast, "casting");
    }

    auto next = ledger_->append("e1", EventType::BallotCast, "casting");
    ASSERT_TRUE(next.ok());
    EXPECT_EQ(next->sequence_no, 3u);
    EXPECT_TRUE(ledger_->verify_chain("e1").ok());
}

TEST_F(AuditLedgerTest, ConcurrentAppendsStayGapFree) {
    constexpr int threads = 8;
    constexpr int per_thread = 10;

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            const std::string election = t % 2 == 0 ? "e1" : "e2";
            for (int i = 0; i < per_thread; ++i) {
                if (!ledger_->append(election, EventType::BallotCast, "casting").ok()) {
                    ++failures;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(failures.load(), 0);

    for (const char* election : {"e1", "e2"}) {
        auto verified = ledger_->verify_chain(election);
        ASSERT_TRUE(verified.ok()) << election;
        EXPECT_EQ(verified->entries, static_cast<uint64_t>(threads / 2 * per_thread));
    }
}

TEST_F(AuditLedgerTest, StorageRejectsEditsAndDeletes) {
    append_many("e1", 2);
    EXPECT_THROW(raw_->exec("UPDATE audit_events SET actor_ref = 'x' WHERE sequence_no = 1"),
                 storage::StorageError);
    EXPECT_THROW(raw_->exec("DELETE FROM audit_events WHERE sequence_no = 2"),
                 storage::StorageError);
    EXPECT_TRUE(ledger_->verify_chain("e1").ok());
}

// Single-field tampering of every stored column must be caught at that entry

TEST_F(AuditLedgerTest, DetectsTamperedEventType) {
    append_many("e1", 5);
    tamper("event_type = 'election_opened'", 3);
    expect_broken_at(3);
}

TEST_F(AuditLedgerTest, DetectsTamperedActor) {
    append_many("e1", 5);
    tamper("actor_ref = 'registrar'", 3);
    expect_broken_at(3);
}

TEST_F(AuditLedgerTest, DetectsTamperedPayload) {
    append_many("e1", 5);
    tamper("payload = x'00'", 3);
    expect_broken_at(3);
}

TEST_F(AuditLedgerTest, DetectsTamperedPayloadHash) {
    append_many("e1", 5);
    tamper("payload_hash = zeroblob(32)", 3);
    expect_broken_at(3);
}

TEST_F(AuditLedgerTest, DetectsTamperedPrevHash) {
    append_many("e1", 5);
    tamper("prev_hash = zeroblob(32)", 3);
    expect_broken_at(3);
}

TEST_F(AuditLedgerTest, DetectsTamperedEntryHash) {
    append_many("e1", 5);
    tamper("entry_hash = zeroblob(32)", 3);
    expect_broken_at(3);
}

TEST_F(AuditLedgerTest, DetectsTamperedTimestamp) {
    append_many("e1", 5);
    tamper("recorded_at = recorded_at + 1", 3);
    expect_broken_at(3);
}

TEST_F(AuditLedgerTest, DetectsTamperedSequence) {
    append_many("e1", 5);
    tamper("sequence_no = 99", 3);
    expect_broken_at(3);
}

TEST_F(AuditLedgerTest, DetectsMovedEntry) {
    append_many("e1", 5);
    tamper("election_id = 'e2'", 3);
    expect_broken_at(3);
}

TEST_F(AuditLedgerTest, DetectsRecomputedEntryHash) {
    append_many("e1", 5);

    // A forger who fixes up entry 3's own hash still breaks the link to 4
    auto trail = ledger_->entries("e1");
    ASSERT_TRUE(trail.ok());
    auto forged = (*trail)[2];
    forged.actor_ref = "forger";
    forged.entry_hash = forged.compute_entry_hash();

    tamper("actor_ref = 'forger', entry_hash = x'" + crypto::to_hex(forged.entry_hash) + "'", 3);
    expect_broken_at(4);
}

TEST_F(AuditLedgerTest, DetectsTruncatedTail) {
    append_many("e1", 5);
    raw_->exec("DROP TRIGGER audit_events_no_delete");
    raw_->exec("DELETE FROM audit_events WHERE election_id = 'e1' AND sequence_no = 5");
    expect_broken_at(5);
}

TEST_F(AuditLedgerTest, DetectsRemovedMiddleEntry) {
    append_many("e1", 5);
    raw_->exec("DROP TRIGGER audit_events_no_delete");
    raw_->exec("DELETE FROM audit_events WHERE election_id = 'e1' AND sequence_no = 2");
    expect_broken_at(2);
}

TEST_F(AuditLedgerTest, ChainBreakReachesOperator) {
    std::string reported_election;
    uint64_t reported_sequence = 0;
    ledger_->set_on_chain_broken([&](const std::string& election_id, uint64_t sequence_no) {
        reported_election = election_id;
        reported_sequence = sequence_no;
    });

    append_many("e1", 4);
    tamper("actor_ref = 'x'", 2);
    expect_broken_at(2);

    EXPECT_EQ(reported_election, "e1");
    EXPECT_EQ(reported_sequence, 2u);
}

TEST_F(AuditLedgerTest, VerificationNeverRepairs) {
    append_many("e1", 3);
    tamper("actor_ref = 'x'", 2);
    expect_broken_at(2);
    expect_broken_at(2);

    auto trail = ledger_->entries("e1");
    ASSERT_TRUE(trail.ok());
    EXPECT_EQ((*trail)[1].actor_ref, "x");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
