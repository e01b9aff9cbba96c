#include <gtest/gtest.h>

#include "crypto/keypair.h"
#include "service/voting_service.h"
#include "test_support.h"

#include <limits>
#include <set>

using namespace elections;
using test_support::ManualClock;
using test_support::TempDatabase;

class ElectionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        crypto::init();
        service::Config config;
        config.database_path = db_.path();
        service_ = std::make_unique<service::VotingService>(config, clock_.clock());
        raw_ = db_.raw();
    }

    ElectionRegistry& registry() { return service_->registry(); }

    std::vector<std::string> event_types(const std::string& election_id) {
        std::vector<std::string> types;
        auto trail = service_->ledger().entries(election_id);
        EXPECT_TRUE(trail.ok());
        if (trail) {
            for (const auto& event : *trail) {
                types.push_back(event.event_type);
            }
        }
        return types;
    }

    TempDatabase db_;
    ManualClock clock_;
    std::unique_ptr<service::VotingService> service_;
    std::unique_ptr<storage::Connection> raw_;
};

TEST_F(ElectionRegistryTest, CreateStoresPublicKeyOnly) {
    auto created = registry().create("e1", "Board election", 3600);
    ASSERT_TRUE(created.ok());

    auto restored = crypto::ElectionKeypair::from_bytes(created->secret_key);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->public_key(), created->election.public_key);

    auto election = registry().get("e1");
    ASSERT_TRUE(election.ok());
    EXPECT_EQ(election->title, "Board election");
    EXPECT_EQ(election->status, ElectionStatus::Draft);
    EXPECT_EQ(election->public_key, created->election.public_key);
    EXPECT_EQ(election->token_ttl_seconds, 3600u);
    EXPECT_FALSE(election->opened_at.has_value());

    auto hex = crypto::to_hex(created->secret_key);
    EXPECT_EQ(test_support::count_rows(*raw_,
        "SELECT COUNT(*) FROM elections WHERE hex(public_key) = upper('" + hex + "')"), 0);
}

TEST_F(ElectionRegistryTest, CreateRejectsBadInput) {
    EXPECT_EQ(registry().create("", "t", 60).error(), core::Error::InvalidArgument);
    EXPECT_EQ(registry().create("e1", "", 60).error(), core::Error::InvalidArgument);
    EXPECT_EQ(registry().create("e1", "t", 0).error(), core::Error::InvalidArgument);
    EXPECT_EQ(test_support::count_rows(*raw_, "SELECT COUNT(*) FROM elections"), 0);

    ASSERT_TRUE(registry().create("e1", "t", 60).ok());
    EXPECT_EQ(registry().create("e1", "again", 60).error(), core::Error::InvalidArgument);
}

TEST_F(ElectionRegistryTest, TokenLifetimeIsBounded) {
    EXPECT_EQ(registry().create("e1", "t", MAX_TOKEN_TTL_SECONDS + 1).error(),
              core::Error::InvalidArgument);
    EXPECT_EQ(registry().create("e2", "t", uint64_t{1} << 63).error(), core::Error::InvalidArgument);
    EXPECT_EQ(registry().create("e3", "t", std::numeric_limits<uint64_t>::max()).error(),
              core::Error::InvalidArgument);
    EXPECT_EQ(test_support::count_rows(*raw_, "SELECT COUNT(*) FROM elections"), 0);

    auto longest = registry().create("e4", "t", MAX_TOKEN_TTL_SECONDS);
    ASSERT_TRUE(longest.ok());
    auto issued = registry().register_voters("e4", {"v1"});
    ASSERT_TRUE(issued.ok());
    EXPECT_EQ((*issued)[0].expires_at, clock_.now() + MAX_TOKEN_TTL_SECONDS);
}

TEST_F(ElectionRegistryTest, LifecycleMovesForward) {
    ASSERT_TRUE(registry().create("e1", "t", 60).ok());

    EXPECT_EQ(registry().close("e1").error(), core::Error::ElectionNotOpen);

    // Not without a ballot to vote on
    EXPECT_EQ(registry().open("e1").error(), core::Error::InvalidArgument);
    ASSERT_TRUE(registry().add_options("e1", {"yes"}).ok());
    EXPECT_EQ(registry().open("e1").error(), core::Error::InvalidArgument);
    ASSERT_TRUE(registry().add_options("e1", {"no"}).ok());

    clock_.advance(10);
    ASSERT_TRUE(registry().open("e1").ok());
    EXPECT_EQ(registry().open("e1").error(), core::Error::InvalidArgument);

    clock_.advance(10);
    ASSERT_TRUE(registry().close("e1").ok());
    EXPECT_TRUE(registry().close("e1").ok());
    EXPECT_EQ(registry().open("e1").error(), core::Error::InvalidArgument);

    auto election = registry().get("e1");
    ASSERT_TRUE(election.ok());
    EXPECT_EQ(election->status, ElectionStatus::Closed);
    EXPECT_EQ(*election->opened_at, clock_.now() - 10);
    EXPECT_EQ(*election->closed_at, clock_.now());
}

TEST_F(ElectionRegistryTest, UnknownElection) {
    EXPECT_EQ(registry().get("nope").error(), core::Error::ElectionNotFound);
    EXPECT_EQ(registry().open("nope").error(), core::Error::ElectionNotFound);
    EXPECT_EQ(registry().close("nope").error(), core::Error::ElectionNotFound);
    EXPECT_EQ(registry().register_voters("nope", {"v1"}).error(), core::Error::ElectionNotFound);
    EXPECT_EQ(registry().turnout("nope").error(), core::Error::ElectionNotFound);
}

TEST_F(ElectionRegistryTest, RegisterVotersIssuesDistinctTokens) {
    ASSERT_TRUE(registry().create("e1", "t", 3600).ok());

    auto issued = registry().register_voters("e1", {"v1", "v2", "v3"});
    ASSERT_TRUE(issued.ok());
    ASSERT_EQ(issued->size(), 3u);

    std::set<std::string> tokens;
    for (const auto& token : *issued) {
        EXPECT_TRUE(tokens.insert(token.token).second);
        EXPECT_EQ(token.expires_at, clock_.now() + 3600);
    }

    auto voter = registry().voter("e1", "v2");
    ASSERT_TRUE(voter.ok());
    EXPECT_EQ(voter->state, voters::VoterState::Invited);
    EXPECT_FALSE(voter->has_voted);

    auto turnout = registry().turnout("e1");
    ASSERT_TRUE(turnout.ok());
    EXPECT_EQ(turnout->invited, 3u);
}

TEST_F(ElectionRegistryTest, ImportIsAllOrNothing) {
    ASSERT_TRUE(registry().create("e1", "t", 3600).ok());

    auto issued = registry().register_voters("e1", {"v1", "v2", "v1"});
    ASSERT_FALSE(issued.ok());
    EXPECT_EQ(issued.error(), core::Error::InvalidArgument);

    EXPECT_EQ(test_support::count_rows(*raw_, "SELECT COUNT(*) FROM voters"), 0);
    EXPECT_EQ(event_types("e1"), std::vector<std::string>{"election_created"});

    EXPECT_EQ(registry().register_voters("e1", {}).error(), core::Error::InvalidArgument);
    EXPECT_EQ(registry().register_voters("e1", {""}).error(), core::Error::InvalidArgument);
}

TEST_F(ElectionRegistryTest, ClosedElectionTakesNoVoters) {
    ASSERT_TRUE(registry().create("e1", "t", 3600).ok());
    ASSERT_TRUE(registry().add_options("e1", {"yes", "no"}).ok());
    ASSERT_TRUE(registry().open("e1").ok());
    ASSERT_TRUE(registry().register_voters("e1", {"late"}).ok());
    ASSERT_TRUE(registry().close("e1").ok());

    EXPECT_EQ(registry().register_voters("e1", {"later"}).error(), core::Error::ElectionNotOpen);
}

TEST_F(ElectionRegistryTest, ReissueInvalidatesOldToken) {
    ASSERT_TRUE(registry().create("e1", "t", 3600).ok());
    auto issued = registry().register_voters("e1", {"v1"});
    ASSERT_TRUE(issued.ok());
    auto old_token = (*issued)[0].token;

    auto reissued = registry().reissue_identity_token("e1", "v1");
    ASSERT_TRUE(reissued.ok());
    EXPECT_EQ(reissued->voter_id, "v1");
    EXPECT_NE(reissued->token, old_token);

    EXPECT_EQ(service_->vault().validate_identity(old_token).error(), core::Error::InvalidToken);
    EXPECT_TRUE(service_->vault().validate_identity(reissued->token).ok());

    EXPECT_EQ(registry().reissue_identity_token("e1", "ghost").error(), core::Error::InvalidArgument);
}

TEST_F(ElectionRegistryTest, TransitionsAreAudited) {
    ASSERT_TRUE(registry().create("e1", "t", 3600).ok());
    ASSERT_TRUE(registry().register_voters("e1", {"alice", "bob"}).ok());
    ASSERT_TRUE(registry().reissue_identity_token("e1", "alice").ok());
    ASSERT_TRUE(registry().add_options("e1", {"yes", "no"}).ok());
    ASSERT_TRUE(registry().open("e1").ok());
    ASSERT_TRUE(registry().close("e1").ok());

    EXPECT_EQ(event_types("e1"), (std::vector<std::string>{
        "election_created", "voters_registered", "identity_token_reissued",
        "election_opened", "election_closed"}));

    auto trail = service_->ledger().entries("e1");
    ASSERT_TRUE(trail.ok());
    for (const auto& event : *trail) {
        auto payload = audit::decode_payload(event.payload);
        ASSERT_TRUE(payload.has_value());
        for (const auto& [key, value] : *payload) {
            EXPECT_EQ(value.find("alice"), std::string::npos) << key;
            EXPECT_EQ(value.find("bob"), std::string::npos) << key;
        }
        EXPECT_EQ(event.actor_ref, "registrar");
    }

    EXPECT_TRUE(service_->audit_verify("e1").ok());
}

// ============================================================================
// Ballot Option Tests
// ============================================================================

TEST_F(ElectionRegistryTest, OptionsKeepTheirOrder) {
    ASSERT_TRUE(registry().create("e1", "t", 3600).ok());
    ASSERT_TRUE(registry().add_options("e1", {"Carol", "Alice"}).ok());
    ASSERT_TRUE(registry().add_options("e1", {"Bob"}).ok());

    auto options = registry().options("e1");
    ASSERT_TRUE(options.ok());
    EXPECT_EQ(*options, (std::vector<std::string>{"Carol", "Alice", "Bob"}));

    EXPECT_EQ(registry().options("nope").error(), core::Error::ElectionNotFound);
    EXPECT_EQ(registry().add_options("nope", {"x"}).error(), core::Error::ElectionNotFound);
}

TEST_F(ElectionRegistryTest, BadOptionsAddNothing) {
    ASSERT_TRUE(registry().create("e1", "t", 3600).ok());
    ASSERT_TRUE(registry().add_options("e1", {"A"}).ok());

    EXPECT_EQ(registry().add_options("e1", {}).error(), core::Error::InvalidArgument);
    EXPECT_EQ(registry().add_options("e1", {"B", ""}).error(), core::Error::InvalidArgument);
    EXPECT_EQ(registry().add_options("e1", {"B", "B"}).error(), core::Error::InvalidArgument);
    EXPECT_EQ(registry().add_options("e1", {"C", "A"}).error(), core::Error::InvalidArgument);

    EXPECT_EQ(*registry().options("e1"), std::vector<std::string>{"A"});
}

TEST_F(ElectionRegistryTest, OptionsAreFixedOnceOpen) {
    ASSERT_TRUE(registry().create("e1", "t", 3600).ok());
    ASSERT_TRUE(registry().add_options("e1", {"A", "B"}).ok());
    ASSERT_TRUE(registry().open("e1").ok());

    EXPECT_EQ(registry().add_options("e1", {"C"}).error(), core::Error::InvalidArgument);
    ASSERT_TRUE(registry().close("e1").ok());
    EXPECT_EQ(registry().add_options("e1", {"C"}).error(), core::Error::InvalidArgument);

    EXPECT_EQ(*registry().options("e1"), (std::vector<std::string>{"A", "B"}));
}

TEST_F(ElectionRegistryTest, OpeningRecordsTheBallot) {
    ASSERT_TRUE(registry().create("e1", "t", 3600).ok());
    ASSERT_TRUE(registry().add_options("e1", {"Carol", "Alice"}).ok());
    ASSERT_TRUE(registry().open("e1").ok());

    auto trail = service_->ledger().entries("e1");
    ASSERT_TRUE(trail.ok());
    ASSERT_EQ(trail->size(), 2u);
    EXPECT_EQ((*trail)[1].event_type, "election_opened");

    auto payload = audit::decode_payload((*trail)[1].payload);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, (audit::Payload{
        {"option_count", "2"}, {"option.1", "Carol"}, {"option.2", "Alice"}}));
    EXPECT_TRUE(service_->audit_verify("e1").ok());
}

TEST(ElectionStatusTest, StatusNames) {
    EXPECT_STREQ(election_status_to_string(ElectionStatus::Draft), "draft");
    EXPECT_STREQ(election_status_to_string(ElectionStatus::Open), "open");
    EXPECT_STREQ(election_status_to_string(ElectionStatus::Closed), "closed");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
