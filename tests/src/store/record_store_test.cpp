#include <gtest/gtest.h>
#include <tally/schema/key/record_keys.hpp>
#include <tally/store/record_store.hpp>
#include <tally/testing/indexer_fixture.hpp>

#include <string>

namespace {

tally::schema::proposal_record_t make_proposal(
    const tally::schema::proposal_index_t id,
    const tally::schema::height_t new_height,
    const std::string& proposer_address = "AA11") {
  auto proposal = tally::schema::proposal_record_t{};
  proposal.id = id;
  proposal.proposer_index = 1;
  proposal.proposer_address = proposer_address;
  proposal.data = tally::schema::make_bytes(std::string_view{"text"});
  proposal.new_height = new_height;
  return proposal;
}

tally::schema::discussion_record_t make_discussion(
    const tally::schema::proposal_index_t proposal,
    const tally::schema::height_t height,
    const uint32_t ordinal) {
  auto discussion = tally::schema::discussion_record_t{};
  discussion.proposal = proposal;
  discussion.speaker_index = 2;
  discussion.speaker_address = "CC33";
  discussion.data = tally::schema::make_bytes(std::string_view{"comment"});
  discussion.height = height;
  discussion.ordinal = ordinal;
  return discussion;
}

tally::schema::proposal_vote_record_t make_proposal_vote(
    const tally::schema::proposal_index_t proposal,
    const tally::schema::validator_index_t voter,
    const std::string& voter_address,
    const tally::schema::height_t height) {
  auto vote = tally::schema::proposal_vote_record_t{};
  vote.proposal = proposal;
  vote.voter_index = voter;
  vote.voter_address = voter_address;
  vote.height = height;
  vote.vote = 2;
  return vote;
}

}  // namespace

TEST(record_store, migrate_stamps_schema_version) {
  auto fixture = tally::testing::store_fixture{"tally_store_migrate"};
  auto version = fixture.store().schema_version();
  ASSERT_TRUE(version.has_value());
  EXPECT_EQ(*version, tally::store::record_store::kSchemaVersion);
  EXPECT_TRUE(fixture.store().migrate());
}

TEST(record_store, migrate_refuses_newer_schema) {
  auto fixture = tally::testing::store_fixture{"tally_store_newer"};
  auto version_key =
      tally::schema::make_bytes_view(tally::schema::key::kSchemaVersionKey);
  fixture.storage().put(
      fixture.encoder(), version_key,
      static_cast<uint32_t>(tally::store::record_store::kSchemaVersion + 1));
  EXPECT_FALSE(fixture.store().migrate());
}

TEST(record_store, index_progress_is_monotonic) {
  auto fixture = tally::testing::store_fixture{"tally_store_progress"};
  auto& store = fixture.store();
  EXPECT_EQ(store.load_index_progress(), 0u);
  EXPECT_TRUE(store.save_index_progress(5));
  EXPECT_TRUE(store.save_index_progress(5));
  EXPECT_FALSE(store.save_index_progress(4));
  EXPECT_EQ(store.load_index_progress(), 5u);
}

TEST(record_store, proposal_is_found_by_creation_and_settlement_height) {
  auto fixture = tally::testing::store_fixture{"tally_store_proposal"};
  auto& store = fixture.store();
  store.save_proposal(make_proposal(7, 10));

  auto created = store.find_proposal_by_new_height(10);
  ASSERT_TRUE(created.has_value());
  EXPECT_EQ(created->id, 7u);
  EXPECT_FALSE(store.find_proposal_by_settle_height(0).has_value());

  auto settled = *created;
  settled.settle_height = 12;
  settled.status = 2;
  store.update_proposal(settled);

  auto by_settle = store.find_proposal_by_settle_height(12);
  ASSERT_TRUE(by_settle.has_value());
  EXPECT_EQ(by_settle->status, 2u);
  EXPECT_TRUE(store.find_proposal_by_new_height(10).has_value());
}

TEST(record_store, saving_a_proposal_again_keeps_its_settlement) {
  auto fixture = tally::testing::store_fixture{"tally_store_resave"};
  auto& store = fixture.store();
  auto proposal = make_proposal(7, 10);
  store.save_proposal(proposal);

  auto settled = proposal;
  settled.settle_height = 12;
  settled.status = 1;
  store.update_proposal(settled);

  auto stored = store.save_proposal(proposal);
  EXPECT_EQ(stored.settle_height, 12u);
  EXPECT_EQ(stored.status, 1u);

  auto found = store.find_proposal(7);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->settle_height, 12u);
}

TEST(record_store, grant_height_index_follows_latest_grant) {
  auto fixture = tally::testing::store_fixture{"tally_store_grant"};
  auto& store = fixture.store();
  auto grant = tally::schema::grant_record_t{};
  grant.id = 4;
  grant.address = "AA11";
  grant.height = 20;
  grant.stake = 100;
  grant.grant = true;
  store.save_grant(grant);

  grant.height = 25;
  grant.grant = false;
  store.save_grant(grant);

  EXPECT_FALSE(store.find_grant_by_height(20).has_value());
  auto latest = store.find_grant_by_height(25);
  ASSERT_TRUE(latest.has_value());
  EXPECT_FALSE(latest->grant);
  EXPECT_EQ(store.list_grants({}).total, 1u);
}

TEST(record_store, discussion_append_is_deduplicated_by_origin) {
  auto fixture = tally::testing::store_fixture{"tally_store_discussion"};
  auto& store = fixture.store();
  auto first = store.append_discussion(make_discussion(7, 30, 0));
  auto second = store.append_discussion(make_discussion(7, 30, 1));
  auto replay = store.append_discussion(make_discussion(7, 30, 0));

  EXPECT_TRUE(first.inserted);
  EXPECT_TRUE(second.inserted);
  EXPECT_FALSE(replay.inserted);
  EXPECT_EQ(first.id, 1u);
  EXPECT_EQ(second.id, 2u);
  EXPECT_EQ(replay.id, first.id);
  EXPECT_EQ(store.list_discussions(7, {}).total, 2u);
}

TEST(record_store, votes_are_keyed_by_height_and_voter) {
  auto fixture = tally::testing::store_fixture{"tally_store_votes"};
  auto& store = fixture.store();
  EXPECT_FALSE(store.has_proposal_vote(10, 3));
  auto id = store.insert_proposal_vote(make_proposal_vote(7, 3, "DD44", 10));
  EXPECT_EQ(id, 1u);
  EXPECT_TRUE(store.has_proposal_vote(10, 3));
  EXPECT_FALSE(store.has_proposal_vote(11, 3));
  EXPECT_FALSE(store.has_grant_vote(10, 3));

  auto by_voter = store.list_proposal_votes_by_voter("DD44", {});
  ASSERT_EQ(by_voter.items.size(), 1u);
  EXPECT_EQ(by_voter.items[0].proposal, 7u);
  EXPECT_EQ(store.list_proposal_votes_by_voter("DD4", {}).total, 0u);
}

TEST(record_store, listings_page_newest_first) {
  auto fixture = tally::testing::store_fixture{"tally_store_paging"};
  auto& store = fixture.store();
  for (auto id = 1u; id <= 5u; ++id) {
    store.save_proposal(
        make_proposal(id, 100 + id, id % 2 == 0 ? "EVEN" : "ODD"));
  }

  auto first = store.list_proposals({.page = 0, .page_size = 2});
  EXPECT_EQ(first.total, 5u);
  ASSERT_EQ(first.items.size(), 2u);
  EXPECT_EQ(first.items[0].id, 5u);
  EXPECT_EQ(first.items[1].id, 4u);

  auto last = store.list_proposals({.page = 2, .page_size = 2});
  ASSERT_EQ(last.items.size(), 1u);
  EXPECT_EQ(last.items[0].id, 1u);

  auto beyond = store.list_proposals({.page = 3, .page_size = 2});
  EXPECT_TRUE(beyond.items.empty());
  EXPECT_EQ(beyond.total, 5u);

  auto empty_page = store.list_proposals({.page = 0, .page_size = 0});
  EXPECT_TRUE(empty_page.items.empty());
  EXPECT_EQ(empty_page.total, 5u);

  auto odd = store.list_proposals({}, std::string{"ODD"});
  EXPECT_EQ(odd.total, 3u);
  ASSERT_EQ(odd.items.size(), 3u);
  EXPECT_EQ(odd.items[0].id, 5u);
  EXPECT_EQ(odd.items[2].id, 1u);
}

TEST(record_store, listing_by_owner_stays_within_owner) {
  auto fixture = tally::testing::store_fixture{"tally_store_owner"};
  auto& store = fixture.store();
  store.insert_proposal_vote(make_proposal_vote(7, 1, "AA", 10));
  store.insert_proposal_vote(make_proposal_vote(8, 1, "AA", 11));
  store.insert_proposal_vote(make_proposal_vote(7, 2, "BB", 10));

  auto seven = store.list_proposal_votes_by_proposal(7, {});
  EXPECT_EQ(seven.total, 2u);
  ASSERT_EQ(seven.items.size(), 2u);
  EXPECT_EQ(seven.items[0].voter_address, "BB");
  EXPECT_EQ(seven.items[1].voter_address, "AA");

  EXPECT_EQ(store.list_proposal_votes_by_proposal(8, {}).total, 1u);
  EXPECT_EQ(store.list_proposal_votes_by_proposal(9, {}).total, 0u);
}
