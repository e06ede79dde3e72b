#include <gtest/gtest.h>
#include <tally/common/errors.hpp>
#include <tally/indexer/account_lookup.hpp>
#include <tally/indexer/vote_reconciler.hpp>
#include <tally/testing/indexer_fixture.hpp>

namespace {

class reconciler_harness final {
 public:
  explicit reconciler_harness(const std::string_view db_prefix)
      : fixture_{db_prefix},
        accounts_{fixture_.connection()},
        reconciler_{fixture_.connection(), accounts_, fixture_.store()} {
    fixture_.chain().add_account("AA11", 1);
    fixture_.chain().add_account("BB22", 2);
    fixture_.chain().add_account("CC33", 3);
  }

  tally::testing::indexer_fixture& fixture() { return fixture_; }
  tally::store::record_store& store() { return fixture_.store(); }
  tally::testing::fake_chain& chain() { return fixture_.chain(); }
  tally::indexer::vote_reconciler& reconciler() { return reconciler_; }

  void add_proposal(const tally::schema::proposal_index_t id,
                    const tally::schema::height_t new_height) {
    auto proposal = tally::schema::proposal_record_t{};
    proposal.id = id;
    proposal.proposer_index = 1;
    proposal.proposer_address = "AA11";
    proposal.new_height = new_height;
    store().save_proposal(proposal);
  }

  void sign_with_all(const tally::schema::height_t height) {
    chain().add_signature(height, "AA11");
    chain().add_signature(height, "BB22", 3);
    chain().add_signature(height, "CC33");
  }

 private:
  tally::testing::indexer_fixture fixture_;
  tally::indexer::account_lookup accounts_;
  tally::indexer::vote_reconciler reconciler_;
};

}  // namespace

TEST(vote_reconciler, records_one_vote_per_signer_once) {
  auto harness = reconciler_harness{"tally_reconcile_once"};
  harness.add_proposal(7, 100);
  harness.sign_with_all(100);

  auto outcome = harness.reconciler().reconcile(100);
  EXPECT_EQ(outcome.target, tally::indexer::reconcile_target_t::new_proposal);
  EXPECT_EQ(outcome.target_id, 7u);
  EXPECT_EQ(outcome.inserted, 3u);

  auto votes = harness.store().list_proposal_votes_by_proposal(7, {});
  ASSERT_EQ(votes.total, 3u);
  for (const auto& vote : votes.items) {
    EXPECT_EQ(vote.proposal, 7u);
    EXPECT_EQ(vote.height, 100u);
  }
  EXPECT_EQ(votes.items[1].voter_index, 2u);
  EXPECT_EQ(votes.items[1].vote, 3u);

  auto again = harness.reconciler().reconcile(100);
  EXPECT_EQ(again.inserted, 0u);
  EXPECT_EQ(again.skipped, 3u);
  EXPECT_EQ(harness.store().list_proposal_votes_by_proposal(7, {}).total, 3u);
}

TEST(vote_reconciler, height_without_target_skips_the_commit) {
  auto harness = reconciler_harness{"tally_reconcile_none"};
  harness.sign_with_all(100);
  auto outcome = harness.reconciler().reconcile(100);
  EXPECT_EQ(outcome.target, tally::indexer::reconcile_target_t::none);
  EXPECT_EQ(harness.chain().commit_requests(), 0u);
}

TEST(vote_reconciler, settlement_votes_attach_to_the_settled_proposal) {
  auto harness = reconciler_harness{"tally_reconcile_settled"};
  harness.add_proposal(7, 100);
  auto settled = *harness.store().find_proposal(7);
  settled.settle_height = 150;
  settled.status = 2;
  harness.store().update_proposal(settled);
  harness.sign_with_all(150);

  auto outcome = harness.reconciler().reconcile(150);
  EXPECT_EQ(outcome.target,
            tally::indexer::reconcile_target_t::settled_proposal);
  EXPECT_EQ(outcome.inserted, 3u);
  EXPECT_EQ(harness.store().list_proposal_votes_by_proposal(7, {}).total, 3u);
}

TEST(vote_reconciler, creation_takes_priority_over_other_targets) {
  auto harness = reconciler_harness{"tally_reconcile_priority"};
  harness.add_proposal(7, 100);
  auto grant = tally::schema::grant_record_t{};
  grant.id = 9;
  grant.address = "DD44";
  grant.height = 100;
  harness.store().save_grant(grant);
  harness.sign_with_all(100);

  auto outcome = harness.reconciler().reconcile(100);
  EXPECT_EQ(outcome.target, tally::indexer::reconcile_target_t::new_proposal);
  EXPECT_EQ(harness.store().list_grant_votes_by_account(9, {}).total, 0u);
}

TEST(vote_reconciler, grant_votes_carry_grant_context) {
  auto harness = reconciler_harness{"tally_reconcile_grant"};
  auto grant = tally::schema::grant_record_t{};
  grant.id = 9;
  grant.address = "DD44";
  grant.height = 40;
  grant.stake = 100;
  grant.proposer = 1;
  grant.proposer_address = "AA11";
  grant.grant = true;
  harness.store().save_grant(grant);
  harness.sign_with_all(40);

  auto outcome = harness.reconciler().reconcile(40);
  EXPECT_EQ(outcome.target, tally::indexer::reconcile_target_t::grant);
  EXPECT_EQ(outcome.inserted, 3u);

  auto votes = harness.store().list_grant_votes_by_account(9, {});
  ASSERT_EQ(votes.total, 3u);
  EXPECT_EQ(votes.items[0].account_address, "DD44");
  EXPECT_EQ(votes.items[0].proposer_address, "AA11");
  EXPECT_EQ(votes.items[0].voter_address, "CC33");
  EXPECT_EQ(harness.store().list_grant_votes_by_voter("BB22", {}).total, 1u);
}

TEST(vote_reconciler, absent_signatures_are_skipped) {
  auto harness = reconciler_harness{"tally_reconcile_absent"};
  harness.add_proposal(7, 100);
  harness.chain().add_signature(100, "AA11");
  harness.chain().add_signature(100, "");
  harness.chain().add_signature(100, "BB22");

  auto outcome = harness.reconciler().reconcile(100);
  EXPECT_EQ(outcome.inserted, 2u);
  EXPECT_EQ(outcome.absent, 1u);
}

TEST(vote_reconciler, unknown_signer_fails_until_it_resolves) {
  auto harness = reconciler_harness{"tally_reconcile_unknown"};
  harness.add_proposal(7, 101);
  harness.chain().add_signature(101, "AA11");
  harness.chain().add_signature(101, "EE55");
  harness.chain().add_signature(101, "BB22");

  EXPECT_THROW(harness.reconciler().reconcile(101),
               tally::common::inconsistency_error);
  EXPECT_EQ(harness.store().list_proposal_votes_by_proposal(7, {}).total, 1u);

  harness.chain().add_account("EE55", 5);
  auto outcome = harness.reconciler().reconcile(101);
  EXPECT_EQ(outcome.inserted, 2u);
  EXPECT_EQ(outcome.skipped, 1u);
  EXPECT_EQ(harness.store().list_proposal_votes_by_proposal(7, {}).total, 3u);
  EXPECT_TRUE(harness.store().has_proposal_vote(101, 5));
}
