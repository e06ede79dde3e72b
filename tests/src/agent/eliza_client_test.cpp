#include <gtest/gtest.h>
#include <tally/agent/eliza_client.hpp>
#include <tally/agent/noop_client.hpp>
#include <tally/common/errors.hpp>

TEST(eliza_client, parses_agent_listing_in_order) {
  auto ids = tally::agent::parse_agent_ids(
      R"({"agents":[{"id":"a1","name":"first"},{"name":"no id"},{"id":"b2"}]})");
  ASSERT_EQ(ids.size(), 2u);
  EXPECT_EQ(ids[0], "a1");
  EXPECT_EQ(ids[1], "b2");
  EXPECT_TRUE(tally::agent::parse_agent_ids(R"({"agents":[]})").empty());
  EXPECT_THROW(tally::agent::parse_agent_ids("<html>"),
               tally::common::transport_error);
}

TEST(eliza_client, parses_vote_answers) {
  auto yes = tally::agent::parse_vote(R"({"vote":"yes","reason":"sound"})");
  EXPECT_TRUE(yes.approve);
  EXPECT_EQ(yes.reason, "sound");

  auto no = tally::agent::parse_vote(R"({"vote":"no"})");
  EXPECT_FALSE(no.approve);
  EXPECT_TRUE(no.reason.empty());

  EXPECT_THROW(tally::agent::parse_vote(R"({"reason":"none"})"),
               tally::common::transport_error);
}

TEST(eliza_client, unsupported_agent_url_fails_construction) {
  EXPECT_THROW(tally::agent::eliza_client("ftp://agent",
                                          std::chrono::milliseconds{100}),
               tally::common::transport_error);
}

TEST(noop_client, approves_everything_silently) {
  auto agent = tally::agent::noop_client{};
  auto data = tally::schema::bytes_t{};
  EXPECT_TRUE(agent.should_process_proposal(3, data));
  EXPECT_TRUE(agent.recommend_proposal_vote(7, "AA11").approve);
  EXPECT_TRUE(agent.comment_proposal(7, "AA11").empty());
  agent.add_proposal(7, "AA11", "raise");
  agent.add_discussion(7, "AA11", "agreed");
}
