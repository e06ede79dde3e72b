#pragma once

#include <tally/agent/client.hpp>

namespace tally::agent {

/// Agent that approves everything and records nothing. Used when no agent
/// endpoint is configured.
class noop_client final : public client {
 public:
  bool should_process_proposal(tally::schema::validator_index_t proposer,
                               const tally::schema::bytes_t& data) override;
  vote_recommendation recommend_proposal_vote(
      tally::schema::proposal_index_t proposal,
      std::string_view voter_address) override;
  vote_recommendation recommend_grant_vote(
      tally::schema::validator_index_t validator,
      std::string_view proposer_address,
      uint64_t amount,
      std::string_view statement) override;
  std::string comment_proposal(tally::schema::proposal_index_t proposal,
                               std::string_view speaker_address) override;
  void add_proposal(tally::schema::proposal_index_t proposal,
                    std::string_view proposer_address,
                    std::string_view text) override;
  void add_discussion(tally::schema::proposal_index_t proposal,
                      std::string_view speaker_address,
                      std::string_view text) override;
};

}  // namespace tally::agent
