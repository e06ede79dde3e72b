#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace tally::agent {

struct vote_recommendation final {
  bool approve{};
  std::string reason;
};

/// Advisory agent consulted on governance activity. Implementations report
/// failures as tally::common::transport_error; callers treat every failure as
/// non-fatal.
class client {
 public:
  virtual ~client() = default;

  virtual bool should_process_proposal(
      tally::schema::validator_index_t proposer,
      const tally::schema::bytes_t& data) = 0;

  virtual vote_recommendation recommend_proposal_vote(
      tally::schema::proposal_index_t proposal,
      std::string_view voter_address) = 0;

  virtual vote_recommendation recommend_grant_vote(
      tally::schema::validator_index_t validator,
      std::string_view proposer_address,
      uint64_t amount,
      std::string_view statement) = 0;

  /// Ask the agent to comment on a proposal; returns the comment text.
  virtual std::string comment_proposal(tally::schema::proposal_index_t proposal,
                                       std::string_view speaker_address) = 0;

  virtual void add_proposal(tally::schema::proposal_index_t proposal,
                            std::string_view proposer_address,
                            std::string_view text) = 0;

  virtual void add_discussion(tally::schema::proposal_index_t proposal,
                              std::string_view speaker_address,
                              std::string_view text) = 0;
};

}  // namespace tally::agent
