#pragma once

#include <tally/agent/client.hpp>
#include <tally/net/http_client.hpp>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace tally::agent {

/// Parse the `GET /agents` listing into agent ids, in listing order.
std::vector<std::string> parse_agent_ids(std::string_view body);

/// Parse a `{"vote": "yes"|"no", "reason": ...}` answer.
vote_recommendation parse_vote(std::string_view body);

/// Agent reached over the Eliza HTTP/JSON API. The first listed agent is
/// selected at construction.
class eliza_client final : public client {
 public:
  /// Throws transport_error when the agent list cannot be fetched or is empty.
  explicit eliza_client(std::string_view url,
                        std::chrono::milliseconds timeout);

  const std::string& agent_id() const { return agent_id_; }

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

 private:
  std::string post(std::string_view route,
                   std::string_view id_field,
                   uint64_t id,
                   std::string_view address,
                   std::string_view text) const;

  tally::net::http_client http_;
  std::string agent_id_;
};

}  // namespace tally::agent
