#include <tally/agent/noop_client.hpp>

namespace tally::agent {

bool noop_client::should_process_proposal(
    const tally::schema::validator_index_t,
    const tally::schema::bytes_t&) {
  return true;
}

vote_recommendation noop_client::recommend_proposal_vote(
    const tally::schema::proposal_index_t,
    const std::string_view) {
  return vote_recommendation{true, {}};
}

vote_recommendation noop_client::recommend_grant_vote(
    const tally::schema::validator_index_t,
    const std::string_view,
    const uint64_t,
    const std::string_view) {
  return vote_recommendation{true, {}};
}

std::string noop_client::comment_proposal(
    const tally::schema::proposal_index_t,
    const std::string_view) {
  return {};
}

void noop_client::add_proposal(const tally::schema::proposal_index_t,
                               const std::string_view,
                               const std::string_view) {}

void noop_client::add_discussion(const tally::schema::proposal_index_t,
                                 const std::string_view,
                                 const std::string_view) {}

}  // namespace tally::agent
