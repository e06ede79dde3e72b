#include <tally/query/service.hpp>
#include <algorithm>

namespace tally::query {

service::service(const tally::store::record_store& store,
                 const tally::indexer::sync_loop* loop)
    : store_{store}, loop_{loop} {}

tally::schema::page_request service::clamp(
    tally::schema::page_request request) {
  request.page_size = std::min(request.page_size, kMaxPageSize);
  return request;
}

tally::schema::page_result<tally::schema::proposal_record_t>
service::list_proposals(
    const tally::schema::page_request& request,
    const std::optional<std::string>& proposer_address) const {
  return store_.list_proposals(clamp(request), proposer_address);
}

std::optional<tally::schema::proposal_record_t> service::get_proposal(
    const tally::schema::proposal_index_t id) const {
  return store_.find_proposal(id);
}

tally::schema::page_result<tally::schema::discussion_record_t>
service::list_discussions(const tally::schema::proposal_index_t proposal,
                          const tally::schema::page_request& request) const {
  return store_.list_discussions(proposal, clamp(request));
}

tally::schema::page_result<tally::schema::grant_record_t> service::list_grants(
    const tally::schema::page_request& request) const {
  return store_.list_grants(clamp(request));
}

std::optional<tally::schema::grant_record_t> service::get_grant(
    const tally::schema::validator_index_t id) const {
  return store_.find_grant(id);
}

tally::schema::page_result<tally::schema::proposal_vote_record_t>
service::list_proposal_votes(const tally::schema::proposal_index_t proposal,
                             const tally::schema::page_request& request) const {
  return store_.list_proposal_votes_by_proposal(proposal, clamp(request));
}

tally::schema::page_result<tally::schema::proposal_vote_record_t>
service::list_proposal_votes_by_voter(
    const std::string_view voter_address,
    const tally::schema::page_request& request) const {
  return store_.list_proposal_votes_by_voter(voter_address, clamp(request));
}

tally::schema::page_result<tally::schema::grant_vote_record_t>
service::list_grant_votes(const tally::schema::validator_index_t grant,
                          const tally::schema::page_request& request) const {
  return store_.list_grant_votes_by_account(grant, clamp(request));
}

tally::schema::page_result<tally::schema::grant_vote_record_t>
service::list_grant_votes_by_voter(
    const std::string_view voter_address,
    const tally::schema::page_request& request) const {
  return store_.list_grant_votes_by_voter(voter_address, clamp(request));
}

index_status service::status() const {
  auto status = index_status{};
  status.last_indexed = store_.load_index_progress();
  status.next_height = status.last_indexed + 1;
  if (loop_ != nullptr) {
    status.head = loop_->head();
    status.next_height = loop_->next_height();
    status.state = loop_->state();
  }
  return status;
}

}  // namespace tally::query
