#include <spdlog/spdlog.h>
#include <tally/api/listener.hpp>
#include <tally/common/errors.hpp>
#include <string>

using namespace tally::api;
using namespace tally::schema;

namespace {

namespace v1 = tally::query::v1;

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_error(grpc::CallbackServerContext* context,
                                       const grpc::StatusCode code,
                                       const std::string& message) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{code, message});
  return reactor;
}

/// proto3 cannot tell an unset page size from zero; both select the default.
page_request make_page(const v1::PageRequest& page) {
  auto request = page_request{};
  request.page = page.page();
  if (page.page_size() != 0) {
    request.page_size = page.page_size();
  }
  return request;
}

void populate_proposal(const proposal_record_t& source,
                       v1::Proposal* destination) {
  destination->set_index(source.id);
  destination->set_proposer_index(source.proposer_index);
  destination->set_proposer_address(source.proposer_address);
  destination->set_data(make_string(source.data));
  destination->set_new_height(source.new_height);
  destination->set_settle_height(source.settle_height);
  destination->set_status(source.status);
}

void populate_discussion(const discussion_record_t& source,
                         v1::Discussion* destination) {
  destination->set_id(source.id);
  destination->set_proposal(source.proposal);
  destination->set_speaker_index(source.speaker_index);
  destination->set_speaker_address(source.speaker_address);
  destination->set_data(make_string(source.data));
  destination->set_height(source.height);
}

void populate_grant(const grant_record_t& source, v1::Grant* destination) {
  destination->set_index(source.id);
  destination->set_address(source.address);
  destination->set_height(source.height);
  destination->set_stake(source.stake);
  destination->set_proposer(source.proposer);
  destination->set_proposer_address(source.proposer_address);
  destination->set_grant(source.grant);
}

void populate_proposal_vote(const proposal_vote_record_t& source,
                            v1::ProposalVote* destination) {
  destination->set_id(source.id);
  destination->set_proposal(source.proposal);
  destination->set_voter_index(source.voter_index);
  destination->set_voter_address(source.voter_address);
  destination->set_height(source.height);
  destination->set_vote(source.vote);
}

void populate_grant_vote(const grant_vote_record_t& source,
                         v1::GrantVote* destination) {
  destination->set_id(source.id);
  destination->set_proposer_index(source.proposer_index);
  destination->set_proposer_address(source.proposer_address);
  destination->set_account_index(source.account_index);
  destination->set_account_address(source.account_address);
  destination->set_voter_index(source.voter_index);
  destination->set_voter_address(source.voter_address);
  destination->set_height(source.height);
  destination->set_vote(source.vote);
}

grpc::ServerUnaryReactor* storage_failure(
    grpc::CallbackServerContext* context,
    const tally::common::storage_error& e) {
  spdlog::error("Query failed on record store: {}", e.what());
  return finish_error(context, grpc::StatusCode::INTERNAL, e.what());
}

}  // namespace

listener::listener(const tally::query::service& service) : service_{service} {}

grpc::ServerUnaryReactor* listener::ListProposals(
    grpc::CallbackServerContext* context,
    const v1::ListProposalsRequest* request,
    v1::ListProposalsResponse* response) {
  try {
    auto proposer = std::optional<std::string>{};
    if (!request->proposer_address().empty()) {
      proposer = request->proposer_address();
    }
    auto page = service_.list_proposals(make_page(request->page()), proposer);
    for (const auto& proposal : page.items) {
      populate_proposal(proposal, response->add_proposals());
    }
    response->set_total(page.total);
  } catch (const tally::common::storage_error& e) {
    return storage_failure(context, e);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetProposal(
    grpc::CallbackServerContext* context,
    const v1::GetProposalRequest* request,
    v1::GetProposalResponse* response) {
  try {
    auto proposal = service_.get_proposal(request->index());
    if (!proposal) {
      return finish_error(context, grpc::StatusCode::NOT_FOUND,
                          "proposal " + std::to_string(request->index()) +
                              " not found");
    }
    populate_proposal(*proposal, response->mutable_proposal());
  } catch (const tally::common::storage_error& e) {
    return storage_failure(context, e);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListDiscussions(
    grpc::CallbackServerContext* context,
    const v1::ListDiscussionsRequest* request,
    v1::ListDiscussionsResponse* response) {
  try {
    auto page = service_.list_discussions(request->proposal(),
                                          make_page(request->page()));
    for (const auto& discussion : page.items) {
      populate_discussion(discussion, response->add_discussions());
    }
    response->set_total(page.total);
  } catch (const tally::common::storage_error& e) {
    return storage_failure(context, e);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListGrants(
    grpc::CallbackServerContext* context,
    const v1::ListGrantsRequest* request,
    v1::ListGrantsResponse* response) {
  try {
    auto page = service_.list_grants(make_page(request->page()));
    for (const auto& grant : page.items) {
      populate_grant(grant, response->add_grants());
    }
    response->set_total(page.total);
  } catch (const tally::common::storage_error& e) {
    return storage_failure(context, e);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetGrant(
    grpc::CallbackServerContext* context,
    const v1::GetGrantRequest* request,
    v1::GetGrantResponse* response) {
  try {
    auto grant = service_.get_grant(request->index());
    if (!grant) {
      return finish_error(
          context, grpc::StatusCode::NOT_FOUND,
          "grant " + std::to_string(request->index()) + " not found");
    }
    populate_grant(*grant, response->mutable_grant());
  } catch (const tally::common::storage_error& e) {
    return storage_failure(context, e);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListProposalVotes(
    grpc::CallbackServerContext* context,
    const v1::ListProposalVotesRequest* request,
    v1::ListProposalVotesResponse* response) {
  try {
    auto page = page_result<proposal_vote_record_t>{};
    switch (request->filter_case()) {
      case v1::ListProposalVotesRequest::kProposal:
        page = service_.list_proposal_votes(request->proposal(),
                                            make_page(request->page()));
        break;
      case v1::ListProposalVotesRequest::kVoterAddress:
        page = service_.list_proposal_votes_by_voter(
            request->voter_address(), make_page(request->page()));
        break;
      default:
        return finish_error(context, grpc::StatusCode::INVALID_ARGUMENT,
                            "proposal or voter_address is required");
    }
    for (const auto& vote : page.items) {
      populate_proposal_vote(vote, response->add_votes());
    }
    response->set_total(page.total);
  } catch (const tally::common::storage_error& e) {
    return storage_failure(context, e);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListGrantVotes(
    grpc::CallbackServerContext* context,
    const v1::ListGrantVotesRequest* request,
    v1::ListGrantVotesResponse* response) {
  try {
    auto page = page_result<grant_vote_record_t>{};
    switch (request->filter_case()) {
      case v1::ListGrantVotesRequest::kGrant:
        page = service_.list_grant_votes(request->grant(),
                                         make_page(request->page()));
        break;
      case v1::ListGrantVotesRequest::kVoterAddress:
        page = service_.list_grant_votes_by_voter(request->voter_address(),
                                                  make_page(request->page()));
        break;
      default:
        return finish_error(context, grpc::StatusCode::INVALID_ARGUMENT,
                            "grant or voter_address is required");
    }
    for (const auto& vote : page.items) {
      populate_grant_vote(vote, response->add_votes());
    }
    response->set_total(page.total);
  } catch (const tally::common::storage_error& e) {
    return storage_failure(context, e);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetIndexStatus(
    grpc::CallbackServerContext* context,
    const v1::GetIndexStatusRequest*,
    v1::GetIndexStatusResponse* response) {
  try {
    auto status = service_.status();
    response->set_last_indexed_height(status.last_indexed);
    response->set_chain_head(status.head);
    response->set_next_height(status.next_height);
    response->set_state(std::string{tally::indexer::to_string(status.state)});
  } catch (const tally::common::storage_error& e) {
    return storage_failure(context, e);
  }
  return finish_ok(context);
}
