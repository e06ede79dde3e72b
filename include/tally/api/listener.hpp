#pragma once

#include <tally/query/v1/query.grpc.pb.h>
#include <tally/query/service.hpp>

namespace tally::api {

/// Callback gRPC front end of query::service.
///
/// Missing rows answer NOT_FOUND; a voter filter that is neither an id nor an
/// address answers INVALID_ARGUMENT; every other request answers OK.
struct listener final : public tally::query::v1::Query::CallbackService {
  explicit listener(const tally::query::service& service);

  virtual grpc::ServerUnaryReactor* ListProposals(
      grpc::CallbackServerContext* context,
      const tally::query::v1::ListProposalsRequest* request,
      tally::query::v1::ListProposalsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetProposal(
      grpc::CallbackServerContext* context,
      const tally::query::v1::GetProposalRequest* request,
      tally::query::v1::GetProposalResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListDiscussions(
      grpc::CallbackServerContext* context,
      const tally::query::v1::ListDiscussionsRequest* request,
      tally::query::v1::ListDiscussionsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListGrants(
      grpc::CallbackServerContext* context,
      const tally::query::v1::ListGrantsRequest* request,
      tally::query::v1::ListGrantsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetGrant(
      grpc::CallbackServerContext* context,
      const tally::query::v1::GetGrantRequest* request,
      tally::query::v1::GetGrantResponse* response) override final;

  /// Filter by proposal id or by voter address.
  virtual grpc::ServerUnaryReactor* ListProposalVotes(
      grpc::CallbackServerContext* context,
      const tally::query::v1::ListProposalVotesRequest* request,
      tally::query::v1::ListProposalVotesResponse* response) override final;

  /// Filter by grant (account) id or by voter address.
  virtual grpc::ServerUnaryReactor* ListGrantVotes(
      grpc::CallbackServerContext* context,
      const tally::query::v1::ListGrantVotesRequest* request,
      tally::query::v1::ListGrantVotesResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetIndexStatus(
      grpc::CallbackServerContext* context,
      const tally::query::v1::GetIndexStatusRequest* request,
      tally::query::v1::GetIndexStatusResponse* response) override final;

 private:
  const tally::query::service& service_;
};

}  // namespace tally::api
