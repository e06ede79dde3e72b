#pragma once

#include <tally/schema/block_result.hpp>
#include <tally/schema/commit.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/query_result.hpp>
#include <string_view>

namespace tally::rpc {

/// Read access to a consensus node. Every method throws
/// tally::common::transport_error when the node cannot be reached or answers
/// outside its protocol.
class chain_client {
 public:
  virtual ~chain_client() = default;

  /// Height of the latest committed block.
  virtual tally::schema::height_t latest_height() = 0;

  virtual tally::schema::block_result_t block_results(
      tally::schema::height_t height) = 0;

  virtual tally::schema::commit_t commit(tally::schema::height_t height) = 0;

  /// Point query against application state.
  virtual tally::schema::query_result_t abci_query(
      std::string_view path,
      const tally::schema::bytes_view_t& data) = 0;
};

}  // namespace tally::rpc
