#pragma once

#include <tally/schema/block_result.hpp>
#include <tally/schema/commit.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/query_result.hpp>
#include <string>
#include <string_view>

// CometBFT JSON-RPC (v0.37 and later) response decoding. Every parser throws
// tally::common::transport_error on malformed JSON, a JSON-RPC error object, or
// a missing required field.
namespace tally::rpc::cometbft {

/// `/status`: result.sync_info.latest_block_height.
tally::schema::height_t parse_status(std::string_view body);

/// `/block_results?height=`: transaction results with their events, in order.
tally::schema::block_result_t parse_block_results(std::string_view body);

/// `/commit?height=`: result.signed_header.commit signatures.
tally::schema::commit_t parse_commit(std::string_view body);

/// `/abci_query?path=&data=`: result.response with the value base64-decoded.
tally::schema::query_result_t parse_abci_query(std::string_view body);

/// Request target of an ABCI query, with `path` quoted and `data` as 0x hex.
std::string make_abci_query_target(std::string_view path,
                                   const tally::schema::bytes_view_t& data);

}  // namespace tally::rpc::cometbft
