#pragma once

#include <tally/net/http_client.hpp>
#include <tally/rpc/chain_client.hpp>
#include <chrono>
#include <string_view>

namespace tally::rpc::cometbft {

/// chain_client over the CometBFT JSON-RPC HTTP endpoints.
class http_chain_client final : public chain_client {
 public:
  explicit http_chain_client(std::string_view url,
                             std::chrono::milliseconds timeout);

  tally::schema::height_t latest_height() override;
  tally::schema::block_result_t block_results(
      tally::schema::height_t height) override;
  tally::schema::commit_t commit(tally::schema::height_t height) override;
  tally::schema::query_result_t abci_query(
      std::string_view path,
      const tally::schema::bytes_view_t& data) override;

 private:
  tally::net::http_client http_;
};

}  // namespace tally::rpc::cometbft
