#include <spdlog/spdlog.h>
#include <tally/rpc/cometbft/http_chain_client.hpp>
#include <tally/rpc/cometbft/json_codec.hpp>

namespace tally::rpc::cometbft {

http_chain_client::http_chain_client(const std::string_view url,
                                     const std::chrono::milliseconds timeout)
    : http_{url, timeout} {
  spdlog::debug("CometBFT client bound to {}:{}", http_.remote().host,
                http_.remote().port);
}

tally::schema::height_t http_chain_client::latest_height() {
  return parse_status(http_.get("/status"));
}

tally::schema::block_result_t http_chain_client::block_results(
    const tally::schema::height_t height) {
  return parse_block_results(
      http_.get(fmt::format("/block_results?height={}", height)));
}

tally::schema::commit_t http_chain_client::commit(
    const tally::schema::height_t height) {
  return parse_commit(http_.get(fmt::format("/commit?height={}", height)));
}

tally::schema::query_result_t http_chain_client::abci_query(
    const std::string_view path,
    const tally::schema::bytes_view_t& data) {
  return parse_abci_query(http_.get(make_abci_query_target(path, data)));
}

}  // namespace tally::rpc::cometbft
