#include <gtest/gtest.h>
#include <tally/common/errors.hpp>
#include <tally/rpc/cometbft/json_codec.hpp>

#include <string_view>

namespace cometbft = tally::rpc::cometbft;

TEST(json_codec, status_reads_latest_height_string) {
  auto body = std::string_view{R"({
    "jsonrpc": "2.0", "id": -1,
    "result": {"sync_info": {"latest_block_height": "1234",
                             "catching_up": false}}})"};
  EXPECT_EQ(cometbft::parse_status(body), 1234u);
}

TEST(json_codec, block_results_keep_event_order) {
  auto body = std::string_view{R"({
    "jsonrpc": "2.0", "id": -1,
    "result": {
      "height": "12",
      "txs_results": [
        {"code": 0, "log": "", "events": [
          {"type": "proposal", "attributes": [
            {"key": "proposal", "value": "7", "index": true},
            {"key": "data", "value": "raise"}]},
          {"type": "discussion", "attributes": []}]},
        {"code": 5, "codespace": "app", "events": [
          {"type": "settle_proposal", "attributes": [
            {"key": "proposal", "value": "7", "index": false}]}]}]}})"};
  auto block = cometbft::parse_block_results(body);
  EXPECT_EQ(block.height, 12u);
  ASSERT_EQ(block.tx_results.size(), 2u);
  ASSERT_EQ(block.tx_results[0].events.size(), 2u);
  EXPECT_EQ(block.tx_results[0].events[0].type, "proposal");
  EXPECT_EQ(block.tx_results[0].events[0].attribute("proposal"), "7");
  EXPECT_TRUE(block.tx_results[0].events[0].attributes[0].index);
  EXPECT_FALSE(block.tx_results[0].events[0].attributes[1].index);
  EXPECT_EQ(block.tx_results[0].events[1].type, "discussion");
  EXPECT_EQ(block.tx_results[1].code, 5u);
  EXPECT_EQ(block.tx_results[1].codespace, "app");
  EXPECT_EQ(block.tx_results[1].events[0].type, "settle_proposal");
}

TEST(json_codec, block_results_without_transactions_is_empty) {
  auto body = std::string_view{
      R"({"result": {"height": "3", "txs_results": null}})"};
  auto block = cometbft::parse_block_results(body);
  EXPECT_EQ(block.height, 3u);
  EXPECT_TRUE(block.tx_results.empty());
}

TEST(json_codec, commit_reads_signatures_in_order) {
  auto body = std::string_view{R"({
    "result": {"signed_header": {"commit": {
      "height": "12",
      "signatures": [
        {"block_id_flag": 2, "validator_address": "AA11", "signature": "x"},
        {"block_id_flag": 1, "validator_address": "", "signature": null},
        {"block_id_flag": 2, "validator_address": "BB22", "vote_code": 3}]}}}})"};
  auto commit = cometbft::parse_commit(body);
  EXPECT_EQ(commit.height, 12u);
  ASSERT_EQ(commit.signatures.size(), 3u);
  EXPECT_EQ(commit.signatures[0].validator_address, "AA11");
  EXPECT_EQ(commit.signatures[0].vote_code, 2u);
  EXPECT_TRUE(commit.signatures[1].validator_address.empty());
  EXPECT_EQ(commit.signatures[2].vote_code, 3u);
}

TEST(json_codec, abci_query_decodes_base64_value) {
  auto body = std::string_view{R"({
    "result": {"response": {"code": 0, "log": "", "info": "",
      "index": "0", "key": null, "value": "eyJpbmRleCI6M30=",
      "height": "12", "codespace": ""}}})"};
  auto result = cometbft::parse_abci_query(body);
  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(result.height, 12);
  EXPECT_TRUE(result.key.empty());
  EXPECT_EQ(tally::schema::make_string(result.value), R"({"index":3})");
}

TEST(json_codec, rpc_error_object_is_transport_error) {
  auto body = std::string_view{R"({
    "jsonrpc": "2.0", "id": -1,
    "error": {"code": -32603, "message": "Internal error",
              "data": "height 99 must be less than or equal to 12"}})"};
  EXPECT_THROW(cometbft::parse_block_results(body),
               tally::common::transport_error);
}

TEST(json_codec, malformed_bodies_are_transport_errors) {
  EXPECT_THROW(cometbft::parse_status("not json"),
               tally::common::transport_error);
  EXPECT_THROW(cometbft::parse_status(R"({"result": {}})"),
               tally::common::transport_error);
  EXPECT_THROW(cometbft::parse_status(
                   R"({"result": {"sync_info": {"latest_block_height": "-1"}}})"),
               tally::common::transport_error);
  EXPECT_THROW(cometbft::parse_abci_query(
                   R"({"result": {"response": {"value": "***"}}})"),
               tally::common::transport_error);
}

TEST(json_codec, abci_query_target_quotes_path_and_hex_encodes_data) {
  auto data = tally::schema::bytes_t{0xAB, 0x01};
  EXPECT_EQ(cometbft::make_abci_query_target(
                "/accounts/", tally::schema::make_bytes_view(data)),
            "/abci_query?path=%22/accounts/%22&data=0xab01");
}
