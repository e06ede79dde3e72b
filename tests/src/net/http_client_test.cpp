#include <gtest/gtest.h>
#include <tally/common/errors.hpp>
#include <tally/net/http_client.hpp>

TEST(http_client, parses_http_and_tcp_endpoints) {
  auto http = tally::net::try_parse_endpoint("http://node.local:26657/rpc/");
  ASSERT_TRUE(http.has_value());
  EXPECT_EQ(http->host, "node.local");
  EXPECT_EQ(http->port, "26657");
  EXPECT_EQ(http->base_path, "/rpc");

  auto tcp = tally::net::try_parse_endpoint("tcp://127.0.0.1:26657");
  ASSERT_TRUE(tcp.has_value());
  EXPECT_EQ(tcp->host, "127.0.0.1");
  EXPECT_TRUE(tcp->base_path.empty());

  auto bare = tally::net::try_parse_endpoint("agent");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->port, "80");
}

TEST(http_client, rejects_unsupported_endpoints) {
  EXPECT_FALSE(tally::net::try_parse_endpoint("https://node:443").has_value());
  EXPECT_FALSE(tally::net::try_parse_endpoint("http://:26657").has_value());
  EXPECT_FALSE(tally::net::try_parse_endpoint("http://node:port").has_value());
  EXPECT_THROW(tally::net::http_client{"ws://node:26657"},
               tally::common::transport_error);
}
