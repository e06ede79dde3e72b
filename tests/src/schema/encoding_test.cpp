#include <gtest/gtest.h>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/key/record_keys.hpp>

#include <algorithm>

namespace {

using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(encoding, proposal_record_survives_storage_encoding) {
  auto encoder = encoder_t{};
  auto proposal = tally::schema::proposal_record_t{};
  proposal.id = 7;
  proposal.proposer_index = 3;
  proposal.proposer_address = "AA11";
  proposal.data = tally::schema::bytes_t{0x00, 0xFF, 0x7B};
  proposal.new_height = 100;
  proposal.settle_height = 150;
  proposal.status = 2;

  auto encoded = encoder.encode(proposal);
  auto decoded = encoder.decode<tally::schema::proposal_record_t>(
      tally::schema::make_bytes_view(encoded));
  EXPECT_EQ(decoded.version, 1u);
  EXPECT_EQ(decoded.id, 7u);
  EXPECT_EQ(decoded.proposer_address, "AA11");
  EXPECT_EQ(decoded.data, proposal.data);
  EXPECT_EQ(decoded.settle_height, 150u);
}

TEST(record_keys, ids_sort_numerically) {
  namespace key = tally::schema::key;
  auto low = key::make_owner_key(key::kProposalVoteByProposalPrefix, 7, 2);
  auto high = key::make_owner_key(key::kProposalVoteByProposalPrefix, 7, 256);
  EXPECT_LT(low, high);
  EXPECT_EQ(key::trailing_id(tally::schema::make_bytes_view(high)), 256u);

  auto prefix = key::make_owner_prefix(key::kProposalVoteByProposalPrefix, 7);
  EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), low.begin()));
}

TEST(record_keys, address_prefix_does_not_match_longer_address) {
  namespace key = tally::schema::key;
  auto short_prefix = key::make_address_prefix(key::kProposalVoteByVoterPrefix,
                                               "AA");
  auto longer = key::make_address_key(key::kProposalVoteByVoterPrefix, "AA11",
                                      1);
  EXPECT_FALSE(std::equal(short_prefix.begin(), short_prefix.end(),
                          longer.begin()));
}
