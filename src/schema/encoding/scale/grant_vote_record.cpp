#include <tally/schema/encoding/scale/grant_vote_record.hpp>

namespace tally::schema {

void encode(const grant_vote_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.proposer_index, encoder);
  encode(o.proposer_address, encoder);
  encode(o.account_index, encoder);
  encode(o.account_address, encoder);
  encode(o.voter_index, encoder);
  encode(o.voter_address, encoder);
  encode(o.height, encoder);
  encode(o.vote, encoder);
}

void decode(grant_vote_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.proposer_index, decoder);
  decode(o.proposer_address, decoder);
  decode(o.account_index, decoder);
  decode(o.account_address, decoder);
  decode(o.voter_index, decoder);
  decode(o.voter_address, decoder);
  decode(o.height, decoder);
  decode(o.vote, decoder);
}

}  // namespace tally::schema
