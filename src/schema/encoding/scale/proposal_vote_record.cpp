#include <tally/schema/encoding/scale/proposal_vote_record.hpp>

namespace tally::schema {

void encode(const proposal_vote_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.proposal, encoder);
  encode(o.voter_index, encoder);
  encode(o.voter_address, encoder);
  encode(o.height, encoder);
  encode(o.vote, encoder);
}

void decode(proposal_vote_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.proposal, decoder);
  decode(o.voter_index, decoder);
  decode(o.voter_address, decoder);
  decode(o.height, decoder);
  decode(o.vote, decoder);
}

}  // namespace tally::schema
