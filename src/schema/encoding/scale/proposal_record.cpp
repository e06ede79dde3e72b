#include <tally/schema/encoding/scale/proposal_record.hpp>

namespace tally::schema {

void encode(const proposal_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.proposer_index, encoder);
  encode(o.proposer_address, encoder);
  encode(o.data, encoder);
  encode(o.new_height, encoder);
  encode(o.settle_height, encoder);
  encode(o.status, encoder);
}

void decode(proposal_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.proposer_index, decoder);
  decode(o.proposer_address, decoder);
  decode(o.data, decoder);
  decode(o.new_height, decoder);
  decode(o.settle_height, decoder);
  decode(o.status, decoder);
}

}  // namespace tally::schema
