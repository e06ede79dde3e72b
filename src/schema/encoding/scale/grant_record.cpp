#include <tally/schema/encoding/scale/grant_record.hpp>

namespace tally::schema {

void encode(const grant_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.address, encoder);
  encode(o.height, encoder);
  encode(o.stake, encoder);
  encode(o.proposer, encoder);
  encode(o.proposer_address, encoder);
  encode(o.grant, encoder);
}

void decode(grant_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.address, decoder);
  decode(o.height, decoder);
  decode(o.stake, decoder);
  decode(o.proposer, decoder);
  decode(o.proposer_address, decoder);
  decode(o.grant, decoder);
}

}  // namespace tally::schema
