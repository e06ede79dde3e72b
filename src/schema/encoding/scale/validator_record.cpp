#include <tally/schema/encoding/scale/validator_record.hpp>

namespace tally::schema {

void encode(const validator_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.address, encoder);
  encode(o.agent_url, encoder);
  encode(o.stake, encoder);
}

void decode(validator_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.address, decoder);
  decode(o.agent_url, decoder);
  decode(o.stake, decoder);
}

}  // namespace tally::schema
