#include <tally/schema/encoding/scale/discussion_record.hpp>

namespace tally::schema {

void encode(const discussion_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.proposal, encoder);
  encode(o.speaker_index, encoder);
  encode(o.speaker_address, encoder);
  encode(o.data, encoder);
  encode(o.height, encoder);
  encode(o.ordinal, encoder);
}

void decode(discussion_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.proposal, decoder);
  decode(o.speaker_index, decoder);
  decode(o.speaker_address, decoder);
  decode(o.data, decoder);
  decode(o.height, decoder);
  decode(o.ordinal, decoder);
}

}  // namespace tally::schema
