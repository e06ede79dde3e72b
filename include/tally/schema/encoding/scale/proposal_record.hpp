#pragma once
#include <tally/schema/proposal_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tally::schema {

void encode(const proposal_record<1>& o, ::scale::Encoder& encoder);
void decode(proposal_record<1>& o, ::scale::Decoder& decoder);

}  // namespace tally::schema
