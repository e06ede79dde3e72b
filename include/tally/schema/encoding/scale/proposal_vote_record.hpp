#pragma once
#include <tally/schema/proposal_vote_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tally::schema {

void encode(const proposal_vote_record<1>& o, ::scale::Encoder& encoder);
void decode(proposal_vote_record<1>& o, ::scale::Decoder& decoder);

}  // namespace tally::schema
