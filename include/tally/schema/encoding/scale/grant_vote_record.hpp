#pragma once
#include <tally/schema/grant_vote_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tally::schema {

void encode(const grant_vote_record<1>& o, ::scale::Encoder& encoder);
void decode(grant_vote_record<1>& o, ::scale::Decoder& decoder);

}  // namespace tally::schema
