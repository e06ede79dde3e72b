#pragma once
#include <tally/schema/validator_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tally::schema {

void encode(const validator_record<1>& o, ::scale::Encoder& encoder);
void decode(validator_record<1>& o, ::scale::Decoder& decoder);

}  // namespace tally::schema
