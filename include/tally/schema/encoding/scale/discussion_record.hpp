#pragma once
#include <tally/schema/discussion_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tally::schema {

void encode(const discussion_record<1>& o, ::scale::Encoder& encoder);
void decode(discussion_record<1>& o, ::scale::Decoder& decoder);

}  // namespace tally::schema
