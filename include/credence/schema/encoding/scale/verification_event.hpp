#pragma once
#include <credence/schema/verification_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credence::schema {

void encode(const verification_event<1>& o, ::scale::Encoder& encoder);
void decode(verification_event<1>& o, ::scale::Decoder& decoder);

}  // namespace credence::schema
