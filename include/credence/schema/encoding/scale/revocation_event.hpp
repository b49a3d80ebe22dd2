#pragma once
#include <credence/schema/revocation_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credence::schema {

void encode(const revocation_event<1>& o, ::scale::Encoder& encoder);
void decode(revocation_event<1>& o, ::scale::Decoder& decoder);

}  // namespace credence::schema
