#pragma once
#include <credence/schema/organization.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credence::schema {

void encode(const organization<1>& o, ::scale::Encoder& encoder);
void decode(organization<1>& o, ::scale::Decoder& decoder);

}  // namespace credence::schema
