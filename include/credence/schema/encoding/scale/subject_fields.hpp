#pragma once
#include <credence/schema/subject_fields.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credence::schema {

void encode(const subject_fields_t& o, ::scale::Encoder& encoder);
void decode(subject_fields_t& o, ::scale::Decoder& decoder);

}  // namespace credence::schema
