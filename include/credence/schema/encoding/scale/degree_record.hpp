#pragma once
#include <credence/schema/degree_record.hpp>
#include <credence/schema/encoding/scale/subject_fields.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credence::schema {

void encode(const revocation<1>& o, ::scale::Encoder& encoder);
void decode(revocation<1>& o, ::scale::Decoder& decoder);

void encode(const degree_record<1>& o, ::scale::Encoder& encoder);
void decode(degree_record<1>& o, ::scale::Decoder& decoder);

}  // namespace credence::schema
