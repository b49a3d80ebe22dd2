#include <credence/schema/encoding/scale/verification_event.hpp>

#include <bit>

namespace credence::schema {

// SCALE has no floating point type; confidence travels as its IEEE-754 bits.
void encode(const verification_event<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.degree_id, encoder);
  encode(o.verifier, encoder);
  encode(static_cast<uint8_t>(o.method), encoder);
  encode(std::bit_cast<uint64_t>(o.confidence), encoder);
  encode(o.verified, encoder);
  encode(o.extracted_hash, encoder);
  encode(o.recorded_at, encoder);
}

void decode(verification_event<1>& o, ::scale::Decoder& decoder) {
  auto method = uint8_t{};
  auto confidence_bits = uint64_t{};
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.degree_id, decoder);
  decode(o.verifier, decoder);
  decode(method, decoder);
  decode(confidence_bits, decoder);
  decode(o.verified, decoder);
  decode(o.extracted_hash, decoder);
  decode(o.recorded_at, decoder);
  o.method = static_cast<verification_method_t>(method);
  o.confidence = std::bit_cast<double>(confidence_bits);
}

}  // namespace credence::schema
