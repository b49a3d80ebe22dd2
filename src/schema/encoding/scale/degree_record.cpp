#include <credence/schema/encoding/scale/degree_record.hpp>

namespace credence::schema {

void encode(const revocation<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.reason, encoder);
  encode(o.revoked_by, encoder);
  encode(o.revoked_at, encoder);
}

void decode(revocation<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.reason, decoder);
  decode(o.revoked_by, decoder);
  decode(o.revoked_at, decoder);
}

void encode(const degree_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.degree_id, encoder);
  encode(o.certificate_hash, encoder);
  encode(o.issuer, encoder);
  encode(o.subject, encoder);
  encode(static_cast<uint8_t>(o.status), encoder);
  encode(o.verification_count, encoder);
  encode(o.last_verified_at, encoder);
  encode(o.submitted_at, encoder);
  encode(o.revocation, encoder);
}

void decode(degree_record<1>& o, ::scale::Decoder& decoder) {
  auto status = uint8_t{};
  decode(o.version, decoder);
  decode(o.degree_id, decoder);
  decode(o.certificate_hash, decoder);
  decode(o.issuer, decoder);
  decode(o.subject, decoder);
  decode(status, decoder);
  decode(o.verification_count, decoder);
  decode(o.last_verified_at, decoder);
  decode(o.submitted_at, decoder);
  decode(o.revocation, decoder);
  o.status = static_cast<degree_status_t>(status);
}

}  // namespace credence::schema
