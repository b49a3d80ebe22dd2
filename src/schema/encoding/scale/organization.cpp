#include <credence/schema/encoding/scale/organization.hpp>

namespace credence::schema {

void encode(const organization<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.organization_id, encoder);
  encode(o.name, encoder);
  encode(o.country, encoder);
  encode(o.contact_email, encoder);
  encode(o.stake, encoder);
  encode(static_cast<uint8_t>(o.status), encoder);
  encode(o.status_reason, encoder);
  encode(o.enrolled_at, encoder);
  encode(o.updated_at, encoder);
}

void decode(organization<1>& o, ::scale::Decoder& decoder) {
  auto status = uint8_t{};
  decode(o.version, decoder);
  decode(o.organization_id, decoder);
  decode(o.name, decoder);
  decode(o.country, decoder);
  decode(o.contact_email, decoder);
  decode(o.stake, decoder);
  decode(status, decoder);
  decode(o.status_reason, decoder);
  decode(o.enrolled_at, decoder);
  decode(o.updated_at, decoder);
  o.status = static_cast<organization_status_t>(status);
}

}  // namespace credence::schema
