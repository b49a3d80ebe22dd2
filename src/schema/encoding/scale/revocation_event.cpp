#include <credence/schema/encoding/scale/revocation_event.hpp>

namespace credence::schema {

void encode(const revocation_event<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.degree_id, encoder);
  encode(o.acting_organization, encoder);
  encode(o.reason, encoder);
  encode(o.recorded_at, encoder);
}

void decode(revocation_event<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.degree_id, decoder);
  decode(o.acting_organization, decoder);
  decode(o.reason, decoder);
  decode(o.recorded_at, decoder);
}

}  // namespace credence::schema
