#include <credence/schema/encoding/scale/subject_fields.hpp>

namespace credence::schema {

void encode(const subject_fields_t& o, ::scale::Encoder& encoder) {
  encode(o.student_name, encoder);
  encode(o.degree_name, encoder);
  encode(o.institution_name, encoder);
  encode(o.issuance_date, encoder);
  encode(o.certificate_number, encoder);
}

void decode(subject_fields_t& o, ::scale::Decoder& decoder) {
  decode(o.student_name, decoder);
  decode(o.degree_name, decoder);
  decode(o.institution_name, decoder);
  decode(o.issuance_date, decoder);
  decode(o.certificate_number, decoder);
}

}  // namespace credence::schema
