#include <credence/schema/subject_fields.hpp>

#include <algorithm>

namespace credence::schema {

const std::optional<std::string>& subject_fields::get(
    const subject_field_t field) const {
  switch (field) {
    case subject_field_t::student_name:
      return student_name;
    case subject_field_t::degree_name:
      return degree_name;
    case subject_field_t::institution_name:
      return institution_name;
    case subject_field_t::issuance_date:
      return issuance_date;
    case subject_field_t::certificate_number:
    default:
      return certificate_number;
  }
}

std::optional<std::string>& subject_fields::get(const subject_field_t field) {
  return const_cast<std::optional<std::string>&>(
      static_cast<const subject_fields&>(*this).get(field));
}

bool subject_fields::empty() const {
  return std::ranges::none_of(kKeySubjectFields, [this](const auto field) {
    return get(field).has_value();
  });
}

}  // namespace credence::schema
