#pragma once
#include <credence/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: subject fields.
// Registry workflow: the printed fields of a certificate. Stored on submission
// and presented again (OCR output) on verification; any field may be absent.
namespace credence::schema {

enum class subject_field_t : uint8_t {
  student_name = 0,
  degree_name = 1,
  institution_name = 2,
  issuance_date = 3,
  certificate_number = 4
};

inline constexpr enum_names_t<subject_field_t, 5> kSubjectFieldNames{{
    {"studentName", subject_field_t::student_name},
    {"degreeName", subject_field_t::degree_name},
    {"institutionName", subject_field_t::institution_name},
    {"issuanceDate", subject_field_t::issuance_date},
    {"certificateNumber", subject_field_t::certificate_number},
}};

// Fields compared by the verification engine, in comparison order.
inline constexpr std::array<subject_field_t, 5> kKeySubjectFields{
    subject_field_t::student_name, subject_field_t::degree_name,
    subject_field_t::institution_name, subject_field_t::issuance_date,
    subject_field_t::certificate_number};

constexpr std::string_view to_string(const subject_field_t value) {
  return to_string(value, kSubjectFieldNames);
}

struct subject_fields final {
  std::optional<std::string> student_name;
  std::optional<std::string> degree_name;
  std::optional<std::string> institution_name;
  std::optional<std::string> issuance_date;
  std::optional<std::string> certificate_number;

  const std::optional<std::string>& get(subject_field_t field) const;
  std::optional<std::string>& get(subject_field_t field);

  bool empty() const;

  bool operator==(const subject_fields&) const = default;
};

using subject_fields_t = subject_fields;

}  // namespace credence::schema
