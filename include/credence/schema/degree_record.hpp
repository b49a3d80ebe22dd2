#pragma once

#include <credence/schema/degree_status.hpp>
#include <credence/schema/primitives.hpp>
#include <credence/schema/revocation.hpp>
#include <credence/schema/subject_fields.hpp>
#include <optional>

namespace credence::schema {

template <uint16_t Version>
struct degree_record;

template <>
struct degree_record<1> final {
  uint16_t version{1};
  degree_id_t degree_id{};
  certificate_hash_t certificate_hash;
  organization_id_t issuer;
  subject_fields_t subject;
  degree_status_t status{degree_status_t::active};
  uint64_t verification_count{};
  std::optional<timestamp_milliseconds_t> last_verified_at;
  timestamp_milliseconds_t submitted_at{};
  // Present iff status is revoked.
  std::optional<revocation_t> revocation;
};

using degree_record_t = degree_record<1>;

}  // namespace credence::schema
