#pragma once

#include <credence/schema/primitives.hpp>
#include <credence/schema/verification_method.hpp>

namespace credence::schema {

template <uint16_t Version>
struct verification_event;

template <>
struct verification_event<1> final {
  uint16_t version{1};
  event_id_t event_id{};
  degree_id_t degree_id{};
  organization_id_t verifier;
  verification_method_t method{verification_method_t::hash_not_found};
  double confidence{};
  bool verified{};
  certificate_hash_t extracted_hash;
  timestamp_milliseconds_t recorded_at{};
};

using verification_event_t = verification_event<1>;

}  // namespace credence::schema
