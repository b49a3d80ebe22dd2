#pragma once

#include <credence/schema/primitives.hpp>
#include <string>

namespace credence::schema {

template <uint16_t Version>
struct revocation_event;

template <>
struct revocation_event<1> final {
  uint16_t version{1};
  event_id_t event_id{};
  degree_id_t degree_id{};
  organization_id_t acting_organization;
  std::string reason;
  timestamp_milliseconds_t recorded_at{};
};

using revocation_event_t = revocation_event<1>;

}  // namespace credence::schema
