#pragma once

#include <credence/schema/primitives.hpp>
#include <string>

namespace credence::schema {

template <uint16_t Version>
struct revocation;

template <>
struct revocation<1> final {
  uint16_t version{1};
  std::string reason;
  organization_id_t revoked_by;
  timestamp_milliseconds_t revoked_at{};
};

using revocation_t = revocation<1>;

}  // namespace credence::schema
