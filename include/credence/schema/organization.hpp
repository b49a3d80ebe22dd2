#pragma once

#include <credence/schema/organization_status.hpp>
#include <credence/schema/primitives.hpp>
#include <optional>
#include <string>

namespace credence::schema {

/// Caller-supplied descriptive data for an enrolling organization.
struct organization_metadata final {
  std::string name;
  std::string country;
  std::string contact_email;
};

using organization_metadata_t = organization_metadata;

template <uint16_t Version>
struct organization;

template <>
struct organization<1> final {
  uint16_t version{1};
  organization_id_t organization_id;
  std::string name;
  std::string country;
  std::string contact_email;
  amount_t stake;
  organization_status_t status{organization_status_t::pending};
  // Reason given for the latest suspension or blacklisting.
  std::optional<std::string> status_reason;
  timestamp_milliseconds_t enrolled_at{};
  timestamp_milliseconds_t updated_at{};
};

using organization_t = organization<1>;

}  // namespace credence::schema
