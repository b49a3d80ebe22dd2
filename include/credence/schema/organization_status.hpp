#pragma once
#include <credence/schema/enum_string.hpp>
#include <cstdint>

// Schema type: organization status.
// Registry workflow: enrollment lifecycle of an issuer or verifier; only
// active organizations may submit degrees.
namespace credence::schema {

enum class organization_status_t : uint8_t {
  pending = 0,
  active = 1,
  suspended = 2,
  blacklisted = 3
};

inline constexpr enum_names_t<organization_status_t, 4>
    kOrganizationStatusNames{{
        {"PENDING", organization_status_t::pending},
        {"ACTIVE", organization_status_t::active},
        {"SUSPENDED", organization_status_t::suspended},
        {"BLACKLISTED", organization_status_t::blacklisted},
    }};

constexpr std::string_view to_string(const organization_status_t value) {
  return to_string(value, kOrganizationStatusNames);
}

}  // namespace credence::schema
