#pragma once
#include <credence/schema/enum_string.hpp>
#include <cstdint>

// Schema type: degree status.
// Registry workflow: a degree is active from submission until the attestation
// authority revokes it; revoked is terminal.
namespace credence::schema {

enum class degree_status_t : uint8_t { active = 0, revoked = 1 };

inline constexpr enum_names_t<degree_status_t, 2> kDegreeStatusNames{{
    {"ACTIVE", degree_status_t::active},
    {"REVOKED", degree_status_t::revoked},
}};

constexpr std::string_view to_string(const degree_status_t value) {
  return to_string(value, kDegreeStatusNames);
}

}  // namespace credence::schema
