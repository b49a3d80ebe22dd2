#pragma once
#include <credence/schema/enum_string.hpp>
#include <cstdint>

// Schema type: verification method.
// Verification workflow: which evidence produced a decision.
namespace credence::schema {

enum class verification_method_t : uint8_t {
  hash_not_found = 0,
  degree_revoked = 1,
  hash_only = 2,
  hash_and_fields = 3
};

inline constexpr enum_names_t<verification_method_t, 4>
    kVerificationMethodNames{{
        {"HASH_NOT_FOUND", verification_method_t::hash_not_found},
        {"DEGREE_REVOKED", verification_method_t::degree_revoked},
        {"HASH_ONLY", verification_method_t::hash_only},
        {"HASH_AND_FIELDS", verification_method_t::hash_and_fields},
    }};

constexpr std::string_view to_string(const verification_method_t value) {
  return to_string(value, kVerificationMethodNames);
}

}  // namespace credence::schema
