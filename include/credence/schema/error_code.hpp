#pragma once

#include <credence/schema/enum_string.hpp>
#include <cstdint>

// Schema type: error code.
// Registry workflow: stable numeric codes for every rejection the core can
// report. Business rejections are below 100; internal_error is reserved for
// backend failures and is never returned for a rule violation.
namespace credence::schema {

enum class error_code : uint32_t {
  ok = 0,
  validation_failed = 1,
  invalid_hash = 2,
  duplicate_certificate = 3,
  issuer_not_eligible = 4,
  degree_not_found = 5,
  already_revoked = 6,
  unauthorized = 7,
  insufficient_stake = 8,
  duplicate_organization = 9,
  organization_not_found = 10,
  invalid_status_transition = 11,
  internal_error = 100,
};

inline constexpr enum_names_t<error_code, 13> kErrorCodeNames{{
    {"OK", error_code::ok},
    {"VALIDATION_ERROR", error_code::validation_failed},
    {"INVALID_HASH", error_code::invalid_hash},
    {"DUPLICATE_CERTIFICATE", error_code::duplicate_certificate},
    {"ISSUER_NOT_ELIGIBLE", error_code::issuer_not_eligible},
    {"DEGREE_NOT_FOUND", error_code::degree_not_found},
    {"ALREADY_REVOKED", error_code::already_revoked},
    {"UNAUTHORIZED", error_code::unauthorized},
    {"INSUFFICIENT_STAKE", error_code::insufficient_stake},
    {"DUPLICATE_ORGANIZATION", error_code::duplicate_organization},
    {"ORGANIZATION_NOT_FOUND", error_code::organization_not_found},
    {"INVALID_STATUS_TRANSITION", error_code::invalid_status_transition},
    {"INTERNAL_ERROR", error_code::internal_error},
}};

constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeNames);
}

}  // namespace credence::schema
