#pragma once
#include <credence/schema/enum_string.hpp>
#include <cstdint>

// Schema type: confidence policy.
// Verification workflow: how the hash factor and the field factor combine
// into one confidence score.
namespace credence::schema {

enum class confidence_policy_t : uint8_t {
  // (hash + fields) / 2
  simple_average = 0,
  // 0.7 * hash + 0.3 * fields
  weighted_blend = 1
};

inline constexpr enum_names_t<confidence_policy_t, 2> kConfidencePolicyNames{{
    {"simple-average", confidence_policy_t::simple_average},
    {"weighted-blend", confidence_policy_t::weighted_blend},
}};

constexpr std::string_view to_string(const confidence_policy_t value) {
  return to_string(value, kConfidencePolicyNames);
}

}  // namespace credence::schema
