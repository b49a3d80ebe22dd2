#pragma once

#include <credence/schema/primitives.hpp>
#include <credence/schema/verification_method.hpp>
#include <optional>

namespace credence::schema {

struct verification_result final {
  bool verified{};
  double confidence{};
  std::optional<degree_id_t> degree_id;
  verification_method_t method{verification_method_t::hash_not_found};
  // Set when presented fields overlapped the stored ones.
  std::optional<double> field_confidence;
  // Set when the decision was written to the audit trail.
  std::optional<event_id_t> event_id;
};

using verification_result_t = verification_result;

}  // namespace credence::schema
