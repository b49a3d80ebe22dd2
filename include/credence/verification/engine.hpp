#pragma once

#include <credence/registry/certificate_registry.hpp>
#include <credence/schema/confidence_policy.hpp>
#include <credence/schema/operation_result.hpp>
#include <credence/schema/subject_fields.hpp>
#include <credence/schema/verification_result.hpp>
#include <optional>
#include <string_view>

namespace credence::verification {

// A decision is "verified" when the combined confidence reaches this.
inline constexpr double kVerifiedThreshold = 0.8;
inline constexpr double kHashWeight = 0.7;
inline constexpr double kFieldWeight = 0.3;

/// Combine the hash factor (always 1 for a registered degree) with the field
/// confidence under `policy`.
double combine_confidence(credence::schema::confidence_policy_t policy,
                          double field_confidence);

/// Decides whether a presented certificate is authentic.
///
/// The hash must match a registered degree; presented subject fields, when
/// they overlap the stored ones, scale the confidence. Every decision on a
/// registered degree bumps its verification counter (unless revoked) and
/// appends one verification event in the same write. The status seen at
/// commit time wins over the status read for scoring. The engine never
/// changes degree status.
class engine final {
 public:
  engine(credence::registry::certificate_registry& registry,
         credence::schema::confidence_policy_t policy =
             credence::schema::confidence_policy_t::simple_average);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Verify a presented certificate hash for `verifier`.
  ///
  /// The hash is trimmed and lower-cased first; anything that is then not 64
  /// hex characters fails with invalid_hash. An unknown hash is a successful
  /// call with method HASH_NOT_FOUND and nothing recorded.
  credence::schema::operation_result<credence::schema::verification_result_t>
  verify(std::string_view certificate_hash,
         const std::optional<credence::schema::subject_fields_t>& presented,
         const credence::schema::organization_id_t& verifier);

  credence::schema::confidence_policy_t policy() const { return policy_; }

 private:
  credence::schema::operation_result<credence::schema::verification_result_t>
  record(const credence::schema::degree_record_t& degree,
         credence::schema::verification_result_t result,
         const credence::schema::organization_id_t& verifier);

  credence::registry::certificate_registry& registry_;
  credence::schema::confidence_policy_t policy_;
};

}  // namespace credence::verification
