#include <spdlog/spdlog.h>
#include <credence/verification/engine.hpp>
#include <credence/verification/field_similarity.hpp>

using namespace credence::schema;

namespace {

constexpr auto kCodespace = "credence.verification";

}  // namespace

namespace credence::verification {

double combine_confidence(const confidence_policy_t policy,
                          const double field_confidence) {
  constexpr auto kHashConfidence = 1.0;
  switch (policy) {
    case confidence_policy_t::simple_average:
      return (kHashConfidence + field_confidence) / 2.0;
    case confidence_policy_t::weighted_blend:
      return kHashWeight * kHashConfidence + kFieldWeight * field_confidence;
  }
  return (kHashConfidence + field_confidence) / 2.0;
}

engine::engine(credence::registry::certificate_registry& registry,
               const confidence_policy_t policy)
    : registry_{registry}, policy_{policy} {
  spdlog::debug("Verification engine uses {} confidence policy",
                to_string(policy_));
}

operation_result<verification_result_t> engine::verify(
    const std::string_view certificate_hash,
    const std::optional<subject_fields_t>& presented,
    const organization_id_t& verifier) {
  if (verifier.empty()) {
    return make_failure<verification_result_t>(
        error_code::validation_failed, kCodespace, "verifier is required");
  }
  auto canonical = canonicalize_certificate_hash(certificate_hash);
  if (!is_certificate_hash(canonical)) {
    spdlog::warn("Rejecting verification by '{}': malformed hash", verifier);
    return make_failure<verification_result_t>(
        error_code::invalid_hash, kCodespace,
        "certificate hash must be 64 hex characters",
        std::string{certificate_hash});
  }

  auto degree = registry_.lookup(canonical);
  if (degree.code == error_code::degree_not_found) {
    spdlog::info("Verification by '{}': certificate {} not registered",
                 verifier, canonical);
    auto result = verification_result_t{};
    result.verified = false;
    result.confidence = 0.0;
    result.method = verification_method_t::hash_not_found;
    return make_success(std::move(result));
  }
  if (!degree) {
    return forward_failure<verification_result_t>(degree);
  }

  auto result = verification_result_t{};
  result.degree_id = degree.value->degree_id;

  if (degree.value->status == degree_status_t::revoked) {
    result.verified = false;
    result.confidence = 0.0;
    result.method = verification_method_t::degree_revoked;
    return record(*degree.value, std::move(result), verifier);
  }

  auto combined = 1.0;
  result.method = verification_method_t::hash_only;
  if (presented) {
    auto report = compare_fields(*presented, degree.value->subject);
    if (report.field_confidence) {
      combined = combine_confidence(policy_, *report.field_confidence);
      result.field_confidence = report.field_confidence;
      result.method = verification_method_t::hash_and_fields;
    }
  }
  result.confidence = combined;
  result.verified = combined >= kVerifiedThreshold;
  return record(*degree.value, std::move(result), verifier);
}

operation_result<verification_result_t> engine::record(
    const degree_record_t& degree,
    verification_result_t result,
    const organization_id_t& verifier) {
  auto event = verification_event_t{};
  event.degree_id = degree.degree_id;
  event.verifier = verifier;
  event.method = result.method;
  event.confidence = result.confidence;
  event.verified = result.verified;
  event.extracted_hash = degree.certificate_hash;

  auto committed = registry_.record_verification(std::move(event));
  if (!committed) {
    return forward_failure<verification_result_t>(committed);
  }
  // The degree may have been revoked since it was read.
  if (committed.value->method == verification_method_t::degree_revoked) {
    result.verified = false;
    result.confidence = 0.0;
    result.method = verification_method_t::degree_revoked;
    result.field_confidence.reset();
  }
  result.event_id = committed.value->event_id;
  spdlog::info("Verification {} of degree {} by '{}': {} confidence {:.3f}",
               result.event_id.value(), to_hex(degree.degree_id), verifier,
               to_string(result.method), result.confidence);
  return make_success(std::move(result));
}

}  // namespace credence::verification
