#pragma once

#include <credence/audit/audit_trail.hpp>
#include <credence/common/clock.hpp>
#include <credence/registry/certificate_registry.hpp>
#include <credence/registry/organization_directory.hpp>
#include <credence/schema/confidence_policy.hpp>
#include <credence/schema/operation_result.hpp>
#include <credence/verification/engine.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace credence::service {

struct service_options final {
  credence::registry::directory_policy directory;
  credence::schema::confidence_policy_t confidence_policy{
      credence::schema::confidence_policy_t::simple_average};
};

/// A degree addressed either by its id or by its certificate hash.
using degree_reference_t = std::variant<credence::schema::degree_id_t,
                                        credence::schema::certificate_hash_t>;

/// Library boundary of the registry.
///
/// Wires the organization directory, certificate registry, verification
/// engine and audit trail over one store. Every call returns an
/// operation_result; none of them throws for a business rejection.
class registry_service final {
 public:
  registry_service(credence::scale_encoder_t& encoder,
                   credence::rocksdb_storage_t& storage,
                   service_options options = {},
                   credence::common::clock_fn_t clock =
                       credence::common::system_clock());

  registry_service(const registry_service&) = delete;
  registry_service& operator=(const registry_service&) = delete;

  /// Make sure the attestation authority is enrolled. Idempotent.
  credence::schema::operation_result<credence::schema::organization_t>
  bootstrap();

  credence::schema::operation_result<credence::schema::degree_id_t>
  submit_degree(const credence::schema::organization_id_t& issuer,
                const credence::schema::certificate_hash_t& certificate_hash,
                const credence::schema::subject_fields_t& subject);

  /// Hash `document` with SHA-256 and submit the digest.
  credence::schema::operation_result<credence::schema::degree_id_t>
  submit_document(const credence::schema::organization_id_t& issuer,
                  const credence::schema::bytes_view_t& document,
                  const credence::schema::subject_fields_t& subject);

  credence::schema::operation_result<credence::schema::verification_result_t>
  verify(std::string_view certificate_hash,
         const std::optional<credence::schema::subject_fields_t>& presented,
         const credence::schema::organization_id_t& verifier);

  credence::schema::operation_result<credence::schema::degree_record_t> revoke(
      const credence::schema::degree_id_t& degree_id,
      const std::string& reason,
      const credence::schema::organization_id_t& acting_organization);

  credence::schema::operation_result<credence::schema::degree_record_t>
  get_degree(const degree_reference_t& reference) const;

  /// Verification events of a registered degree, newest first.
  credence::schema::operation_result<
      std::vector<credence::schema::verification_event_t>>
  get_verification_history(
      const credence::schema::degree_id_t& degree_id) const;

  credence::schema::operation_result<
      std::vector<credence::schema::revocation_event_t>>
  get_revocation_history(const credence::schema::degree_id_t& degree_id) const;

  credence::schema::operation_result<
      std::vector<credence::schema::degree_record_t>>
  list_degrees_by_issuer(
      const credence::schema::organization_id_t& issuer) const;

  credence::schema::operation_result<credence::schema::organization_t>
  register_organization(
      const credence::schema::organization_id_t& organization_id,
      const credence::schema::organization_metadata_t& metadata,
      const credence::schema::amount_t& stake);

  credence::schema::operation_result<credence::schema::organization_t>
  approve_organization(
      const credence::schema::organization_id_t& organization_id,
      const credence::schema::organization_id_t& acting_organization);

  credence::schema::operation_result<credence::schema::organization_t>
  suspend_organization(
      const credence::schema::organization_id_t& organization_id,
      const std::string& reason,
      const credence::schema::organization_id_t& acting_organization);

  credence::schema::operation_result<credence::schema::organization_t>
  blacklist_organization(
      const credence::schema::organization_id_t& organization_id,
      const std::string& reason,
      const credence::schema::organization_id_t& acting_organization);

  credence::schema::operation_result<credence::schema::organization_t>
  get_organization(
      const credence::schema::organization_id_t& organization_id) const;

  credence::schema::operation_result<
      std::vector<credence::schema::organization_t>>
  list_organizations() const;

  /// Replace the listener notified after every committed audit event.
  void set_event_listener(credence::audit::event_listener_t listener);

 private:
  credence::registry::organization_directory directory_;
  credence::audit::audit_trail audit_;
  credence::registry::certificate_registry registry_;
  credence::verification::engine engine_;
};

}  // namespace credence::service
