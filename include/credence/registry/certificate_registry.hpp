#pragma once

#include <credence/audit/audit_trail.hpp>
#include <credence/common/clock.hpp>
#include <credence/common/key_lock.hpp>
#include <credence/registry/organization_directory.hpp>
#include <credence/schema/degree_record.hpp>
#include <credence/schema/encoding/scale/encoder.hpp>
#include <credence/schema/operation_result.hpp>
#include <credence/storage/rocksdb/storage.hpp>
#include <optional>
#include <string>
#include <vector>

namespace credence::registry {

/// Canonical store of degree records.
///
/// Records are keyed by degree id with secondary indexes on certificate hash
/// (unique) and issuer. A certificate hash maps to at most one record, also
/// under concurrent submissions: the uniqueness check and the insert are one
/// compare-and-write. Status only moves ACTIVE -> REVOKED.
class certificate_registry final {
 public:
  certificate_registry(credence::scale_encoder_t& encoder,
                       credence::rocksdb_storage_t& storage,
                       organization_directory& directory,
                       credence::audit::audit_trail& audit,
                       credence::common::clock_fn_t clock =
                           credence::common::system_clock());

  certificate_registry(const certificate_registry&) = delete;
  certificate_registry& operator=(const certificate_registry&) = delete;

  /// Register a certificate for an ACTIVE issuer.
  ///
  /// Fails with issuer_not_eligible, invalid_hash (not 64 lowercase hex) or
  /// duplicate_certificate. An existing record is never overwritten.
  credence::schema::operation_result<credence::schema::degree_id_t> submit(
      const credence::schema::organization_id_t& issuer,
      const credence::schema::certificate_hash_t& certificate_hash,
      const credence::schema::subject_fields_t& subject);

  credence::schema::operation_result<credence::schema::degree_record_t> lookup(
      const credence::schema::certificate_hash_t& certificate_hash) const;

  credence::schema::operation_result<credence::schema::degree_record_t>
  get_by_id(const credence::schema::degree_id_t& degree_id) const;

  /// Move a degree to REVOKED. Only the attestation authority may revoke.
  /// The record update and its revocation audit event are one atomic write.
  credence::schema::operation_result<credence::schema::degree_record_t> revoke(
      const credence::schema::degree_id_t& degree_id,
      const std::string& reason,
      const credence::schema::organization_id_t& acting_organization);

  /// Commit one verification decision on `event.degree_id`.
  ///
  /// The counter bump, last_verified_at and the audit event are one atomic
  /// write under the degree lock. A degree that is REVOKED at commit time
  /// keeps its counter and the event is rewritten as a DEGREE_REVOKED
  /// decision. Returns the committed event.
  credence::schema::operation_result<credence::schema::verification_event_t>
  record_verification(credence::schema::verification_event_t event);

  /// Degrees submitted by `issuer`, oldest submission first.
  credence::schema::operation_result<
      std::vector<credence::schema::degree_record_t>>
  list_by_issuer(const credence::schema::organization_id_t& issuer) const;

 private:
  std::optional<credence::schema::degree_record_t> load(
      const credence::schema::degree_id_t& degree_id) const;

  credence::scale_encoder_t& encoder_;
  credence::rocksdb_storage_t& storage_;
  organization_directory& directory_;
  credence::audit::audit_trail& audit_;
  credence::common::clock_fn_t clock_;
  credence::common::key_lock_table hash_locks_;
  credence::common::key_lock_table degree_locks_;
};

/// Degree id derived from a certificate hash.
credence::schema::degree_id_t make_degree_id(
    const credence::schema::certificate_hash_t& certificate_hash);

}  // namespace credence::registry
