#pragma once

#include <credence/common/clock.hpp>
#include <credence/common/key_lock.hpp>
#include <credence/registry/lifecycle.hpp>
#include <credence/schema/encoding/scale/encoder.hpp>
#include <credence/schema/operation_result.hpp>
#include <credence/schema/organization.hpp>
#include <credence/storage/rocksdb/storage.hpp>
#include <optional>
#include <string>
#include <vector>

namespace credence::registry {

inline constexpr std::string_view kDefaultAuthorityId{"ATTESTATION_AUTHORITY"};
inline constexpr uint64_t kDefaultMinimumStake{1000};

struct directory_policy final {
  credence::schema::organization_id_t authority_id{kDefaultAuthorityId};
  credence::schema::amount_t minimum_stake{kDefaultMinimumStake};
};

/// Identity and standing of every enrolled organization.
///
/// Organizations are never deleted; they only move through
/// PENDING -> ACTIVE <-> SUSPENDED and into the terminal BLACKLISTED status.
/// Status changes are reserved for the attestation authority.
class organization_directory final {
 public:
  organization_directory(credence::scale_encoder_t& encoder,
                         credence::rocksdb_storage_t& storage,
                         directory_policy policy = {},
                         credence::common::clock_fn_t clock =
                             credence::common::system_clock());

  organization_directory(const organization_directory&) = delete;
  organization_directory& operator=(const organization_directory&) = delete;

  /// Enroll the attestation authority as ACTIVE with zero stake unless it is
  /// already present.
  credence::schema::operation_result<credence::schema::organization_t>
  bootstrap();

  /// Enroll a new organization in PENDING status.
  credence::schema::operation_result<credence::schema::organization_t>
  register_organization(
      const credence::schema::organization_id_t& organization_id,
      const credence::schema::organization_metadata_t& metadata,
      const credence::schema::amount_t& stake);

  credence::schema::operation_result<credence::schema::organization_t> approve(
      const credence::schema::organization_id_t& organization_id,
      const credence::schema::organization_id_t& acting_organization);

  credence::schema::operation_result<credence::schema::organization_t> suspend(
      const credence::schema::organization_id_t& organization_id,
      const std::string& reason,
      const credence::schema::organization_id_t& acting_organization);

  /// Existing degree records of a blacklisted issuer stay as they are.
  credence::schema::operation_result<credence::schema::organization_t>
  blacklist(const credence::schema::organization_id_t& organization_id,
            const std::string& reason,
            const credence::schema::organization_id_t& acting_organization);

  credence::schema::operation_result<credence::schema::organization_t> get(
      const credence::schema::organization_id_t& organization_id) const;

  /// All organizations ordered by id.
  credence::schema::operation_result<
      std::vector<credence::schema::organization_t>>
  list() const;

  /// True iff the organization exists and is ACTIVE. Throws storage_error
  /// when the store cannot be read.
  bool is_eligible_issuer(
      const credence::schema::organization_id_t& organization_id) const;

  bool is_attestation_authority(
      const credence::schema::organization_id_t& organization_id) const;

  const directory_policy& policy() const { return policy_; }

 private:
  credence::schema::operation_result<credence::schema::organization_t>
  transition(const credence::schema::organization_id_t& organization_id,
             organization_transition_t transition,
             const std::optional<std::string>& reason,
             const credence::schema::organization_id_t& acting_organization);

  std::optional<credence::schema::organization_t> load(
      const credence::schema::organization_id_t& organization_id) const;

  credence::scale_encoder_t& encoder_;
  credence::rocksdb_storage_t& storage_;
  directory_policy policy_;
  credence::common::clock_fn_t clock_;
  credence::common::key_lock_table locks_;
};

/// True iff `organization_id` is 2..64 characters of [A-Z0-9_-].
bool is_valid_organization_id(std::string_view organization_id);

}  // namespace credence::registry
