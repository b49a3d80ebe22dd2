#include <spdlog/spdlog.h>
#include <algorithm>
#include <credence/registry/organization_directory.hpp>
#include <credence/schema/key/registry_keys.hpp>

using namespace credence::schema;

namespace {

constexpr auto kCodespace = "credence.directory";
constexpr std::size_t kMinimumOrganizationIdLength = 2;
constexpr std::size_t kMaximumOrganizationIdLength = 64;

template <typename T>
operation_result<T> storage_failure(
    const credence::storage::storage_error& ex) {
  spdlog::error("Organization directory storage failure: {}", ex.what());
  return make_failure<T>(error_code::internal_error, kCodespace,
                         "storage failure", ex.what());
}

}  // namespace

namespace credence::registry {

bool is_valid_organization_id(const std::string_view organization_id) {
  if (organization_id.size() < kMinimumOrganizationIdLength ||
      organization_id.size() > kMaximumOrganizationIdLength) {
    return false;
  }
  return std::ranges::all_of(organization_id, [](const char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
           c == '-';
  });
}

organization_directory::organization_directory(
    credence::scale_encoder_t& encoder,
    credence::rocksdb_storage_t& storage,
    directory_policy policy,
    credence::common::clock_fn_t clock)
    : encoder_{encoder},
      storage_{storage},
      policy_{std::move(policy)},
      clock_{std::move(clock)} {}

operation_result<organization_t> organization_directory::bootstrap() {
  auto lock = locks_.lock(policy_.authority_id);
  try {
    if (auto existing = load(policy_.authority_id)) {
      return make_success(std::move(*existing));
    }
    auto now = clock_();
    auto authority = organization_t{};
    authority.organization_id = policy_.authority_id;
    authority.name = "Attestation Authority";
    authority.stake = 0;
    authority.status = organization_status_t::active;
    authority.enrolled_at = now;
    authority.updated_at = now;
    auto key = key::make_organization_key(encoder_, authority.organization_id);
    storage_.put(encoder_, bytes_view_t{key.data(), key.size()}, authority);
    spdlog::info("Bootstrapped attestation authority '{}'",
                 authority.organization_id);
    return make_success(std::move(authority));
  } catch (const credence::storage::storage_error& ex) {
    return storage_failure<organization_t>(ex);
  }
}

operation_result<organization_t> organization_directory::register_organization(
    const organization_id_t& organization_id,
    const organization_metadata_t& metadata,
    const amount_t& stake) {
  if (!is_valid_organization_id(organization_id)) {
    spdlog::warn("Rejecting registration: malformed organization id '{}'",
                 organization_id);
    return make_failure<organization_t>(
        error_code::validation_failed, kCodespace,
        "organization id must be 2-64 characters of A-Z, 0-9, '_' or '-'",
        organization_id);
  }
  if (metadata.name.empty()) {
    return make_failure<organization_t>(error_code::validation_failed,
                                        kCodespace,
                                        "organization name is required",
                                        organization_id);
  }
  if (stake < policy_.minimum_stake) {
    spdlog::warn("Rejecting registration of '{}': stake {} below minimum {}",
                 organization_id, stake.str(), policy_.minimum_stake.str());
    return make_failure<organization_t>(
        error_code::insufficient_stake, kCodespace, "insufficient stake",
        "required " + policy_.minimum_stake.str() + ", provided " +
            stake.str());
  }

  auto lock = locks_.lock(organization_id);
  try {
    auto key = key::make_organization_key(encoder_, organization_id);
    auto now = clock_();
    auto organization = organization_t{};
    organization.organization_id = organization_id;
    organization.name = metadata.name;
    organization.country = metadata.country;
    organization.contact_email = metadata.contact_email;
    organization.stake = stake;
    organization.status = organization_status_t::pending;
    organization.enrolled_at = now;
    organization.updated_at = now;

    auto entries = std::vector<credence::storage::key_value_entry_t>{};
    entries.emplace_back(key, encoder_.encode(organization));
    if (!storage_.compare_and_write(bytes_view_t{key.data(), key.size()},
                                    std::nullopt, entries)) {
      spdlog::warn("Rejecting registration: organization '{}' exists",
                   organization_id);
      return make_failure<organization_t>(error_code::duplicate_organization,
                                          kCodespace,
                                          "organization already registered",
                                          organization_id);
    }
    spdlog::info("Registered organization '{}' ({}) pending approval",
                 organization_id, organization.name);
    return make_success(std::move(organization));
  } catch (const credence::storage::storage_error& ex) {
    return storage_failure<organization_t>(ex);
  }
}

operation_result<organization_t> organization_directory::approve(
    const organization_id_t& organization_id,
    const organization_id_t& acting_organization) {
  return transition(organization_id, organization_transition_t::approve,
                    std::nullopt, acting_organization);
}

operation_result<organization_t> organization_directory::suspend(
    const organization_id_t& organization_id,
    const std::string& reason,
    const organization_id_t& acting_organization) {
  return transition(organization_id, organization_transition_t::suspend,
                    reason, acting_organization);
}

operation_result<organization_t> organization_directory::blacklist(
    const organization_id_t& organization_id,
    const std::string& reason,
    const organization_id_t& acting_organization) {
  return transition(organization_id, organization_transition_t::blacklist,
                    reason, acting_organization);
}

operation_result<organization_t> organization_directory::get(
    const organization_id_t& organization_id) const {
  try {
    auto organization = load(organization_id);
    if (!organization) {
      return make_failure<organization_t>(error_code::organization_not_found,
                                          kCodespace, "organization not found",
                                          organization_id);
    }
    return make_success(std::move(*organization));
  } catch (const credence::storage::storage_error& ex) {
    return storage_failure<organization_t>(ex);
  }
}

operation_result<std::vector<organization_t>> organization_directory::list()
    const {
  try {
    auto prefix = key::make_prefix_key(encoder_, key::kOrganizationKeyPrefix);
    auto organizations = std::vector<organization_t>{};
    for (const auto& [key, value] :
         storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
      organizations.push_back(encoder_.decode<organization_t>(
          bytes_view_t{value.data(), value.size()}));
    }
    std::ranges::sort(organizations, {}, &organization_t::organization_id);
    return make_success(std::move(organizations));
  } catch (const credence::storage::storage_error& ex) {
    return storage_failure<std::vector<organization_t>>(ex);
  }
}

bool organization_directory::is_eligible_issuer(
    const organization_id_t& organization_id) const {
  auto organization = load(organization_id);
  return organization &&
         organization->status == organization_status_t::active;
}

bool organization_directory::is_attestation_authority(
    const organization_id_t& organization_id) const {
  return organization_id == policy_.authority_id;
}

operation_result<organization_t> organization_directory::transition(
    const organization_id_t& organization_id,
    const organization_transition_t transition,
    const std::optional<std::string>& reason,
    const organization_id_t& acting_organization) {
  if (!is_attestation_authority(acting_organization)) {
    spdlog::warn("Rejecting status change of '{}' by '{}': not the authority",
                 organization_id, acting_organization);
    return make_failure<organization_t>(
        error_code::unauthorized, kCodespace,
        "only the attestation authority may change organization status",
        acting_organization);
  }
  if (transition != organization_transition_t::approve &&
      is_attestation_authority(organization_id)) {
    return make_failure<organization_t>(
        error_code::invalid_status_transition, kCodespace,
        "the attestation authority cannot be suspended or blacklisted",
        organization_id);
  }

  auto lock = locks_.lock(organization_id);
  try {
    auto organization = load(organization_id);
    if (!organization) {
      return make_failure<organization_t>(error_code::organization_not_found,
                                          kCodespace, "organization not found",
                                          organization_id);
    }
    auto check = check_transition(organization->status, transition);
    if (!check) {
      spdlog::warn("Rejecting status change of '{}': {} ({})",
                   organization_id, check.log, check.info);
      auto failure = forward_failure<organization_t>(check);
      failure.codespace = kCodespace;
      return failure;
    }

    auto previous = organization->status;
    organization->status = *next_status(previous, transition);
    organization->status_reason = reason;
    organization->updated_at = clock_();
    auto key = key::make_organization_key(encoder_, organization_id);
    storage_.put(encoder_, bytes_view_t{key.data(), key.size()},
                 *organization);
    spdlog::info("Organization '{}' moved from {} to {}", organization_id,
                 to_string(previous), to_string(organization->status));
    return make_success(std::move(*organization));
  } catch (const credence::storage::storage_error& ex) {
    return storage_failure<organization_t>(ex);
  }
}

std::optional<organization_t> organization_directory::load(
    const organization_id_t& organization_id) const {
  auto key = key::make_organization_key(encoder_, organization_id);
  return storage_.get<organization_t>(encoder_,
                                      bytes_view_t{key.data(), key.size()});
}

}  // namespace credence::registry
