#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <credence/blake3/hash.hpp>
#include <credence/registry/certificate_registry.hpp>
#include <credence/registry/lifecycle.hpp>
#include <credence/schema/key/registry_keys.hpp>

using namespace credence::schema;

namespace {

constexpr auto kCodespace = "credence.registry";

template <typename T>
operation_result<T> storage_failure(
    const credence::storage::storage_error& ex) {
  spdlog::error("Certificate registry storage failure: {}", ex.what());
  return make_failure<T>(error_code::internal_error, kCodespace,
                         "storage failure", ex.what());
}

bool is_blank(const std::string& value) {
  return std::ranges::all_of(value, [](const unsigned char c) {
    return std::isspace(c) != 0;
  });
}

}  // namespace

namespace credence::registry {

degree_id_t make_degree_id(const certificate_hash_t& certificate_hash) {
  return credence::blake3::hash(certificate_hash);
}

certificate_registry::certificate_registry(
    credence::scale_encoder_t& encoder,
    credence::rocksdb_storage_t& storage,
    organization_directory& directory,
    credence::audit::audit_trail& audit,
    credence::common::clock_fn_t clock)
    : encoder_{encoder},
      storage_{storage},
      directory_{directory},
      audit_{audit},
      clock_{std::move(clock)} {}

operation_result<degree_id_t> certificate_registry::submit(
    const organization_id_t& issuer,
    const certificate_hash_t& certificate_hash,
    const subject_fields_t& subject) {
  try {
    if (!directory_.is_eligible_issuer(issuer)) {
      spdlog::warn("Rejecting submission: issuer '{}' is not eligible",
                   issuer);
      return make_failure<degree_id_t>(error_code::issuer_not_eligible,
                                       kCodespace,
                                       "issuer is not an active organization",
                                       issuer);
    }
    if (!is_certificate_hash(certificate_hash)) {
      spdlog::warn("Rejecting submission from '{}': malformed hash", issuer);
      return make_failure<degree_id_t>(
          error_code::invalid_hash, kCodespace,
          "certificate hash must be 64 lowercase hex characters",
          certificate_hash);
    }

    auto lock = hash_locks_.lock(certificate_hash);
    auto record = degree_record_t{};
    record.degree_id = make_degree_id(certificate_hash);
    record.certificate_hash = certificate_hash;
    record.issuer = issuer;
    record.subject = subject;
    record.status = degree_status_t::active;
    record.verification_count = 0;
    record.submitted_at = clock_();

    auto hash_key = key::make_certificate_hash_key(encoder_, certificate_hash);
    auto entries = std::vector<credence::storage::key_value_entry_t>{};
    entries.emplace_back(key::make_degree_key(encoder_, record.degree_id),
                         encoder_.encode(record));
    entries.emplace_back(hash_key, encoder_.encode(record.degree_id));
    entries.emplace_back(
        key::make_issuer_degree_key(encoder_, issuer, record.degree_id),
        encoder_.encode(record.degree_id));

    if (!storage_.compare_and_write(
            bytes_view_t{hash_key.data(), hash_key.size()}, std::nullopt,
            entries)) {
      spdlog::warn("Rejecting submission from '{}': certificate {} exists",
                   issuer, certificate_hash);
      return make_failure<degree_id_t>(error_code::duplicate_certificate,
                                       kCodespace,
                                       "certificate already registered",
                                       certificate_hash);
    }
    spdlog::info("Registered degree {} for certificate {} issued by '{}'",
                 to_hex(record.degree_id), certificate_hash, issuer);
    return make_success(record.degree_id);
  } catch (const credence::storage::storage_error& ex) {
    return storage_failure<degree_id_t>(ex);
  }
}

operation_result<degree_record_t> certificate_registry::lookup(
    const certificate_hash_t& certificate_hash) const {
  if (!is_certificate_hash(certificate_hash)) {
    return make_failure<degree_record_t>(
        error_code::invalid_hash, kCodespace,
        "certificate hash must be 64 lowercase hex characters",
        certificate_hash);
  }
  try {
    auto hash_key = key::make_certificate_hash_key(encoder_, certificate_hash);
    auto degree_id = storage_.get<degree_id_t>(
        encoder_, bytes_view_t{hash_key.data(), hash_key.size()});
    auto record = degree_id ? load(*degree_id) : std::nullopt;
    if (!record) {
      return make_failure<degree_record_t>(error_code::degree_not_found,
                                           kCodespace,
                                           "no degree for certificate hash",
                                           certificate_hash);
    }
    return make_success(std::move(*record));
  } catch (const credence::storage::storage_error& ex) {
    return storage_failure<degree_record_t>(ex);
  }
}

operation_result<degree_record_t> certificate_registry::get_by_id(
    const degree_id_t& degree_id) const {
  try {
    auto record = load(degree_id);
    if (!record) {
      return make_failure<degree_record_t>(error_code::degree_not_found,
                                           kCodespace, "degree not found",
                                           to_hex(degree_id));
    }
    return make_success(std::move(*record));
  } catch (const credence::storage::storage_error& ex) {
    return storage_failure<degree_record_t>(ex);
  }
}

operation_result<degree_record_t> certificate_registry::revoke(
    const degree_id_t& degree_id,
    const std::string& reason,
    const organization_id_t& acting_organization) {
  if (!directory_.is_attestation_authority(acting_organization)) {
    spdlog::warn("Rejecting revocation of {} by '{}': not the authority",
                 to_hex(degree_id), acting_organization);
    return make_failure<degree_record_t>(
        error_code::unauthorized, kCodespace,
        "only the attestation authority may revoke degrees",
        acting_organization);
  }
  if (is_blank(reason)) {
    return make_failure<degree_record_t>(error_code::validation_failed,
                                         kCodespace,
                                         "revocation reason is required",
                                         to_hex(degree_id));
  }

  auto lock = degree_locks_.lock(degree_id);
  try {
    auto record = load(degree_id);
    if (!record) {
      return make_failure<degree_record_t>(error_code::degree_not_found,
                                           kCodespace, "degree not found",
                                           to_hex(degree_id));
    }
    auto check = check_transition(record->status, degree_transition_t::revoke);
    if (!check) {
      spdlog::warn("Rejecting revocation of {}: already revoked",
                   to_hex(degree_id));
      auto failure = forward_failure<degree_record_t>(check);
      failure.codespace = kCodespace;
      failure.info = to_hex(degree_id);
      return failure;
    }

    auto now = clock_();
    record->status = *next_status(record->status, degree_transition_t::revoke);
    auto revocation = revocation_t{};
    revocation.reason = reason;
    revocation.revoked_by = acting_organization;
    revocation.revoked_at = now;
    record->revocation = std::move(revocation);

    auto event = revocation_event_t{};
    event.degree_id = degree_id;
    event.acting_organization = acting_organization;
    event.reason = reason;
    event.recorded_at = now;
    auto [staged, event_entry] = audit_.stage(std::move(event));

    auto entries = std::vector<credence::storage::key_value_entry_t>{};
    entries.emplace_back(key::make_degree_key(encoder_, degree_id),
                         encoder_.encode(*record));
    entries.push_back(std::move(event_entry));
    storage_.write(entries);

    spdlog::info("Revoked degree {} by '{}': {}", to_hex(degree_id),
                 acting_organization, reason);
    audit_.publish(staged);
    return make_success(std::move(*record));
  } catch (const credence::storage::storage_error& ex) {
    return storage_failure<degree_record_t>(ex);
  }
}

operation_result<verification_event_t> certificate_registry::record_verification(
    verification_event_t event) {
  auto lock = degree_locks_.lock(event.degree_id);
  try {
    auto record = load(event.degree_id);
    if (!record) {
      return make_failure<verification_event_t>(
          error_code::degree_not_found, kCodespace, "degree not found",
          to_hex(event.degree_id));
    }
    auto entries = std::vector<credence::storage::key_value_entry_t>{};
    if (record->status == degree_status_t::revoked) {
      if (event.method != verification_method_t::degree_revoked) {
        spdlog::info("Degree {} was revoked before verification committed",
                     to_hex(event.degree_id));
      }
      event.method = verification_method_t::degree_revoked;
      event.confidence = 0.0;
      event.verified = false;
    } else {
      record->verification_count += 1;
      record->last_verified_at = clock_();
      entries.emplace_back(key::make_degree_key(encoder_, event.degree_id),
                           encoder_.encode(*record));
    }
    auto [staged, event_entry] = audit_.stage(std::move(event));
    entries.push_back(std::move(event_entry));
    storage_.write(entries);

    spdlog::debug("Degree {} verified {} time(s)", to_hex(staged.degree_id),
                  record->verification_count);
    audit_.publish(staged);
    return make_success(std::move(staged));
  } catch (const credence::storage::storage_error& ex) {
    return storage_failure<verification_event_t>(ex);
  }
}

operation_result<std::vector<degree_record_t>>
certificate_registry::list_by_issuer(const organization_id_t& issuer) const {
  try {
    auto prefix = key::make_issuer_degree_prefix_key(encoder_, issuer);
    auto records = std::vector<degree_record_t>{};
    for (const auto& [key, value] :
         storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
      auto degree_id = encoder_.decode<degree_id_t>(
          bytes_view_t{value.data(), value.size()});
      if (auto record = load(degree_id)) {
        records.push_back(std::move(*record));
      }
    }
    std::ranges::sort(records, [](const degree_record_t& lhs,
                                  const degree_record_t& rhs) {
      if (lhs.submitted_at != rhs.submitted_at) {
        return lhs.submitted_at < rhs.submitted_at;
      }
      return lhs.certificate_hash < rhs.certificate_hash;
    });
    return make_success(std::move(records));
  } catch (const credence::storage::storage_error& ex) {
    return storage_failure<std::vector<degree_record_t>>(ex);
  }
}

std::optional<degree_record_t> certificate_registry::load(
    const degree_id_t& degree_id) const {
  auto key = key::make_degree_key(encoder_, degree_id);
  return storage_.get<degree_record_t>(encoder_,
                                       bytes_view_t{key.data(), key.size()});
}

}  // namespace credence::registry
