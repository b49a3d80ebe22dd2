#include <spdlog/spdlog.h>
#include <credence/crypto/digest.hpp>
#include <credence/service/registry_service.hpp>

using namespace credence::schema;

namespace credence::service {

registry_service::registry_service(credence::scale_encoder_t& encoder,
                                   credence::rocksdb_storage_t& storage,
                                   service_options options,
                                   credence::common::clock_fn_t clock)
    : directory_{encoder, storage, std::move(options.directory), clock},
      audit_{encoder, storage, clock},
      registry_{encoder, storage, directory_, audit_, clock},
      engine_{registry_, options.confidence_policy} {}

operation_result<organization_t> registry_service::bootstrap() {
  return directory_.bootstrap();
}

operation_result<degree_id_t> registry_service::submit_degree(
    const organization_id_t& issuer,
    const certificate_hash_t& certificate_hash,
    const subject_fields_t& subject) {
  return registry_.submit(issuer, certificate_hash, subject);
}

operation_result<degree_id_t> registry_service::submit_document(
    const organization_id_t& issuer,
    const bytes_view_t& document,
    const subject_fields_t& subject) {
  auto certificate_hash = credence::crypto::certificate_hash(document);
  spdlog::debug("Document of {} bytes hashed to {}", document.size(),
                certificate_hash);
  return registry_.submit(issuer, certificate_hash, subject);
}

operation_result<verification_result_t> registry_service::verify(
    const std::string_view certificate_hash,
    const std::optional<subject_fields_t>& presented,
    const organization_id_t& verifier) {
  return engine_.verify(certificate_hash, presented, verifier);
}

operation_result<degree_record_t> registry_service::revoke(
    const degree_id_t& degree_id,
    const std::string& reason,
    const organization_id_t& acting_organization) {
  return registry_.revoke(degree_id, reason, acting_organization);
}

operation_result<degree_record_t> registry_service::get_degree(
    const degree_reference_t& reference) const {
  return std::visit(
      overloaded{
          [&](const degree_id_t& degree_id) {
            return registry_.get_by_id(degree_id);
          },
          [&](const certificate_hash_t& certificate_hash) {
            return registry_.lookup(certificate_hash);
          },
      },
      reference);
}

operation_result<std::vector<verification_event_t>>
registry_service::get_verification_history(const degree_id_t& degree_id) const {
  auto degree = registry_.get_by_id(degree_id);
  if (!degree) {
    return forward_failure<std::vector<verification_event_t>>(degree);
  }
  return audit_.query_by_degree(degree_id);
}

operation_result<std::vector<revocation_event_t>>
registry_service::get_revocation_history(const degree_id_t& degree_id) const {
  auto degree = registry_.get_by_id(degree_id);
  if (!degree) {
    return forward_failure<std::vector<revocation_event_t>>(degree);
  }
  return audit_.query_revocations(degree_id);
}

operation_result<std::vector<degree_record_t>>
registry_service::list_degrees_by_issuer(const organization_id_t& issuer) const {
  return registry_.list_by_issuer(issuer);
}

operation_result<organization_t> registry_service::register_organization(
    const organization_id_t& organization_id,
    const organization_metadata_t& metadata,
    const amount_t& stake) {
  return directory_.register_organization(organization_id, metadata, stake);
}

operation_result<organization_t> registry_service::approve_organization(
    const organization_id_t& organization_id,
    const organization_id_t& acting_organization) {
  return directory_.approve(organization_id, acting_organization);
}

operation_result<organization_t> registry_service::suspend_organization(
    const organization_id_t& organization_id,
    const std::string& reason,
    const organization_id_t& acting_organization) {
  return directory_.suspend(organization_id, reason, acting_organization);
}

operation_result<organization_t> registry_service::blacklist_organization(
    const organization_id_t& organization_id,
    const std::string& reason,
    const organization_id_t& acting_organization) {
  return directory_.blacklist(organization_id, reason, acting_organization);
}

operation_result<organization_t> registry_service::get_organization(
    const organization_id_t& organization_id) const {
  return directory_.get(organization_id);
}

operation_result<std::vector<organization_t>>
registry_service::list_organizations() const {
  return directory_.list();
}

void registry_service::set_event_listener(
    credence::audit::event_listener_t listener) {
  audit_.set_event_listener(std::move(listener));
}

}  // namespace credence::service
