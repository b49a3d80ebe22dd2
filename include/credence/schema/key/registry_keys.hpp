#pragma once

#include <credence/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>

// Schema key type: registry keys.
// Registry workflow: canonical key prefixes and key codecs for organizations,
// degrees, their secondary indexes, and the audit trail.
namespace credence::schema::key {

inline constexpr std::string_view kOrganizationKeyPrefix{"SYS|STATE|ORG|"};
inline constexpr std::string_view kDegreeKeyPrefix{"SYS|STATE|DEGREE|"};
inline constexpr std::string_view kCertificateHashKeyPrefix{
    "SYS|STATE|CERT_HASH|"};
inline constexpr std::string_view kIssuerDegreeKeyPrefix{
    "SYS|STATE|ISSUER_DEGREE|"};
inline constexpr std::string_view kVerificationEventPrefix{"SYS|AUDIT|VERIFY|"};
inline constexpr std::string_view kRevocationEventPrefix{"SYS|AUDIT|REVOKE|"};

template <typename Encoder, typename T>
credence::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes, so a key for
  // (a, b) starts with the key for (a) and prefix scans work per component.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
credence::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
credence::schema::bytes_t make_organization_key(
    Encoder& encoder,
    const credence::schema::organization_id_t& organization_id) {
  return make_prefixed_key(encoder, kOrganizationKeyPrefix, organization_id);
}

template <typename Encoder>
credence::schema::bytes_t make_degree_key(
    Encoder& encoder,
    const credence::schema::degree_id_t& degree_id) {
  return make_prefixed_key(encoder, kDegreeKeyPrefix, degree_id);
}

template <typename Encoder>
credence::schema::bytes_t make_certificate_hash_key(
    Encoder& encoder,
    const credence::schema::certificate_hash_t& certificate_hash) {
  return make_prefixed_key(encoder, kCertificateHashKeyPrefix,
                           certificate_hash);
}

template <typename Encoder>
credence::schema::bytes_t make_issuer_degree_key(
    Encoder& encoder,
    const credence::schema::organization_id_t& issuer,
    const credence::schema::degree_id_t& degree_id) {
  return make_prefixed_key(encoder, kIssuerDegreeKeyPrefix,
                           std::tuple{issuer, degree_id});
}

template <typename Encoder>
credence::schema::bytes_t make_issuer_degree_prefix_key(
    Encoder& encoder,
    const credence::schema::organization_id_t& issuer) {
  return make_prefixed_key(encoder, kIssuerDegreeKeyPrefix, issuer);
}

template <typename Encoder>
credence::schema::bytes_t make_verification_event_key(
    Encoder& encoder,
    const credence::schema::degree_id_t& degree_id,
    const credence::schema::event_id_t event_id) {
  return make_prefixed_key(encoder, kVerificationEventPrefix,
                           std::tuple{degree_id, event_id});
}

template <typename Encoder>
credence::schema::bytes_t make_revocation_event_key(
    Encoder& encoder,
    const credence::schema::degree_id_t& degree_id,
    const credence::schema::event_id_t event_id) {
  return make_prefixed_key(encoder, kRevocationEventPrefix,
                           std::tuple{degree_id, event_id});
}

template <typename Encoder>
credence::schema::bytes_t make_audit_prefix_key(
    Encoder& encoder,
    std::string_view prefix,
    const credence::schema::degree_id_t& degree_id) {
  return make_prefixed_key(encoder, prefix, degree_id);
}

}  // namespace credence::schema::key
