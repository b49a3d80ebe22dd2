#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace credence::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;

// Issuers, verifiers and the attestation authority are all organizations.
using organization_id_t = std::string;
using degree_id_t = hash32_t;
using event_id_t = uint64_t;

// 64 lowercase hex characters (SHA-256 of the certificate document).
using certificate_hash_t = std::string;

inline constexpr std::size_t kCertificateHashLength = 64;

bytes_t make_bytes(const std::string_view& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);
std::optional<hash32_t> try_make_hash32(std::string_view hex);

/// True iff `value` is exactly 64 characters of [0-9a-f].
bool is_certificate_hash(std::string_view value);

/// Trim surrounding whitespace and lowercase a presented hash. The result is
/// not validated.
certificate_hash_t canonicalize_certificate_hash(std::string_view value);

}  // namespace credence::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
