#pragma once

#include <credence/schema/primitives.hpp>

namespace credence::crypto {

/// SHA-256 of a certificate document, as 64 lowercase hex characters.
///
/// This is the canonical certificate hash the registry is keyed by.
credence::schema::certificate_hash_t certificate_hash(
    const credence::schema::bytes_view_t& document);

/// Raw SHA-256 digest.
credence::schema::hash32_t sha256(const credence::schema::bytes_view_t& data);

}  // namespace credence::crypto
