#pragma once
#include <credence/schema/primitives.hpp>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace credence::storage {

using key_value_entry_t =
    std::pair<credence::schema::bytes_t, credence::schema::bytes_t>;

/// Raised by a backend when the underlying store fails (I/O, corruption).
///
/// Components translate it into error_code::internal_error at their boundary
/// so it is never confused with a business rejection.
class storage_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const credence::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const credence::schema::bytes_view_t& key,
           const T& value) const;

  /// Return the raw bytes stored at key, or std::nullopt when missing.
  std::optional<credence::schema::bytes_t> get_raw(
      const credence::schema::bytes_view_t& key) const;

  /// Atomically persist all entries.
  void write(const std::vector<key_value_entry_t>& entries) const;

  /// Atomically persist `entries` iff the bytes at `key` equal `expected`
  /// (std::nullopt: the key must be absent). Returns false on mismatch and
  /// leaves the store untouched.
  bool compare_and_write(const credence::schema::bytes_view_t& key,
                         const std::optional<credence::schema::bytes_t>& expected,
                         const std::vector<key_value_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const credence::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace credence::storage
