#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <credence/common/critical.hpp>
#include <credence/schema/encoding/scale/encoder.hpp>
#include <credence/storage/storage.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace credence::storage {

namespace detail {

inline credence::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const credence::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const credence::schema::bytes_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline void throw_on_error(const ROCKSDB_NAMESPACE::Status& status,
                           const std::string_view operation) {
  if (!status.ok()) {
    spdlog::error("RocksDB {} failed: {}", operation, status.ToString());
    throw storage_error{std::string{operation} + ": " + status.ToString()};
  }
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  // Serializes compare_and_write so the read and the batch commit form one
  // step. Plain writes and reads do not take it.
  std::unique_ptr<std::mutex> write_mutex{std::make_unique<std::mutex>()};

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const credence::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const credence::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<credence::schema::bytes_t> get_raw(
      const credence::schema::bytes_view_t& key) const;
  void write(const std::vector<key_value_entry_t>& entries) const;
  bool compare_and_write(
      const credence::schema::bytes_view_t& key,
      const std::optional<credence::schema::bytes_t>& expected,
      const std::vector<key_value_entry_t>& entries) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const credence::schema::bytes_view_t& prefix) const;

 private:
  ROCKSDB_NAMESPACE::DB& db() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const credence::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      credence::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const credence::schema::bytes_view_t& key,
    const T& value) const {
  auto encoded_value = encoder.encode(value);
  auto status = db().Put(ROCKSDB_NAMESPACE::WriteOptions{},
                         detail::to_slice(key),
                         detail::to_slice(encoded_value));
  detail::throw_on_error(status, "put");
}

}  // namespace credence::storage

namespace credence {

using rocksdb_storage_t = storage::storage<storage::rocksdb_storage_tag>;

}  // namespace credence
