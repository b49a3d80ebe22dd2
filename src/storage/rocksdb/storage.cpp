#include <credence/common/critical.hpp>
#include <credence/storage/rocksdb/storage.hpp>

namespace credence::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    throw storage_error{"failed to open RocksDB at " + std::string{path} +
                        ": " + status.ToString()};
  }
  spdlog::info("Opened registry store at {}", path);
  store.database.reset(database);

  return store;
}

ROCKSDB_NAMESPACE::DB& storage<rocksdb_storage_tag>::db() const {
  if (!database) {
    credence::common::critical("RocksDB database is not initialized");
  }
  return *database;
}

std::optional<credence::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const credence::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status = db().Get(ROCKSDB_NAMESPACE::ReadOptions{},
                         detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  detail::throw_on_error(status, "get");
  return credence::schema::bytes_t{std::begin(value), std::end(value)};
}

void storage<rocksdb_storage_tag>::write(
    const std::vector<key_value_entry_t>& entries) const {
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    detail::throw_on_error(
        batch.Put(detail::to_slice(key), detail::to_slice(value)),
        "batch put");
  }
  detail::throw_on_error(
      db().Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch), "write");
}

bool storage<rocksdb_storage_tag>::compare_and_write(
    const credence::schema::bytes_view_t& key,
    const std::optional<credence::schema::bytes_t>& expected,
    const std::vector<key_value_entry_t>& entries) const {
  auto lock = std::scoped_lock{*write_mutex};
  auto current = get_raw(key);
  if (current != expected) {
    spdlog::debug("compare_and_write rejected: key state changed");
    return false;
  }
  write(entries);
  return true;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const credence::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      db().NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  detail::throw_on_error(iterator->status(), "iterate");
  return entries;
}

}  // namespace credence::storage
