#include <credence/common/critical.hpp>
#include <credence/common/key_lock.hpp>

#include <functional>

namespace credence::common {

key_lock_table::key_lock_table(const std::size_t stripes) : stripes_(stripes) {
  if (stripes_.empty()) {
    critical("key lock table requires at least one stripe");
  }
}

std::unique_lock<std::mutex> key_lock_table::lock(const std::string_view key) {
  return std::unique_lock<std::mutex>{stripe_for(key)};
}

std::unique_lock<std::mutex> key_lock_table::lock(
    const std::span<const uint8_t> key) {
  return lock(std::string_view{reinterpret_cast<const char*>(key.data()),
                               key.size()});
}

std::mutex& key_lock_table::stripe_for(const std::string_view key) {
  auto index = std::hash<std::string_view>{}(key) % stripes_.size();
  return stripes_[index];
}

}  // namespace credence::common
