#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <vector>

namespace credence::common {

/// Fixed table of mutexes addressed by key hash.
///
/// Two operations on the same key always contend on the same stripe, which is
/// what makes Submit/Revoke/RecordVerification linearizable per certificate
/// hash and per degree id. Unrelated keys only contend when they collide.
class key_lock_table final {
 public:
  explicit key_lock_table(std::size_t stripes = 64);

  key_lock_table(const key_lock_table&) = delete;
  key_lock_table& operator=(const key_lock_table&) = delete;

  std::unique_lock<std::mutex> lock(std::string_view key);
  std::unique_lock<std::mutex> lock(std::span<const uint8_t> key);

  std::size_t stripes() const { return stripes_.size(); }

 private:
  std::mutex& stripe_for(std::string_view key);

  std::vector<std::mutex> stripes_;
};

}  // namespace credence::common
