#pragma once

#include <credence/common/clock.hpp>
#include <credence/schema/primitives.hpp>
#include <credence/schema/subject_fields.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace credence::testing {

inline credence::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = credence::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Distinct, well-formed certificate hash per seed.
inline credence::schema::certificate_hash_t make_certificate_hash(
    const uint8_t seed) {
  return credence::schema::to_hex(make_hash(seed));
}

inline credence::schema::subject_fields_t make_subject_fields() {
  auto fields = credence::schema::subject_fields_t{};
  fields.student_name = "Alice Johnson";
  fields.degree_name = "Bachelor of Science in Computer Science";
  fields.institution_name = "Northfield University";
  fields.issuance_date = "2023-06-15";
  fields.certificate_number = "NFU-2023-00042";
  return fields;
}

/// Deterministic clock; every read returns the current value, advance() moves
/// it forward.
class manual_clock final {
 public:
  explicit manual_clock(
      const credence::schema::timestamp_milliseconds_t start = 1'700'000'000'000)
      : now_{std::make_shared<
            std::atomic<credence::schema::timestamp_milliseconds_t>>(start)} {}

  credence::common::clock_fn_t fn() const {
    return [now = now_] { return now->load(); };
  }

  void advance(const credence::schema::timestamp_milliseconds_t delta = 1) {
    now_->fetch_add(delta);
  }

  credence::schema::timestamp_milliseconds_t now() const {
    return now_->load();
  }

 private:
  std::shared_ptr<std::atomic<credence::schema::timestamp_milliseconds_t>>
      now_;
};

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace credence::testing
