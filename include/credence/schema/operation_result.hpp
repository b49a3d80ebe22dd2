#pragma once

#include <credence/schema/error_code.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace credence::schema {

/// Outcome envelope returned by every registry operation.
///
/// `log` is a short human-readable reason, `info` carries the offending
/// value (hash, id, field) and `codespace` names the component that rejected
/// the call. `value` is engaged iff `code` is ok.
template <typename T>
struct operation_result final {
  error_code code{error_code::ok};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == error_code::ok; }
  explicit operator bool() const { return ok(); }
};

using operation_status_t = operation_result<std::monostate>;

template <typename T>
operation_result<T> make_success(T value) {
  auto result = operation_result<T>{};
  result.value = std::move(value);
  return result;
}

inline operation_status_t make_success() {
  return make_success(std::monostate{});
}

template <typename T>
operation_result<T> make_failure(const error_code code,
                                 std::string codespace,
                                 std::string log,
                                 std::string info = {}) {
  auto result = operation_result<T>{};
  result.code = code;
  result.codespace = std::move(codespace);
  result.log = std::move(log);
  result.info = std::move(info);
  return result;
}

/// Re-type a failed result, keeping its code and diagnostics.
template <typename T, typename U>
operation_result<T> forward_failure(const operation_result<U>& failure) {
  auto result = operation_result<T>{};
  result.code = failure.code;
  result.log = failure.log;
  result.info = failure.info;
  result.codespace = failure.codespace;
  return result;
}

}  // namespace credence::schema
