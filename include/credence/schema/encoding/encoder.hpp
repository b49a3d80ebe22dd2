#pragma once
#include <credence/schema/primitives.hpp>
#include <optional>
#include <span>

namespace credence::schema::encoding {

// Build-time selection of the value codec. Each library gets a tag type and a
// specialization of this template; callers only see encode/decode.
template <typename Library>
struct encoder {
  template <typename T>
  credence::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, credence::schema::bytes_t& out);

  template <typename T>
  T decode(const credence::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const credence::schema::bytes_view_t& bytes);
};

}  // namespace credence::schema::encoding
