#pragma once
#include <credence/schema/primitives.hpp>
#include <span>
#include <string_view>

namespace credence::blake3 {

credence::schema::hash32_t hash(const std::string_view& str);
credence::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace credence::blake3
