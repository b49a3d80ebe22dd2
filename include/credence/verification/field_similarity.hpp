#pragma once

#include <credence/schema/subject_fields.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Fuzzy comparison of presented (OCR) certificate fields against the stored
// ones. Pure functions; no state and no I/O.
namespace credence::verification {

// A non-identical field earns credit only when its similarity exceeds this.
inline constexpr double kFieldCreditThreshold = 0.8;

/// Trim surrounding whitespace and Unicode case-fold the UTF-8 text.
std::string normalize_field(std::string_view value);

/// Levenshtein distance over code points with unit insert/delete/substitute
/// costs.
std::size_t edit_distance(std::string_view lhs, std::string_view rhs);

/// 1 - edit_distance / max(length in code points), in [0, 1]. Two empty
/// strings score 1.
double similarity(std::string_view lhs, std::string_view rhs);

/// Credit for one field: 1 when equal after normalization, the similarity
/// when it is above kFieldCreditThreshold, else 0.
double field_credit(std::string_view presented, std::string_view stored);

struct field_comparison final {
  credence::schema::subject_field_t field;
  double similarity{};
  double credit{};
};

struct field_report final {
  std::vector<field_comparison> comparisons;
  // Mean credit over compared fields; empty when no field was present on
  // both sides.
  std::optional<double> field_confidence;
};

field_report compare_fields(const credence::schema::subject_fields_t& presented,
                            const credence::schema::subject_fields_t& stored);

}  // namespace credence::verification
