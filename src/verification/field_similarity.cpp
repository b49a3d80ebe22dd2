#include <boost/locale/conversion.hpp>
#include <boost/locale/encoding_utf.hpp>
#include <boost/locale/generator.hpp>
#include <algorithm>
#include <credence/verification/field_similarity.hpp>
#include <locale>
#include <numeric>

namespace {

// Case folding is locale independent; any UTF-8 locale from the generator
// carries the conversion facet fold_case needs.
const std::locale& folding_locale() {
  static const auto locale = [] {
    auto generator = boost::locale::generator{};
    return generator("en_US.UTF-8");
  }();
  return locale;
}

// Invalid UTF-8 sequences are skipped, so OCR garbage never throws here.
std::u32string to_code_points(const std::string_view value) {
  return boost::locale::conv::utf_to_utf<char32_t>(value.data(),
                                                    value.data() + value.size());
}

std::size_t levenshtein(const std::u32string& lhs, const std::u32string& rhs) {
  if (lhs.empty()) {
    return rhs.size();
  }
  if (rhs.empty()) {
    return lhs.size();
  }
  auto previous = std::vector<std::size_t>(rhs.size() + 1);
  auto current = std::vector<std::size_t>(rhs.size() + 1);
  std::iota(std::begin(previous), std::end(previous), std::size_t{0});
  for (std::size_t i = 1; i <= lhs.size(); ++i) {
    current[0] = i;
    for (std::size_t j = 1; j <= rhs.size(); ++j) {
      auto substitution = lhs[i - 1] == rhs[j - 1] ? 0u : 1u;
      current[j] = std::min({previous[j] + 1, current[j - 1] + 1,
                             previous[j - 1] + substitution});
    }
    std::swap(previous, current);
  }
  return previous[rhs.size()];
}

}  // namespace

namespace credence::verification {

std::string normalize_field(const std::string_view value) {
  constexpr auto kWhitespace = std::string_view{" \t\r\n\f\v"};
  auto begin = value.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = value.find_last_not_of(kWhitespace);
  auto trimmed = value.substr(begin, end - begin + 1);
  auto valid = boost::locale::conv::utf_to_utf<char>(
      trimmed.data(), trimmed.data() + trimmed.size());
  return boost::locale::fold_case(valid, folding_locale());
}

std::size_t edit_distance(const std::string_view lhs,
                          const std::string_view rhs) {
  return levenshtein(to_code_points(lhs), to_code_points(rhs));
}

double similarity(const std::string_view lhs, const std::string_view rhs) {
  auto left = to_code_points(lhs);
  auto right = to_code_points(rhs);
  auto longest = std::max(left.size(), right.size());
  if (longest == 0) {
    return 1.0;
  }
  return 1.0 - static_cast<double>(levenshtein(left, right)) /
                   static_cast<double>(longest);
}

double field_credit(const std::string_view presented,
                    const std::string_view stored) {
  auto lhs = normalize_field(presented);
  auto rhs = normalize_field(stored);
  if (lhs == rhs) {
    return 1.0;
  }
  auto score = similarity(lhs, rhs);
  return score > kFieldCreditThreshold ? score : 0.0;
}

field_report compare_fields(const credence::schema::subject_fields_t& presented,
                            const credence::schema::subject_fields_t& stored) {
  auto report = field_report{};
  for (auto field : credence::schema::kKeySubjectFields) {
    const auto& lhs = presented.get(field);
    const auto& rhs = stored.get(field);
    if (!lhs || !rhs) {
      continue;
    }
    auto comparison = field_comparison{};
    comparison.field = field;
    comparison.similarity =
        similarity(normalize_field(*lhs), normalize_field(*rhs));
    comparison.credit = field_credit(*lhs, *rhs);
    report.comparisons.push_back(comparison);
  }
  if (!report.comparisons.empty()) {
    auto total = 0.0;
    for (const auto& comparison : report.comparisons) {
      total += comparison.credit;
    }
    report.field_confidence =
        total / static_cast<double>(report.comparisons.size());
  }
  return report;
}

}  // namespace credence::verification
