#include <credence/verification/field_similarity.hpp>
#include <gtest/gtest.h>

using credence::schema::subject_field_t;
using credence::schema::subject_fields_t;

TEST(field_similarity, normalize_trims_and_folds_case) {
  EXPECT_EQ(credence::verification::normalize_field("  Jane DOE\t"),
            "jane doe");
  EXPECT_EQ(credence::verification::normalize_field(" \n "), "");
  EXPECT_EQ(credence::verification::normalize_field("MÜNCHEN"), "münchen");
  EXPECT_EQ(credence::verification::normalize_field(" JOSÉ ÑÚÑEZ "),
            "josé ñúñez");
}

TEST(field_similarity, distance_counts_code_points) {
  EXPECT_EQ(credence::verification::edit_distance("Müller", "Muller"), 1u);
  EXPECT_EQ(credence::verification::edit_distance("Ñ", ""), 1u);
  EXPECT_DOUBLE_EQ(credence::verification::similarity("Müller", "Muller"),
                   1.0 - 1.0 / 6.0);
}

TEST(field_similarity, accented_names_differing_only_in_case_match) {
  EXPECT_DOUBLE_EQ(
      credence::verification::field_credit("JOSÉ ÑÚÑEZ", "José Ñúñez"), 1.0);

  auto stored = subject_fields_t{};
  stored.student_name = "José Ñúñez";
  stored.institution_name = "Universität Zürich";
  auto presented = subject_fields_t{};
  presented.student_name = "JOSÉ ÑÚÑEZ";
  presented.institution_name = "UNIVERSITÄT ZÜRICH";

  auto report = credence::verification::compare_fields(presented, stored);
  ASSERT_EQ(report.comparisons.size(), 2u);
  ASSERT_TRUE(report.field_confidence.has_value());
  EXPECT_DOUBLE_EQ(*report.field_confidence, 1.0);
}

TEST(field_similarity, edit_distance_unit_costs) {
  EXPECT_EQ(credence::verification::edit_distance("kitten", "sitting"), 3u);
  EXPECT_EQ(credence::verification::edit_distance("", "abc"), 3u);
  EXPECT_EQ(credence::verification::edit_distance("abc", ""), 3u);
  EXPECT_EQ(credence::verification::edit_distance("flaw", "lawn"), 2u);
  EXPECT_EQ(credence::verification::edit_distance("same", "same"), 0u);
}

TEST(field_similarity, similarity_bounds) {
  EXPECT_DOUBLE_EQ(credence::verification::similarity("", ""), 1.0);
  EXPECT_DOUBLE_EQ(credence::verification::similarity("", "abc"), 0.0);
  EXPECT_DOUBLE_EQ(credence::verification::similarity("abcd", "wxyz"), 0.0);
  EXPECT_DOUBLE_EQ(credence::verification::similarity("jon smith", "john smith"),
                   0.9);
}

TEST(field_similarity, credit_requires_high_similarity) {
  EXPECT_DOUBLE_EQ(credence::verification::field_credit("Jane Doe", "JANE DOE"),
                   1.0);
  EXPECT_DOUBLE_EQ(
      credence::verification::field_credit("Jon Smith", "John Smith"), 0.9);
  EXPECT_DOUBLE_EQ(credence::verification::field_credit("abcd", "abcx"), 0.0);
  EXPECT_DOUBLE_EQ(credence::verification::field_credit("", "Jane"), 0.0);
  EXPECT_DOUBLE_EQ(credence::verification::field_credit("  ", ""), 1.0);
}

TEST(field_similarity, compares_only_fields_present_on_both_sides) {
  auto stored = subject_fields_t{};
  stored.student_name = "Jane Doe";
  stored.institution_name = "Northfield University";

  auto presented = subject_fields_t{};
  presented.student_name = "JANE DOE";
  presented.degree_name = "BSc Physics";

  auto report = credence::verification::compare_fields(presented, stored);
  ASSERT_EQ(report.comparisons.size(), 1u);
  EXPECT_EQ(report.comparisons[0].field, subject_field_t::student_name);
  ASSERT_TRUE(report.field_confidence.has_value());
  EXPECT_DOUBLE_EQ(*report.field_confidence, 1.0);
}

TEST(field_similarity, no_overlap_leaves_confidence_undefined) {
  auto stored = subject_fields_t{};
  stored.student_name = "Jane Doe";
  auto presented = subject_fields_t{};
  presented.certificate_number = "NFU-1";

  auto report = credence::verification::compare_fields(presented, stored);
  EXPECT_TRUE(report.comparisons.empty());
  EXPECT_FALSE(report.field_confidence.has_value());
}

TEST(field_similarity, confidence_is_mean_credit) {
  auto stored = subject_fields_t{};
  stored.student_name = "John Smith";
  stored.degree_name = "Master of Arts";
  stored.issuance_date = "2021-05-30";

  auto presented = subject_fields_t{};
  presented.student_name = "Jon Smith";
  presented.degree_name = "Doctor of Medicine";
  presented.issuance_date = "2021-05-30";

  auto report = credence::verification::compare_fields(presented, stored);
  ASSERT_EQ(report.comparisons.size(), 3u);
  EXPECT_DOUBLE_EQ(report.comparisons[1].credit, 0.0);
  ASSERT_TRUE(report.field_confidence.has_value());
  EXPECT_DOUBLE_EQ(*report.field_confidence, (0.9 + 0.0 + 1.0) / 3.0);
}
