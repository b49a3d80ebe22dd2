#include <credence/schema/key/registry_keys.hpp>
#include <credence/testing/registry_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

using credence::schema::error_code;
using credence::schema::subject_fields_t;
using credence::schema::verification_method_t;

const auto kAuthorityId = std::string{credence::testing::kAuthority};
const auto kVerifier = std::string{"ACME_HR"};
const auto kHash = std::string(64, 'a');

subject_fields_t jane_doe() {
  auto fields = subject_fields_t{};
  fields.student_name = "Jane Doe";
  return fields;
}

std::size_t count_verification_events(credence::testing::registry_fixture& fixture) {
  auto prefix = credence::schema::key::make_prefix_key(
      fixture.encoder(), credence::schema::key::kVerificationEventPrefix);
  return fixture.storage()
      .list_by_prefix(
          credence::schema::bytes_view_t{prefix.data(), prefix.size()})
      .size();
}

class engine_test : public ::testing::Test {
 protected:
  explicit engine_test(credence::service::service_options options = {})
      : fixture_{"credence_engine", options} {
    issuer_ = fixture_.enroll_issuer("NORTHFIELD");
  }

  credence::testing::registry_fixture fixture_;
  std::string issuer_;
};

class weighted_engine_test : public engine_test {
 protected:
  weighted_engine_test() : engine_test{weighted()} {}

  static credence::service::service_options weighted() {
    auto options = credence::service::service_options{};
    options.confidence_policy =
        credence::schema::confidence_policy_t::weighted_blend;
    return options;
  }
};

}  // namespace

TEST_F(engine_test, hash_only_round_trip) {
  auto& service = fixture_.service();
  auto degree_id = service.submit_degree(issuer_, kHash, jane_doe());
  ASSERT_TRUE(degree_id.ok());

  fixture_.clock().advance(10);
  auto result = service.verify(kHash, std::nullopt, kVerifier);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_TRUE(result.value->verified);
  EXPECT_DOUBLE_EQ(result.value->confidence, 1.0);
  EXPECT_EQ(result.value->method, verification_method_t::hash_only);
  EXPECT_EQ(result.value->degree_id, *degree_id.value);
  EXPECT_FALSE(result.value->field_confidence.has_value());
  EXPECT_TRUE(result.value->event_id.has_value());

  auto record = service.get_degree(*degree_id.value);
  EXPECT_EQ(record.value->verification_count, 1u);
  EXPECT_EQ(record.value->last_verified_at, fixture_.clock().now());
}

TEST_F(engine_test, case_insensitive_field_match) {
  auto& service = fixture_.service();
  ASSERT_TRUE(service.submit_degree(issuer_, kHash, jane_doe()).ok());

  auto presented = subject_fields_t{};
  presented.student_name = "JANE DOE";
  auto result = service.verify(kHash, presented, kVerifier);
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.value->verified);
  EXPECT_DOUBLE_EQ(result.value->confidence, 1.0);
  EXPECT_EQ(result.value->method, verification_method_t::hash_and_fields);
  EXPECT_DOUBLE_EQ(result.value->field_confidence.value(), 1.0);
}

TEST_F(engine_test, accented_field_match_ignores_case) {
  auto& service = fixture_.service();
  auto stored = subject_fields_t{};
  stored.student_name = "José Ñúñez";
  ASSERT_TRUE(service.submit_degree(issuer_, kHash, stored).ok());

  auto presented = subject_fields_t{};
  presented.student_name = "JOSÉ ÑÚÑEZ";
  auto result = service.verify(kHash, presented, kVerifier);
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.value->verified);
  EXPECT_DOUBLE_EQ(result.value->confidence, 1.0);
  EXPECT_DOUBLE_EQ(result.value->field_confidence.value(), 1.0);
}

TEST_F(engine_test, unrelated_fields_are_rejected) {
  auto& service = fixture_.service();
  ASSERT_TRUE(service
                  .submit_degree(issuer_, kHash,
                                 credence::testing::make_subject_fields())
                  .ok());

  auto presented = subject_fields_t{};
  presented.student_name = "Zebulon Quartz";
  presented.degree_name = "Diploma in Pottery";
  presented.institution_name = "Evergreen Art School";
  auto result = service.verify(kHash, presented, kVerifier);
  ASSERT_TRUE(result.ok());
  EXPECT_FALSE(result.value->verified);
  EXPECT_DOUBLE_EQ(result.value->field_confidence.value(), 0.0);
  EXPECT_DOUBLE_EQ(result.value->confidence, 0.5);
  EXPECT_EQ(result.value->method, verification_method_t::hash_and_fields);

  auto history = service.get_verification_history(*result.value->degree_id);
  ASSERT_EQ(history.value->size(), 1u);
  EXPECT_FALSE((*history.value)[0].verified);
  EXPECT_DOUBLE_EQ((*history.value)[0].confidence, 0.5);
}

TEST_F(engine_test, non_overlapping_fields_fall_back_to_hash_only) {
  auto& service = fixture_.service();
  ASSERT_TRUE(service.submit_degree(issuer_, kHash, jane_doe()).ok());

  auto presented = subject_fields_t{};
  presented.certificate_number = "NFU-2023-00042";
  auto result = service.verify(kHash, presented, kVerifier);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->method, verification_method_t::hash_only);
  EXPECT_DOUBLE_EQ(result.value->confidence, 1.0);
}

TEST_F(engine_test, unknown_hash_records_nothing) {
  auto& service = fixture_.service();
  auto unknown = credence::testing::make_certificate_hash(42);
  auto result = service.verify(unknown, jane_doe(), kVerifier);
  ASSERT_TRUE(result.ok());
  EXPECT_FALSE(result.value->verified);
  EXPECT_DOUBLE_EQ(result.value->confidence, 0.0);
  EXPECT_EQ(result.value->method, verification_method_t::hash_not_found);
  EXPECT_FALSE(result.value->degree_id.has_value());
  EXPECT_FALSE(result.value->event_id.has_value());

  EXPECT_EQ(count_verification_events(fixture_), 0u);
  EXPECT_EQ(service.get_degree(unknown).code, error_code::degree_not_found);
}

TEST_F(engine_test, presented_hash_is_canonicalized) {
  auto& service = fixture_.service();
  ASSERT_TRUE(service.submit_degree(issuer_, kHash, jane_doe()).ok());

  auto result =
      service.verify("  " + std::string(64, 'A') + "\n", std::nullopt, kVerifier);
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.value->verified);

  auto malformed = service.verify("not-a-hash", std::nullopt, kVerifier);
  EXPECT_EQ(malformed.code, error_code::invalid_hash);
  EXPECT_EQ(count_verification_events(fixture_), 1u);

  EXPECT_EQ(service.verify(kHash, std::nullopt, "").code,
            error_code::validation_failed);
}

TEST_F(engine_test, revocation_overrides_confidence) {
  auto& service = fixture_.service();
  auto degree_id = *service.submit_degree(issuer_, kHash, jane_doe()).value;
  ASSERT_TRUE(service.verify(kHash, std::nullopt, kVerifier).ok());
  ASSERT_TRUE(service.revoke(degree_id, "fraud", kAuthorityId).ok());

  auto presented = jane_doe();
  auto result = service.verify(kHash, presented, kVerifier);
  ASSERT_TRUE(result.ok());
  EXPECT_FALSE(result.value->verified);
  EXPECT_DOUBLE_EQ(result.value->confidence, 0.0);
  EXPECT_EQ(result.value->method, verification_method_t::degree_revoked);
  EXPECT_EQ(result.value->degree_id, degree_id);

  auto record = service.get_degree(degree_id);
  EXPECT_EQ(record.value->verification_count, 1u);
  auto history = service.get_verification_history(degree_id);
  ASSERT_EQ(history.value->size(), 2u);
  EXPECT_EQ((*history.value)[0].method, verification_method_t::degree_revoked);
}

TEST_F(engine_test, confidence_stays_in_unit_interval) {
  auto& service = fixture_.service();
  ASSERT_TRUE(service
                  .submit_degree(issuer_, kHash,
                                 credence::testing::make_subject_fields())
                  .ok());

  auto inputs = std::vector<std::optional<subject_fields_t>>{
      std::nullopt, subject_fields_t{}, credence::testing::make_subject_fields(),
      jane_doe()};
  auto noisy = credence::testing::make_subject_fields();
  noisy.student_name = "A1ice Johns0n";
  noisy.certificate_number = "";
  inputs.push_back(noisy);

  for (const auto& presented : inputs) {
    auto result = service.verify(kHash, presented, kVerifier);
    ASSERT_TRUE(result.ok());
    EXPECT_GE(result.value->confidence, 0.0);
    EXPECT_LE(result.value->confidence, 1.0);
  }
  auto missing = service.verify(credence::testing::make_certificate_hash(1),
                                std::nullopt, kVerifier);
  EXPECT_GE(missing.value->confidence, 0.0);
  EXPECT_LE(missing.value->confidence, 1.0);
}

TEST_F(engine_test, audit_is_complete_and_newest_first) {
  auto& service = fixture_.service();
  auto degree_id = *service.submit_degree(issuer_, kHash, jane_doe()).value;

  constexpr auto kVerifications = 5u;
  for (auto i = 0u; i < kVerifications; ++i) {
    fixture_.clock().advance(100);
    ASSERT_TRUE(
        service.verify(kHash, std::nullopt, "VERIFIER_" + std::to_string(i))
            .ok());
  }

  auto history = service.get_verification_history(degree_id);
  ASSERT_TRUE(history.ok());
  ASSERT_EQ(history.value->size(), kVerifications);
  EXPECT_EQ(history.value->front().verifier, "VERIFIER_4");
  EXPECT_EQ(history.value->back().verifier, "VERIFIER_0");
  for (std::size_t i = 1; i < history.value->size(); ++i) {
    EXPECT_GT((*history.value)[i - 1].recorded_at,
              (*history.value)[i].recorded_at);
  }
  EXPECT_EQ(service.get_degree(degree_id).value->verification_count,
            kVerifications);
}

TEST_F(weighted_engine_test, weighted_policy_favours_hash_factor) {
  auto& service = fixture_.service();
  auto stored = subject_fields_t{};
  stored.student_name = "Jane Doe";
  stored.degree_name = "Master of Arts";
  ASSERT_TRUE(service.submit_degree(issuer_, kHash, stored).ok());

  auto presented = subject_fields_t{};
  presented.student_name = "Jane Doe";
  presented.degree_name = "Bachelor of Engineering";
  auto result = service.verify(kHash, presented, kVerifier);
  ASSERT_TRUE(result.ok());
  EXPECT_DOUBLE_EQ(result.value->field_confidence.value(), 0.5);
  EXPECT_DOUBLE_EQ(result.value->confidence, 0.85);
  EXPECT_TRUE(result.value->verified);
}

TEST(verification_engine, combine_confidence_policies) {
  using credence::schema::confidence_policy_t;
  EXPECT_DOUBLE_EQ(credence::verification::combine_confidence(
                       confidence_policy_t::simple_average, 0.5),
                   0.75);
  EXPECT_DOUBLE_EQ(credence::verification::combine_confidence(
                       confidence_policy_t::weighted_blend, 0.5),
                   0.85);
  EXPECT_DOUBLE_EQ(credence::verification::combine_confidence(
                       confidence_policy_t::simple_average, 0.0),
                   0.5);
  EXPECT_DOUBLE_EQ(credence::verification::combine_confidence(
                       confidence_policy_t::weighted_blend, 1.0),
                   1.0);
}
