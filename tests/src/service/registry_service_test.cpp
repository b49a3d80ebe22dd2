#include <credence/crypto/digest.hpp>
#include <credence/testing/registry_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace {

using credence::schema::error_code;

const auto kAuthorityId = std::string{credence::testing::kAuthority};

}  // namespace

TEST(registry_service, end_to_end_issuance_verification_revocation) {
  auto fixture = credence::testing::registry_fixture{"credence_service_e2e"};
  auto& service = fixture.service();

  auto events = std::vector<credence::schema::audit_event_t>{};
  service.set_event_listener(
      [&](const credence::schema::audit_event_t& event) {
        events.push_back(event);
      });

  auto issuer = fixture.enroll_issuer("NORTHFIELD");
  auto document = credence::schema::make_bytes(
      std::string_view{"Northfield University certifies Alice Johnson"});
  auto submitted = service.submit_document(
      issuer,
      credence::schema::bytes_view_t{document.data(), document.size()},
      credence::testing::make_subject_fields());
  ASSERT_TRUE(submitted.ok()) << submitted.log;

  auto hash = credence::crypto::certificate_hash(
      credence::schema::bytes_view_t{document.data(), document.size()});
  auto record = service.get_degree(hash);
  ASSERT_TRUE(record.ok());
  EXPECT_EQ(record.value->degree_id, *submitted.value);

  auto presented = credence::testing::make_subject_fields();
  presented.student_name = "ALICE  JOHNSON";
  auto verified = service.verify(hash, presented, "ACME_HR");
  ASSERT_TRUE(verified.ok());
  EXPECT_TRUE(verified.value->verified);
  EXPECT_GT(verified.value->confidence, 0.9);
  EXPECT_LT(verified.value->confidence, 1.0);

  ASSERT_TRUE(
      service.revoke(*submitted.value, "issued in error", kAuthorityId).ok());
  auto after = service.verify(hash, presented, "ACME_HR");
  ASSERT_TRUE(after.ok());
  EXPECT_FALSE(after.value->verified);

  ASSERT_EQ(events.size(), 3u);
  EXPECT_TRUE(std::holds_alternative<credence::schema::verification_event_t>(
      events[0]));
  EXPECT_TRUE(
      std::holds_alternative<credence::schema::revocation_event_t>(events[1]));
  EXPECT_TRUE(std::holds_alternative<credence::schema::verification_event_t>(
      events[2]));
}

TEST(registry_service, duplicate_document_is_rejected) {
  auto fixture = credence::testing::registry_fixture{"credence_service_doc"};
  auto& service = fixture.service();
  auto issuer = fixture.enroll_issuer("NORTHFIELD");
  auto document = credence::schema::bytes_t{0x25, 0x50, 0x44, 0x46};
  auto view = credence::schema::bytes_view_t{document.data(), document.size()};

  ASSERT_TRUE(service.submit_document(issuer, view, {}).ok());
  EXPECT_EQ(service.submit_document(issuer, view, {}).code,
            error_code::duplicate_certificate);
}

TEST(registry_service, history_of_unknown_degree_is_not_found) {
  auto fixture = credence::testing::registry_fixture{"credence_service_hist"};
  auto& service = fixture.service();
  auto unknown = credence::testing::make_hash(99);
  EXPECT_EQ(service.get_verification_history(unknown).code,
            error_code::degree_not_found);
  EXPECT_EQ(service.get_revocation_history(unknown).code,
            error_code::degree_not_found);
  EXPECT_EQ(service.get_degree(std::string{"xyz"}).code,
            error_code::invalid_hash);
}

TEST(registry_service, state_survives_reopen) {
  auto fixture = credence::testing::registry_fixture{"credence_service_reopen"};
  auto issuer = fixture.enroll_issuer("NORTHFIELD");
  auto hash = credence::testing::make_certificate_hash(8);
  auto degree_id =
      *fixture.service().submit_degree(issuer, hash, {}).value;
  auto first = fixture.service().verify(hash, std::nullopt, "ACME_HR");
  ASSERT_TRUE(first.ok());

  fixture.reopen_service();
  auto& service = fixture.service();
  EXPECT_EQ(service.get_organization(issuer).value->status,
            credence::schema::organization_status_t::active);
  EXPECT_EQ(service.submit_degree(issuer, hash, {}).code,
            error_code::duplicate_certificate);

  auto second = service.verify(hash, std::nullopt, "ACME_HR");
  ASSERT_TRUE(second.ok());
  EXPECT_GT(second.value->event_id.value(), first.value->event_id.value());
  EXPECT_EQ(service.get_degree(degree_id).value->verification_count, 2u);
}
