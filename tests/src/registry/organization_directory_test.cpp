#include <credence/testing/registry_fixture.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using credence::schema::error_code;
using credence::schema::organization_status_t;

const auto kAuthorityId = std::string{credence::testing::kAuthority};

credence::schema::organization_metadata_t make_metadata(
    const std::string& name) {
  auto metadata = credence::schema::organization_metadata_t{};
  metadata.name = name;
  metadata.country = "GB";
  metadata.contact_email = "registrar@example.edu";
  return metadata;
}

}  // namespace

TEST(organization_directory, bootstrap_enrolls_active_authority_once) {
  auto fixture = credence::testing::registry_fixture{"credence_dir_boot"};
  auto authority = fixture.service().get_organization(kAuthorityId);
  ASSERT_TRUE(authority.ok());
  EXPECT_EQ(authority.value->status, organization_status_t::active);
  EXPECT_EQ(authority.value->stake, 0);

  auto again = fixture.service().bootstrap();
  ASSERT_TRUE(again.ok());
  EXPECT_EQ(again.value->enrolled_at, authority.value->enrolled_at);
  EXPECT_EQ(fixture.service().list_organizations().value->size(), 1u);
}

TEST(organization_directory, registration_starts_pending) {
  auto fixture = credence::testing::registry_fixture{"credence_dir_register"};
  auto& service = fixture.service();

  auto registered = service.register_organization(
      "OXFORD", make_metadata("University of Oxford"), 1000);
  ASSERT_TRUE(registered.ok()) << registered.log;
  EXPECT_EQ(registered.value->status, organization_status_t::pending);
  EXPECT_EQ(registered.value->country, "GB");

  auto duplicate =
      service.register_organization("OXFORD", make_metadata("Other"), 5000);
  EXPECT_EQ(duplicate.code, error_code::duplicate_organization);
  EXPECT_EQ(duplicate.codespace, "credence.directory");
  EXPECT_EQ(service.get_organization("OXFORD").value->name,
            "University of Oxford");
}

TEST(organization_directory, registration_validation) {
  auto fixture = credence::testing::registry_fixture{"credence_dir_validate"};
  auto& service = fixture.service();

  EXPECT_EQ(
      service.register_organization("OXFORD", make_metadata("Oxford"), 999)
          .code,
      error_code::insufficient_stake);
  EXPECT_EQ(
      service.register_organization("oxford", make_metadata("Oxford"), 1000)
          .code,
      error_code::validation_failed);
  EXPECT_EQ(service.register_organization("X", make_metadata("X"), 1000).code,
            error_code::validation_failed);
  EXPECT_EQ(service.register_organization("OXFORD", make_metadata(""), 1000)
                .code,
            error_code::validation_failed);
  EXPECT_EQ(service.get_organization("OXFORD").code,
            error_code::organization_not_found);
}

TEST(organization_directory, minimum_stake_is_configurable) {
  auto options = credence::service::service_options{};
  options.directory.minimum_stake = 10;
  auto fixture =
      credence::testing::registry_fixture{"credence_dir_stake", options};
  EXPECT_TRUE(fixture.service()
                  .register_organization("SMALL_COLLEGE",
                                         make_metadata("Small College"), 10)
                  .ok());
}

TEST(organization_directory, status_changes_require_authority) {
  auto fixture = credence::testing::registry_fixture{"credence_dir_authz"};
  auto& service = fixture.service();
  ASSERT_TRUE(
      service.register_organization("MIT", make_metadata("MIT"), 2000).ok());
  fixture.enroll_issuer("HARVARD");

  auto approved = service.approve_organization("MIT", "HARVARD");
  EXPECT_EQ(approved.code, error_code::unauthorized);
  EXPECT_EQ(service.get_organization("MIT").value->status,
            organization_status_t::pending);

  EXPECT_EQ(service.blacklist_organization("MIT", "fraud", "MIT").code,
            error_code::unauthorized);
  EXPECT_EQ(service.approve_organization("NOBODY", kAuthorityId).code,
            error_code::organization_not_found);
}

TEST(organization_directory, full_status_lifecycle) {
  auto fixture = credence::testing::registry_fixture{"credence_dir_cycle"};
  auto& service = fixture.service();
  ASSERT_TRUE(
      service.register_organization("MIT", make_metadata("MIT"), 2000).ok());

  EXPECT_EQ(service.suspend_organization("MIT", "early", kAuthorityId).code,
            error_code::invalid_status_transition);

  auto approved = service.approve_organization("MIT", kAuthorityId);
  ASSERT_TRUE(approved.ok());
  EXPECT_EQ(approved.value->status, organization_status_t::active);

  auto suspended =
      service.suspend_organization("MIT", "accreditation review", kAuthorityId);
  ASSERT_TRUE(suspended.ok());
  EXPECT_EQ(suspended.value->status, organization_status_t::suspended);
  EXPECT_EQ(suspended.value->status_reason, "accreditation review");

  ASSERT_TRUE(service.approve_organization("MIT", kAuthorityId).ok());

  auto blacklisted =
      service.blacklist_organization("MIT", "diploma mill", kAuthorityId);
  ASSERT_TRUE(blacklisted.ok());
  EXPECT_EQ(blacklisted.value->status, organization_status_t::blacklisted);

  EXPECT_EQ(service.approve_organization("MIT", kAuthorityId).code,
            error_code::invalid_status_transition);
  EXPECT_EQ(service.blacklist_organization("MIT", "again", kAuthorityId).code,
            error_code::invalid_status_transition);
}

TEST(organization_directory, authority_cannot_be_demoted) {
  auto fixture = credence::testing::registry_fixture{"credence_dir_self"};
  auto& service = fixture.service();
  EXPECT_EQ(
      service.suspend_organization(kAuthorityId, "oops", kAuthorityId).code,
      error_code::invalid_status_transition);
  EXPECT_EQ(
      service.blacklist_organization(kAuthorityId, "oops", kAuthorityId).code,
      error_code::invalid_status_transition);
  EXPECT_EQ(service.get_organization(kAuthorityId).value->status,
            organization_status_t::active);
}

TEST(organization_directory, list_is_ordered_by_id) {
  auto fixture = credence::testing::registry_fixture{"credence_dir_list"};
  fixture.enroll_issuer("ZURICH");
  fixture.enroll_issuer("BERKELEY");

  auto organizations = fixture.service().list_organizations();
  ASSERT_TRUE(organizations.ok());
  ASSERT_EQ(organizations.value->size(), 3u);
  EXPECT_EQ((*organizations.value)[0].organization_id, kAuthorityId);
  EXPECT_EQ((*organizations.value)[1].organization_id, "BERKELEY");
  EXPECT_EQ((*organizations.value)[2].organization_id, "ZURICH");
}
