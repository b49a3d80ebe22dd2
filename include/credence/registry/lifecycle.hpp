#pragma once

#include <credence/schema/degree_status.hpp>
#include <credence/schema/operation_result.hpp>
#include <credence/schema/organization_status.hpp>
#include <optional>

// Registry workflow: status transition rules for degrees and organizations.
// Every mutation path consults these before touching the store.
namespace credence::registry {

enum class degree_transition_t : uint8_t { revoke = 0 };

enum class organization_transition_t : uint8_t {
  approve = 0,
  suspend = 1,
  blacklist = 2
};

/// Status reached by applying `transition`, or std::nullopt when illegal.
std::optional<credence::schema::degree_status_t> next_status(
    credence::schema::degree_status_t current,
    degree_transition_t transition);

std::optional<credence::schema::organization_status_t> next_status(
    credence::schema::organization_status_t current,
    organization_transition_t transition);

constexpr bool is_terminal(const credence::schema::degree_status_t status) {
  return status == credence::schema::degree_status_t::revoked;
}

constexpr bool is_terminal(const credence::schema::organization_status_t status) {
  return status == credence::schema::organization_status_t::blacklisted;
}

/// ok, or already_revoked when the degree cannot be revoked again.
credence::schema::operation_status_t check_transition(
    credence::schema::degree_status_t current,
    degree_transition_t transition);

/// ok, or invalid_status_transition.
credence::schema::operation_status_t check_transition(
    credence::schema::organization_status_t current,
    organization_transition_t transition);

}  // namespace credence::registry
