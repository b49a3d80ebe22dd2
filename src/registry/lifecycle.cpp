#include <credence/registry/lifecycle.hpp>
#include <string>

using namespace credence::schema;

namespace {

constexpr auto kCodespace = "credence.lifecycle";

constexpr std::string_view to_string(
    const credence::registry::organization_transition_t transition) {
  switch (transition) {
    case credence::registry::organization_transition_t::approve:
      return "approve";
    case credence::registry::organization_transition_t::suspend:
      return "suspend";
    case credence::registry::organization_transition_t::blacklist:
      return "blacklist";
  }
  return "unknown";
}

}  // namespace

namespace credence::registry {

std::optional<degree_status_t> next_status(
    const degree_status_t current,
    const degree_transition_t transition) {
  switch (transition) {
    case degree_transition_t::revoke:
      if (current == degree_status_t::active) {
        return degree_status_t::revoked;
      }
      return std::nullopt;
  }
  return std::nullopt;
}

std::optional<organization_status_t> next_status(
    const organization_status_t current,
    const organization_transition_t transition) {
  switch (transition) {
    case organization_transition_t::approve:
      if (current == organization_status_t::pending ||
          current == organization_status_t::suspended) {
        return organization_status_t::active;
      }
      return std::nullopt;
    case organization_transition_t::suspend:
      if (current == organization_status_t::active) {
        return organization_status_t::suspended;
      }
      return std::nullopt;
    case organization_transition_t::blacklist:
      if (!is_terminal(current)) {
        return organization_status_t::blacklisted;
      }
      return std::nullopt;
  }
  return std::nullopt;
}

operation_status_t check_transition(const degree_status_t current,
                                    const degree_transition_t transition) {
  if (!next_status(current, transition)) {
    return make_failure<std::monostate>(error_code::already_revoked,
                                        kCodespace, "degree already revoked",
                                        std::string{to_string(current)});
  }
  return make_success();
}

operation_status_t check_transition(
    const organization_status_t current,
    const organization_transition_t transition) {
  if (!next_status(current, transition)) {
    return make_failure<std::monostate>(
        error_code::invalid_status_transition, kCodespace,
        "illegal organization status transition",
        std::string{to_string(transition)} + " from " +
            std::string{to_string(current)});
  }
  return make_success();
}

}  // namespace credence::registry
