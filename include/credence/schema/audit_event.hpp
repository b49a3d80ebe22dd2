#pragma once

#include <credence/schema/revocation_event.hpp>
#include <credence/schema/verification_event.hpp>
#include <variant>

namespace credence::schema {

using audit_event_t = std::variant<verification_event_t, revocation_event_t>;

}  // namespace credence::schema
