#include <spdlog/spdlog.h>
#include <algorithm>
#include <credence/audit/audit_trail.hpp>
#include <credence/schema/key/registry_keys.hpp>

using namespace credence::schema;

namespace {

constexpr auto kCodespace = "credence.audit";

template <typename Event>
void sort_newest_first(std::vector<Event>& events) {
  std::ranges::sort(events, [](const Event& lhs, const Event& rhs) {
    if (lhs.recorded_at != rhs.recorded_at) {
      return lhs.recorded_at > rhs.recorded_at;
    }
    return lhs.event_id > rhs.event_id;
  });
}

template <typename Event, typename Encoder, typename Storage>
std::vector<Event> load_events(Encoder& encoder,
                               const Storage& storage,
                               const credence::schema::bytes_t& prefix) {
  auto rows =
      storage.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()});
  auto events = std::vector<Event>{};
  events.reserve(rows.size());
  for (const auto& [key, value] : rows) {
    events.push_back(encoder.template decode<Event>(
        bytes_view_t{value.data(), value.size()}));
  }
  sort_newest_first(events);
  return events;
}

template <typename Event, typename Encoder, typename Storage>
event_id_t highest_event_id(Encoder& encoder,
                            const Storage& storage,
                            const credence::schema::bytes_t& prefix) {
  auto highest = event_id_t{0};
  for (const auto& [key, value] : storage.list_by_prefix(
           bytes_view_t{prefix.data(), prefix.size()})) {
    auto event = encoder.template decode<Event>(
        bytes_view_t{value.data(), value.size()});
    highest = std::max(highest, event.event_id);
  }
  return highest;
}

}  // namespace

namespace credence::audit {

audit_trail::audit_trail(credence::scale_encoder_t& encoder,
                         credence::rocksdb_storage_t& storage,
                         credence::common::clock_fn_t clock)
    : encoder_{encoder}, storage_{storage}, clock_{std::move(clock)} {
  load_persisted_state();
}

operation_result<verification_event_t> audit_trail::append(
    verification_event_t event) {
  auto [staged, entry] = stage(std::move(event));
  try {
    storage_.write({entry});
  } catch (const credence::storage::storage_error& ex) {
    spdlog::error("Failed to append verification event for degree {}: {}",
                  to_hex(staged.degree_id), ex.what());
    return make_failure<verification_event_t>(
        error_code::internal_error, kCodespace,
        "failed to append verification event", ex.what());
  }
  spdlog::debug("Appended verification event {} for degree {} ({})",
                staged.event_id, to_hex(staged.degree_id),
                to_string(staged.method));
  publish(staged);
  return make_success(std::move(staged));
}

operation_result<revocation_event_t> audit_trail::append(
    revocation_event_t event) {
  auto [staged, entry] = stage(std::move(event));
  try {
    storage_.write({entry});
  } catch (const credence::storage::storage_error& ex) {
    spdlog::error("Failed to append revocation event for degree {}: {}",
                  to_hex(staged.degree_id), ex.what());
    return make_failure<revocation_event_t>(
        error_code::internal_error, kCodespace,
        "failed to append revocation event", ex.what());
  }
  publish(staged);
  return make_success(std::move(staged));
}

std::pair<verification_event_t, credence::storage::key_value_entry_t>
audit_trail::stage(verification_event_t event) {
  event.event_id = next_event_id();
  event.recorded_at = stamp(event.recorded_at);
  auto event_key = key::make_verification_event_key(encoder_, event.degree_id,
                                                    event.event_id);
  auto value = encoder_.encode(event);
  return {std::move(event), {std::move(event_key), std::move(value)}};
}

std::pair<revocation_event_t, credence::storage::key_value_entry_t>
audit_trail::stage(revocation_event_t event) {
  event.event_id = next_event_id();
  event.recorded_at = stamp(event.recorded_at);
  auto event_key = key::make_revocation_event_key(encoder_, event.degree_id,
                                                  event.event_id);
  auto value = encoder_.encode(event);
  return {std::move(event), {std::move(event_key), std::move(value)}};
}

void audit_trail::publish(const audit_event_t& event) const {
  auto listener = event_listener_t{};
  {
    auto lock = std::scoped_lock{listener_mutex_};
    listener = listener_;
  }
  if (!listener) {
    return;
  }
  try {
    listener(event);
  } catch (const std::exception& ex) {
    spdlog::warn("Audit event listener failed: {}", ex.what());
  }
}

operation_result<std::vector<verification_event_t>>
audit_trail::query_by_degree(const degree_id_t& degree_id) const {
  auto prefix = key::make_audit_prefix_key(
      encoder_, key::kVerificationEventPrefix, degree_id);
  try {
    return make_success(
        load_events<verification_event_t>(encoder_, storage_, prefix));
  } catch (const credence::storage::storage_error& ex) {
    return make_failure<std::vector<verification_event_t>>(
        error_code::internal_error, kCodespace,
        "failed to read verification history", ex.what());
  }
}

operation_result<std::vector<revocation_event_t>>
audit_trail::query_revocations(const degree_id_t& degree_id) const {
  auto prefix = key::make_audit_prefix_key(
      encoder_, key::kRevocationEventPrefix, degree_id);
  try {
    return make_success(
        load_events<revocation_event_t>(encoder_, storage_, prefix));
  } catch (const credence::storage::storage_error& ex) {
    return make_failure<std::vector<revocation_event_t>>(
        error_code::internal_error, kCodespace,
        "failed to read revocation history", ex.what());
  }
}

void audit_trail::set_event_listener(event_listener_t listener) {
  auto lock = std::scoped_lock{listener_mutex_};
  listener_ = std::move(listener);
}

void audit_trail::load_persisted_state() {
  auto highest = std::max(
      highest_event_id<verification_event_t>(
          encoder_, storage_,
          key::make_prefix_key(encoder_, key::kVerificationEventPrefix)),
      highest_event_id<revocation_event_t>(
          encoder_, storage_,
          key::make_prefix_key(encoder_, key::kRevocationEventPrefix)));
  next_event_id_ = highest + 1;
  spdlog::debug("Audit trail resumes at event id {}", highest + 1);
}

event_id_t audit_trail::next_event_id() {
  return next_event_id_.fetch_add(1);
}

timestamp_milliseconds_t audit_trail::stamp(
    const timestamp_milliseconds_t recorded_at) const {
  return recorded_at != 0 ? recorded_at : clock_();
}

}  // namespace credence::audit
