#pragma once

#include <credence/common/clock.hpp>
#include <credence/schema/audit_event.hpp>
#include <credence/schema/encoding/scale/encoder.hpp>
#include <credence/schema/operation_result.hpp>
#include <credence/schema/primitives.hpp>
#include <credence/storage/rocksdb/storage.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace credence::audit {

/// Notified after an event has been committed.
using event_listener_t =
    std::function<void(const credence::schema::audit_event_t&)>;

/// Append-only, per-degree log of verification and revocation events.
///
/// Events are immutable once written. Event ids are unique for the lifetime
/// of the store: on construction the trail resumes numbering after the
/// highest persisted id.
class audit_trail final {
 public:
  explicit audit_trail(credence::scale_encoder_t& encoder,
                       credence::rocksdb_storage_t& storage,
                       credence::common::clock_fn_t clock =
                           credence::common::system_clock());

  audit_trail(const audit_trail&) = delete;
  audit_trail& operator=(const audit_trail&) = delete;

  /// Persist a verification event.
  ///
  /// `event_id` is assigned here; `recorded_at` is stamped when left zero.
  /// Fails only with internal_error.
  credence::schema::operation_result<credence::schema::verification_event_t>
  append(credence::schema::verification_event_t event);

  /// Persist a revocation event. Same contract as the verification overload.
  credence::schema::operation_result<credence::schema::revocation_event_t>
  append(credence::schema::revocation_event_t event);

  /// Assign id/timestamp and encode an event without writing it, so the
  /// caller can commit it in its own atomic batch. Call publish() once the
  /// batch is committed.
  std::pair<credence::schema::verification_event_t,
            credence::storage::key_value_entry_t>
  stage(credence::schema::verification_event_t event);

  std::pair<credence::schema::revocation_event_t,
            credence::storage::key_value_entry_t>
  stage(credence::schema::revocation_event_t event);

  /// Deliver a committed event to the listener, if any.
  void publish(const credence::schema::audit_event_t& event) const;

  /// Verification events of one degree, newest first.
  credence::schema::operation_result<
      std::vector<credence::schema::verification_event_t>>
  query_by_degree(const credence::schema::degree_id_t& degree_id) const;

  /// Revocation events of one degree, newest first.
  credence::schema::operation_result<
      std::vector<credence::schema::revocation_event_t>>
  query_revocations(const credence::schema::degree_id_t& degree_id) const;

  void set_event_listener(event_listener_t listener);

 private:
  void load_persisted_state();
  credence::schema::event_id_t next_event_id();
  credence::schema::timestamp_milliseconds_t stamp(
      credence::schema::timestamp_milliseconds_t recorded_at) const;

  credence::scale_encoder_t& encoder_;
  credence::rocksdb_storage_t& storage_;
  credence::common::clock_fn_t clock_;
  std::atomic<credence::schema::event_id_t> next_event_id_{1};
  mutable std::mutex listener_mutex_;
  event_listener_t listener_;
};

}  // namespace credence::audit
