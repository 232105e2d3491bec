#pragma once

#include <hybridwork/execution/optimizer.hpp>
#include <hybridwork/execution/state_store.hpp>
#include <hybridwork/fhe/coprocessor.hpp>
#include <hybridwork/schema/call_context.hpp>
#include <hybridwork/schema/operation_result.hpp>
#include <hybridwork/schema/primitives.hpp>
#include <hybridwork/schema/reveal_status.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace hybridwork::execution {

/// Decides whether an authenticated caller is a recognized employee.
using identity_verifier_t =
    std::function<bool(const hybridwork::schema::employee_id_t& caller)>;

/// Receives every event an operation emits, after it has committed.
using event_sink_t =
    std::function<void(const hybridwork::schema::schedule_event_t& event)>;

/// Verifies a co-processor proof over a reveal message.
using proof_verifier_t =
    std::function<bool(const hybridwork::schema::bytes_view_t& message,
                       const hybridwork::schema::attestor_id_t& attestor,
                       const hybridwork::schema::proof_t& proof)>;

struct engine_options final {
  hybridwork::schema::employee_id_t admin{};
  /// Key that signs decryption results.
  hybridwork::schema::attestor_id_t attestor{};
  overlap_adjacency adjacency{overlap_adjacency::member_order};
};

/// Encrypted schedule engine.
///
/// Owns the preference ledger, the team directory, the schedule optimizer,
/// the decryption request coordinator and the metric calculators. All
/// ciphertext arithmetic is delegated to the co-processor. Every mutating
/// operation either commits one storage batch or changes nothing.
class engine final {
 public:
  template <typename T>
  using result_t = hybridwork::schema::operation_result<T>;
  using accepted_t = hybridwork::schema::accepted_t;
  using ciphertext = hybridwork::fhe::ciphertext;

  /// Construct the engine over an opened store. Ledger counters and pending
  /// decryption requests are picked up from storage.
  engine(scale_encoder_t& encoder,
         rocksdb_storage_t& storage,
         hybridwork::fhe::coprocessor& coprocessor,
         engine_options options);

  // Preference ledger.

  /// Append an encrypted preference for the caller and return its record id.
  result_t<hybridwork::schema::record_id_t> submit_preference(
      const hybridwork::schema::call_context& context,
      const ciphertext& days_in_office,
      const ciphertext& team_days,
      const ciphertext& focus_days,
      const ciphertext& flexibility);

  /// Most recent record id of the employee, std::nullopt if none.
  std::optional<hybridwork::schema::record_id_t> latest_preference(
      const hybridwork::schema::employee_id_t& employee) const;

  std::optional<hybridwork::schema::preference_record_t> preference(
      hybridwork::schema::record_id_t record_id) const;

  /// All record ids of the employee in submission order.
  std::vector<hybridwork::schema::record_id_t> preference_history(
      const hybridwork::schema::employee_id_t& employee) const;

  /// Number of records in the ledger.
  uint64_t ledger_size() const;

  // Team directory.

  /// Append an employee to a team. Duplicates are kept.
  result_t<accepted_t> add_member(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::team_id_t& team,
      const hybridwork::schema::employee_id_t& employee);

  std::vector<hybridwork::schema::employee_id_t> members(
      const hybridwork::schema::team_id_t& team) const;

  // Optimizer.

  result_t<hybridwork::schema::team_schedule_t> optimize_team(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::team_id_t& team);

  /// Blend the employee's latest preference with the schedule of `team`.
  /// Rejected while a reveal of the employee is pending or after it landed,
  /// so a reveal always decrypts the schedule currently stored.
  result_t<hybridwork::schema::personal_schedule_t> assign_personal(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::employee_id_t& employee,
      const hybridwork::schema::team_id_t& team);

  result_t<hybridwork::schema::team_schedule_t> adjust_for_team_events(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::team_id_t& team,
      const ciphertext& event_days);

  result_t<hybridwork::schema::personal_schedule_t>
  adjust_for_personal_constraints(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::employee_id_t& employee,
      const ciphertext& constraint_days);

  result_t<accepted_t> optimize_cross_team_collab(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::team_id_t& first,
      const hybridwork::schema::team_id_t& second);

  std::optional<hybridwork::schema::team_schedule_t> team_schedule(
      const hybridwork::schema::team_id_t& team) const;
  std::optional<hybridwork::schema::personal_schedule_t> personal_schedule(
      const hybridwork::schema::employee_id_t& employee) const;

  // Decryption request coordinator.

  /// Ask the co-processor to decrypt the caller's personal schedule.
  /// Returns immediately with the request id; the plaintext arrives through
  /// `resolve_reveal`.
  result_t<hybridwork::schema::request_id_t> request_reveal(
      const hybridwork::schema::call_context& context);

  /// Co-processor callback. Authenticated by `proof` alone.
  result_t<hybridwork::schema::revealed_schedule_t> resolve_reveal(
      const hybridwork::schema::request_id_t& request_id,
      const hybridwork::schema::bytes_view_t& payload,
      const hybridwork::schema::proof_t& proof,
      hybridwork::schema::timestamp_milliseconds_t received_at = 0);

  /// Drop a pending request and return the employee to `assigned`.
  result_t<accepted_t> cancel_reveal(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::employee_id_t& employee);

  /// Plaintext schedule, readable by its owner only.
  result_t<hybridwork::schema::revealed_schedule_t> revealed_schedule(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::employee_id_t& employee) const;

  hybridwork::schema::reveal_status_t reveal_status(
      const hybridwork::schema::employee_id_t& employee) const;

  // Metrics.

  result_t<ciphertext> satisfaction(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::employee_id_t& employee);
  result_t<ciphertext> team_collaboration(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::team_id_t& team);
  result_t<ciphertext> flexibility_utilization(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::team_id_t& team);
  result_t<ciphertext> focus_time(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::employee_id_t& employee);
  result_t<ciphertext> efficiency(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::team_id_t& team);
  result_t<ciphertext> conflict(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::team_id_t& team);
  result_t<ciphertext> work_life_balance(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::employee_id_t& employee);
  result_t<ciphertext> remote_work_impact(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::team_id_t& team);
  result_t<ciphertext> recommendation(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::employee_id_t& employee);
  result_t<ciphertext> adherence(
      const hybridwork::schema::call_context& context,
      const hybridwork::schema::employee_id_t& employee);

  void set_identity_verifier(identity_verifier_t verifier);
  /// Events are delivered while the engine lock is held; the sink must not
  /// call back into the engine.
  void set_event_sink(event_sink_t sink);
  /// Replace proof verification. Defaults to `crypto::verify_proof`.
  void set_proof_verifier(proof_verifier_t verifier);

 private:
  struct employee_inputs final {
    hybridwork::schema::personal_schedule_t personal;
    std::optional<hybridwork::schema::preference_record_t> preference;
  };

  template <typename T>
  std::optional<result_t<T>> authorize_admin(
      const hybridwork::schema::call_context& context,
      std::string_view codespace) const;

  template <typename T>
  std::optional<result_t<T>> authorize_employee(
      const hybridwork::schema::call_context& context,
      std::string_view codespace) const;

  /// Assigned personal schedule with the latest preference, or the failure.
  template <typename T>
  std::optional<result_t<T>> load_assigned(
      const hybridwork::schema::employee_id_t& employee,
      bool require_preference,
      std::string_view codespace,
      employee_inputs& inputs) const;

  /// Failure when the personal schedule is locked by a pending or completed
  /// reveal.
  template <typename T>
  std::optional<result_t<T>> check_schedule_unlocked(
      const hybridwork::schema::employee_id_t& employee,
      std::string_view codespace) const;

  template <typename T>
  std::optional<result_t<T>> load_optimized(
      const hybridwork::schema::team_id_t& team,
      std::string_view codespace,
      hybridwork::schema::team_schedule_t& schedule) const;

  template <typename T, typename Compute>
  result_t<T> run_arithmetic(std::string_view codespace, Compute&& compute);

  void publish(const std::vector<hybridwork::schema::schedule_event_t>& events);

  std::optional<hybridwork::schema::preference_record_t> latest_record(
      const hybridwork::schema::employee_id_t& employee) const;

  mutable std::mutex mutex_;
  scale_encoder_t& encoder_;
  rocksdb_storage_t& storage_;
  state_store store_;
  hybridwork::fhe::coprocessor& coprocessor_;
  engine_options options_;
  identity_verifier_t identity_verifier_;
  event_sink_t event_sink_;
  proof_verifier_t proof_verifier_;
  hybridwork::schema::record_id_t last_record_id_{};
};

}  // namespace hybridwork::execution
