#include <spdlog/spdlog.h>
#include <hybridwork/common/critical.hpp>
#include <hybridwork/crypto/verify.hpp>
#include <hybridwork/execution/engine.hpp>
#include <hybridwork/execution/metrics.hpp>
#include <hybridwork/fhe/attestation.hpp>
#include <initializer_list>
#include <string>
#include <utility>

using namespace hybridwork::schema;

namespace {

constexpr auto kLedgerCodespace = std::string_view{"hybridwork.ledger"};
constexpr auto kDirectoryCodespace = std::string_view{"hybridwork.directory"};
constexpr auto kOptimizerCodespace = std::string_view{"hybridwork.optimizer"};
constexpr auto kCoordinatorCodespace =
    std::string_view{"hybridwork.coordinator"};
constexpr auto kMetricsCodespace = std::string_view{"hybridwork.metrics"};

template <typename T>
operation_result<T> make_error(const error_code code,
                               const error_category category,
                               const std::string_view codespace,
                               std::string log) {
  spdlog::warn("{} rejected ({}): {}", codespace, to_string(category), log);
  auto result = operation_result<T>{};
  result.code = code;
  result.category = category;
  result.codespace = std::string{codespace};
  result.log = std::move(log);
  return result;
}

template <typename T>
operation_result<T> make_precondition_error(const error_code code,
                                            const std::string_view codespace,
                                            std::string log) {
  return make_error<T>(code, error_category::precondition_failed, codespace,
                       std::move(log));
}

template <typename T>
operation_result<T> make_protocol_error(const error_code code,
                                        std::string log) {
  return make_error<T>(code, error_category::protocol_failed,
                       kCoordinatorCodespace, std::move(log));
}

template <typename T>
operation_result<T> make_success(T value,
                                 const std::string_view codespace,
                                 std::vector<schedule_event_t> events = {}) {
  auto result = operation_result<T>{};
  result.codespace = std::string{codespace};
  result.value = std::move(value);
  result.events = std::move(events);
  return result;
}

event_attribute_t make_id_attribute(std::string key, const hash32_t& id) {
  return event_attribute_t{.key = std::move(key),
                           .value = to_hex(bytes_view_t{id}),
                           .index = true};
}

schedule_event_t make_event(const event_type_t type,
                            std::vector<event_attribute_t> attributes) {
  return schedule_event_t{.type = type, .attributes = std::move(attributes)};
}

bool has_empty(std::initializer_list<const hybridwork::fhe::ciphertext*> values) {
  for (const auto* value : values) {
    if (value->empty()) {
      return true;
    }
  }
  return false;
}

}  // namespace

namespace hybridwork::execution {

engine::engine(scale_encoder_t& encoder,
               rocksdb_storage_t& storage,
               hybridwork::fhe::coprocessor& coprocessor,
               engine_options options)
    : encoder_{encoder},
      storage_{storage},
      store_{encoder, storage},
      coprocessor_{coprocessor},
      options_{std::move(options)},
      identity_verifier_{[](const employee_id_t& caller) {
        return !is_zero_hash(caller);
      }},
      proof_verifier_{&hybridwork::crypto::verify_proof} {
  auto lock = std::scoped_lock{mutex_};
  if (is_zero_hash(options_.admin)) {
    spdlog::warn("No admin identity configured; admin operations disabled");
  }
  last_record_id_ = store_.last_record_id();
  spdlog::info("Schedule engine ready with {} ledger record(s), adjacency {}",
               last_record_id_,
               hybridwork::schema::to_string(options_.adjacency,
                                             kOverlapAdjacencyMappings)
                   .value_or("unknown"));
}

template <typename T>
std::optional<operation_result<T>> engine::authorize_admin(
    const call_context& context,
    const std::string_view codespace) const {
  if (is_zero_hash(options_.admin) || context.caller != options_.admin) {
    return make_error<T>(error_code::authorization_denied,
                         error_category::authorization_failed, codespace,
                         "caller " + short_id(context.caller) +
                             " is not the admin");
  }
  return std::nullopt;
}

template <typename T>
std::optional<operation_result<T>> engine::authorize_employee(
    const call_context& context,
    const std::string_view codespace) const {
  if (is_zero_hash(context.caller) || !identity_verifier_ ||
      !identity_verifier_(context.caller)) {
    return make_error<T>(error_code::unrecognized_caller,
                         error_category::authorization_failed, codespace,
                         "caller " + short_id(context.caller) +
                             " is not a recognized employee");
  }
  return std::nullopt;
}

template <typename T>
std::optional<operation_result<T>> engine::load_assigned(
    const employee_id_t& employee,
    const bool require_preference,
    const std::string_view codespace,
    employee_inputs& inputs) const {
  auto personal = store_.personal_schedule(employee);
  if (!personal || !personal->assigned) {
    return make_precondition_error<T>(
        error_code::not_assigned, codespace,
        "personal schedule of " + short_id(employee) + " is not assigned");
  }
  inputs.personal = std::move(*personal);
  if (require_preference) {
    inputs.preference = latest_record(employee);
    if (!inputs.preference) {
      return make_precondition_error<T>(
          error_code::no_preference, codespace,
          "employee " + short_id(employee) + " has no preference");
    }
  }
  return std::nullopt;
}

template <typename T>
std::optional<operation_result<T>> engine::check_schedule_unlocked(
    const employee_id_t& employee,
    const std::string_view codespace) const {
  auto state = store_.reveal_state(employee);
  if (!state) {
    return std::nullopt;
  }
  switch (state->status) {
    case reveal_status_t::request_pending:
      return make_precondition_error<T>(
          error_code::reveal_pending, codespace,
          "a reveal request for " + short_id(employee) + " is pending");
    case reveal_status_t::revealed:
      return make_precondition_error<T>(
          error_code::already_revealed, codespace,
          "schedule of " + short_id(employee) + " is already revealed");
    case reveal_status_t::unassigned:
    case reveal_status_t::assigned:
      break;
  }
  return std::nullopt;
}

template <typename T>
std::optional<operation_result<T>> engine::load_optimized(
    const team_id_t& team,
    const std::string_view codespace,
    team_schedule_t& schedule) const {
  auto stored = store_.team_schedule(team);
  if (!stored || !stored->optimized) {
    return make_precondition_error<T>(
        error_code::team_not_optimized, codespace,
        "team " + short_id(team) + " is not optimized");
  }
  schedule = std::move(*stored);
  return std::nullopt;
}

template <typename T, typename Compute>
operation_result<T> engine::run_arithmetic(const std::string_view codespace,
                                           Compute&& compute) {
  try {
    return compute();
  } catch (const hybridwork::fhe::arithmetic_error& ex) {
    return make_error<T>(error_code::arithmetic_degenerate,
                         error_category::arithmetic_degenerate, codespace,
                         ex.what());
  }
}

void engine::publish(const std::vector<schedule_event_t>& events) {
  if (!event_sink_) {
    return;
  }
  for (const auto& event : events) {
    event_sink_(event);
  }
}

std::optional<preference_record_t> engine::latest_record(
    const employee_id_t& employee) const {
  auto record_id = store_.latest_preference(employee);
  if (!record_id) {
    return std::nullopt;
  }
  auto record = store_.preference(*record_id);
  if (!record) {
    hybridwork::common::critical("latest index points at a missing record");
  }
  return record;
}

operation_result<record_id_t> engine::submit_preference(
    const call_context& context,
    const ciphertext& days_in_office,
    const ciphertext& team_days,
    const ciphertext& focus_days,
    const ciphertext& flexibility) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_employee<record_id_t>(context, kLedgerCodespace)) {
    return *denied;
  }
  if (has_empty({&days_in_office, &team_days, &focus_days, &flexibility})) {
    return make_precondition_error<record_id_t>(
        error_code::invalid_argument, kLedgerCodespace,
        "preference carries an empty ciphertext");
  }

  return run_arithmetic<record_id_t>(kLedgerCodespace, [&] {
    auto record = preference_record_t{};
    record.record_id = last_record_id_ + 1;
    record.employee = context.caller;
    record.days_in_office = days_in_office;
    record.team_days = team_days;
    record.focus_days = focus_days;
    record.flexibility = flexibility;
    record.submitted_at = context.now;

    auto writes = write_set{encoder_};
    writes.put_record_sequence(record.record_id);
    writes.put_preference(record);
    if (!store_.personal_schedule(record.employee)) {
      auto zero = coprocessor_.encrypt(0);
      writes.put_personal_schedule(
          personal_schedule_t{.employee = record.employee,
                              .office_days = zero,
                              .collab_days = zero});
      writes.put_revealed_schedule(
          revealed_schedule_t{.employee = record.employee});
      writes.put_reveal_state(reveal_state_t{.employee = record.employee});
    }
    writes.commit(storage_);
    last_record_id_ = record.record_id;

    spdlog::debug("Recorded preference {} for {}", record.record_id,
                  short_id(record.employee));
    auto events = std::vector<schedule_event_t>{make_event(
        event_type_t::submitted,
        {event_attribute_t{.key = "record_id",
                           .value = std::to_string(record.record_id),
                           .index = true},
         make_id_attribute("employee", record.employee)})};
    publish(events);
    return make_success(record.record_id, kLedgerCodespace,
                        std::move(events));
  });
}

std::optional<record_id_t> engine::latest_preference(
    const employee_id_t& employee) const {
  auto lock = std::scoped_lock{mutex_};
  return store_.latest_preference(employee);
}

std::optional<preference_record_t> engine::preference(
    const record_id_t record_id) const {
  auto lock = std::scoped_lock{mutex_};
  return store_.preference(record_id);
}

std::vector<record_id_t> engine::preference_history(
    const employee_id_t& employee) const {
  auto lock = std::scoped_lock{mutex_};
  return store_.preference_history(employee);
}

uint64_t engine::ledger_size() const {
  auto lock = std::scoped_lock{mutex_};
  return last_record_id_;
}

operation_result<accepted_t> engine::add_member(const call_context& context,
                                                const team_id_t& team,
                                                const employee_id_t& employee) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = authorize_admin<accepted_t>(context, kDirectoryCodespace)) {
    return *denied;
  }
  if (is_zero_hash(team) || is_zero_hash(employee)) {
    return make_precondition_error<accepted_t>(
        error_code::invalid_argument, kDirectoryCodespace,
        "team and employee must be non-zero");
  }
  auto team_members = store_.members(team);
  team_members.push_back(employee);

  auto writes = write_set{encoder_};
  writes.put_members(team, team_members);
  writes.commit(storage_);
  spdlog::debug("Team {} now has {} member(s)", short_id(team),
                team_members.size());
  return make_success(accepted_t{}, kDirectoryCodespace);
}

std::vector<employee_id_t> engine::members(const team_id_t& team) const {
  auto lock = std::scoped_lock{mutex_};
  return store_.members(team);
}

operation_result<team_schedule_t> engine::optimize_team(
    const call_context& context,
    const team_id_t& team) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_admin<team_schedule_t>(context, kOptimizerCodespace)) {
    return *denied;
  }
  auto team_members = store_.members(team);
  if (team_members.empty()) {
    return make_precondition_error<team_schedule_t>(
        error_code::empty_team, kOptimizerCodespace,
        "team " + short_id(team) + " has no members");
  }

  auto member_preferences = std::vector<std::optional<preference_record_t>>{};
  member_preferences.reserve(team_members.size());
  for (const auto& member : team_members) {
    member_preferences.push_back(latest_record(member));
  }

  return run_arithmetic<team_schedule_t>(kOptimizerCodespace, [&] {
    auto computed = compute_team_schedule(coprocessor_, member_preferences,
                                          options_.adjacency);
    auto schedule = team_schedule_t{};
    schedule.team = team;
    schedule.office_days = computed.office_days;
    schedule.collab_days = computed.collab_days;
    schedule.overlap_score = computed.overlap_score;
    schedule.optimized = true;
    schedule.optimized_at = context.now;

    auto writes = write_set{encoder_};
    writes.put_team_schedule(schedule);
    writes.commit(storage_);

    spdlog::info("Optimized team {} over {} member(s)", short_id(team),
                 team_members.size());
    auto events = std::vector<schedule_event_t>{make_event(
        event_type_t::optimized, {make_id_attribute("team", team)})};
    publish(events);
    return make_success(std::move(schedule), kOptimizerCodespace,
                        std::move(events));
  });
}

operation_result<personal_schedule_t> engine::assign_personal(
    const call_context& context,
    const employee_id_t& employee,
    const team_id_t& team) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_admin<personal_schedule_t>(context, kOptimizerCodespace)) {
    return *denied;
  }
  auto team_schedule = team_schedule_t{};
  if (auto failed = load_optimized<personal_schedule_t>(
          team, kOptimizerCodespace, team_schedule)) {
    return *failed;
  }
  auto preference = latest_record(employee);
  if (!preference) {
    return make_precondition_error<personal_schedule_t>(
        error_code::no_preference, kOptimizerCodespace,
        "employee " + short_id(employee) + " has no preference");
  }
  if (auto locked = check_schedule_unlocked<personal_schedule_t>(
          employee, kOptimizerCodespace)) {
    return *locked;
  }

  return run_arithmetic<personal_schedule_t>(kOptimizerCodespace, [&] {
    auto [office_days, collab_days] =
        blend_personal_schedule(coprocessor_, *preference, team_schedule);
    auto personal = personal_schedule_t{};
    personal.employee = employee;
    personal.team = team;
    personal.office_days = office_days;
    personal.collab_days = collab_days;
    personal.assigned = true;

    auto state = store_.reveal_state(employee).value_or(
        reveal_state_t{.employee = employee});
    auto writes = write_set{encoder_};
    writes.put_personal_schedule(personal);
    if (state.status == reveal_status_t::unassigned) {
      state.status = reveal_status_t::assigned;
      writes.put_reveal_state(state);
    }
    writes.commit(storage_);

    spdlog::info("Assigned {} to team {}", short_id(employee),
                 short_id(team));
    auto events = std::vector<schedule_event_t>{make_event(
        event_type_t::assigned, {make_id_attribute("employee", employee),
                                 make_id_attribute("team", team)})};
    publish(events);
    return make_success(std::move(personal), kOptimizerCodespace,
                        std::move(events));
  });
}

operation_result<team_schedule_t> engine::adjust_for_team_events(
    const call_context& context,
    const team_id_t& team,
    const ciphertext& event_days) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_admin<team_schedule_t>(context, kOptimizerCodespace)) {
    return *denied;
  }
  if (event_days.empty()) {
    return make_precondition_error<team_schedule_t>(
        error_code::invalid_argument, kOptimizerCodespace,
        "event day count is an empty ciphertext");
  }
  auto schedule = team_schedule_t{};
  if (auto failed = load_optimized<team_schedule_t>(team, kOptimizerCodespace,
                                                    schedule)) {
    return *failed;
  }
  return run_arithmetic<team_schedule_t>(kOptimizerCodespace, [&] {
    auto adjusted = execution::adjust_for_team_events(
        coprocessor_, std::move(schedule), event_days);
    auto writes = write_set{encoder_};
    writes.put_team_schedule(adjusted);
    writes.commit(storage_);
    spdlog::info("Adjusted team {} for events", short_id(team));
    return make_success(std::move(adjusted), kOptimizerCodespace);
  });
}

operation_result<personal_schedule_t> engine::adjust_for_personal_constraints(
    const call_context& context,
    const employee_id_t& employee,
    const ciphertext& constraint_days) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_admin<personal_schedule_t>(context, kOptimizerCodespace)) {
    return *denied;
  }
  if (constraint_days.empty()) {
    return make_precondition_error<personal_schedule_t>(
        error_code::invalid_argument, kOptimizerCodespace,
        "constraint day count is an empty ciphertext");
  }
  auto inputs = employee_inputs{};
  if (auto failed = load_assigned<personal_schedule_t>(
          employee, false, kOptimizerCodespace, inputs)) {
    return *failed;
  }
  if (auto locked = check_schedule_unlocked<personal_schedule_t>(
          employee, kOptimizerCodespace)) {
    return *locked;
  }
  return run_arithmetic<personal_schedule_t>(kOptimizerCodespace, [&] {
    auto adjusted = execution::adjust_for_personal_constraints(
        coprocessor_, std::move(inputs.personal), constraint_days);
    auto writes = write_set{encoder_};
    writes.put_personal_schedule(adjusted);
    writes.commit(storage_);
    spdlog::info("Adjusted {} for personal constraints", short_id(employee));
    return make_success(std::move(adjusted), kOptimizerCodespace);
  });
}

operation_result<accepted_t> engine::optimize_cross_team_collab(
    const call_context& context,
    const team_id_t& first,
    const team_id_t& second) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = authorize_admin<accepted_t>(context, kOptimizerCodespace)) {
    return *denied;
  }
  if (first == second) {
    return make_precondition_error<accepted_t>(
        error_code::invalid_argument, kOptimizerCodespace,
        "cross-team collaboration needs two distinct teams");
  }
  auto first_schedule = team_schedule_t{};
  if (auto failed = load_optimized<accepted_t>(first, kOptimizerCodespace,
                                               first_schedule)) {
    return *failed;
  }
  auto second_schedule = team_schedule_t{};
  if (auto failed = load_optimized<accepted_t>(second, kOptimizerCodespace,
                                               second_schedule)) {
    return *failed;
  }
  return run_arithmetic<accepted_t>(kOptimizerCodespace, [&] {
    auto [first_adjusted, second_adjusted] = execution::optimize_cross_team_collab(
        coprocessor_, std::move(first_schedule), std::move(second_schedule));
    auto writes = write_set{encoder_};
    writes.put_team_schedule(first_adjusted);
    writes.put_team_schedule(second_adjusted);
    writes.commit(storage_);
    spdlog::info("Shared collaboration days between teams {} and {}",
                 short_id(first), short_id(second));
    return make_success(accepted_t{}, kOptimizerCodespace);
  });
}

std::optional<team_schedule_t> engine::team_schedule(
    const team_id_t& team) const {
  auto lock = std::scoped_lock{mutex_};
  return store_.team_schedule(team);
}

std::optional<personal_schedule_t> engine::personal_schedule(
    const employee_id_t& employee) const {
  auto lock = std::scoped_lock{mutex_};
  return store_.personal_schedule(employee);
}

operation_result<request_id_t> engine::request_reveal(
    const call_context& context) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_employee<request_id_t>(context, kCoordinatorCodespace)) {
    return *denied;
  }
  const auto& employee = context.caller;
  auto state =
      store_.reveal_state(employee).value_or(reveal_state_t{.employee = employee});
  switch (state.status) {
    case reveal_status_t::revealed:
      return make_precondition_error<request_id_t>(
          error_code::already_revealed, kCoordinatorCodespace,
          "schedule of " + short_id(employee) + " is already revealed");
    case reveal_status_t::request_pending:
      return make_precondition_error<request_id_t>(
          error_code::reveal_pending, kCoordinatorCodespace,
          "a reveal request for " + short_id(employee) + " is pending");
    case reveal_status_t::unassigned:
      return make_precondition_error<request_id_t>(
          error_code::not_assigned, kCoordinatorCodespace,
          "personal schedule of " + short_id(employee) + " is not assigned");
    case reveal_status_t::assigned:
      break;
  }
  auto inputs = employee_inputs{};
  if (auto failed = load_assigned<request_id_t>(employee, false,
                                                kCoordinatorCodespace, inputs)) {
    return *failed;
  }

  return run_arithmetic<request_id_t>(kCoordinatorCodespace, [&] {
    const auto& personal = inputs.personal;
    auto request_id = coprocessor_.request_decryption(
        {coprocessor_.serialize(personal.office_days),
         coprocessor_.serialize(personal.collab_days)});

    auto request = decryption_request_t{};
    request.request_id = request_id;
    request.target = reveal_target_t::personal_schedule;
    request.employee = employee;
    request.handles = {personal.office_days.handle(),
                       personal.collab_days.handle()};
    request.requested_at = context.now;

    state.status = reveal_status_t::request_pending;
    state.pending_request = request_id;

    auto writes = write_set{encoder_};
    writes.put_pending_request(request);
    writes.put_reveal_state(state);
    writes.commit(storage_);

    spdlog::info("Requested reveal {} for {}", short_id(request_id),
                 short_id(employee));
    return make_success(request_id, kCoordinatorCodespace);
  });
}

operation_result<revealed_schedule_t> engine::resolve_reveal(
    const request_id_t& request_id,
    const bytes_view_t& payload,
    const proof_t& proof,
    const timestamp_milliseconds_t received_at) {
  auto lock = std::scoped_lock{mutex_};
  auto request = store_.pending_request(request_id);
  if (!request) {
    return make_protocol_error<revealed_schedule_t>(
        error_code::unknown_request,
        "no pending request " + short_id(request_id));
  }

  auto message = hybridwork::fhe::make_reveal_message(request_id, payload);
  if (!proof_verifier_ ||
      !proof_verifier_(bytes_view_t{message}, options_.attestor, proof)) {
    return make_protocol_error<revealed_schedule_t>(
        error_code::invalid_proof,
        "proof for request " + short_id(request_id) + " does not verify");
  }

  auto values = hybridwork::fhe::decode_reveal_payload(payload, 2);
  if (!values) {
    return make_protocol_error<revealed_schedule_t>(
        error_code::malformed_payload,
        "payload for request " + short_id(request_id) +
            " is not two uint32 values");
  }

  const auto& employee = request->employee;
  auto state =
      store_.reveal_state(employee).value_or(reveal_state_t{.employee = employee});
  auto existing = store_.revealed_schedule(employee);
  if (state.status == reveal_status_t::revealed ||
      (existing && existing->revealed)) {
    return make_protocol_error<revealed_schedule_t>(
        error_code::already_revealed,
        "schedule of " + short_id(employee) + " is already revealed");
  }

  auto revealed = revealed_schedule_t{};
  revealed.employee = employee;
  revealed.office_days = (*values)[0];
  revealed.collab_days = (*values)[1];
  revealed.revealed = true;
  revealed.revealed_at = received_at;

  state.status = reveal_status_t::revealed;
  state.pending_request.reset();

  auto writes = write_set{encoder_};
  writes.put_revealed_schedule(revealed);
  writes.put_reveal_state(state);
  writes.erase_pending_request(request_id);
  writes.commit(storage_);

  spdlog::info("Resolved reveal {} for {}", short_id(request_id),
               short_id(employee));
  auto events = std::vector<schedule_event_t>{make_event(
      event_type_t::revealed, {make_id_attribute("employee", employee)})};
  publish(events);
  return make_success(std::move(revealed), kCoordinatorCodespace,
                      std::move(events));
}

operation_result<accepted_t> engine::cancel_reveal(
    const call_context& context,
    const employee_id_t& employee) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_admin<accepted_t>(context, kCoordinatorCodespace)) {
    return *denied;
  }
  auto state = store_.reveal_state(employee);
  if (!state || state->status != reveal_status_t::request_pending ||
      !state->pending_request) {
    return make_precondition_error<accepted_t>(
        error_code::no_pending_reveal, kCoordinatorCodespace,
        "no pending reveal for " + short_id(employee));
  }

  auto cancelled = *state->pending_request;
  state->status = reveal_status_t::assigned;
  state->pending_request.reset();

  auto writes = write_set{encoder_};
  writes.erase_pending_request(cancelled);
  writes.put_reveal_state(*state);
  writes.commit(storage_);

  spdlog::info("Cancelled reveal {} for {}", short_id(cancelled),
               short_id(employee));
  return make_success(accepted_t{}, kCoordinatorCodespace);
}

operation_result<revealed_schedule_t> engine::revealed_schedule(
    const call_context& context,
    const employee_id_t& employee) const {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = authorize_employee<revealed_schedule_t>(
          context, kCoordinatorCodespace)) {
    return *denied;
  }
  if (context.caller != employee) {
    return make_error<revealed_schedule_t>(
        error_code::authorization_denied, error_category::authorization_failed,
        kCoordinatorCodespace,
        "revealed schedule of " + short_id(employee) +
            " is readable by its owner only");
  }
  auto revealed = store_.revealed_schedule(employee);
  if (!revealed) {
    return make_precondition_error<revealed_schedule_t>(
        error_code::no_preference, kCoordinatorCodespace,
        "employee " + short_id(employee) + " has no schedule");
  }
  return make_success(std::move(*revealed), kCoordinatorCodespace);
}

reveal_status_t engine::reveal_status(const employee_id_t& employee) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = store_.reveal_state(employee);
  return state ? state->status : reveal_status_t::unassigned;
}

operation_result<fhe::ciphertext> engine::satisfaction(
    const call_context& context,
    const employee_id_t& employee) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_employee<ciphertext>(context, kMetricsCodespace)) {
    return *denied;
  }
  auto inputs = employee_inputs{};
  if (auto failed =
          load_assigned<ciphertext>(employee, true, kMetricsCodespace, inputs)) {
    return *failed;
  }
  return run_arithmetic<ciphertext>(kMetricsCodespace, [&] {
    return make_success(metrics::satisfaction(coprocessor_, inputs.personal,
                                              *inputs.preference),
                        kMetricsCodespace);
  });
}

operation_result<fhe::ciphertext> engine::team_collaboration(
    const call_context& context,
    const team_id_t& team) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_employee<ciphertext>(context, kMetricsCodespace)) {
    return *denied;
  }
  auto schedule = team_schedule_t{};
  if (auto failed =
          load_optimized<ciphertext>(team, kMetricsCodespace, schedule)) {
    return *failed;
  }
  return make_success(metrics::team_collaboration(schedule),
                      kMetricsCodespace);
}

operation_result<fhe::ciphertext> engine::flexibility_utilization(
    const call_context& context,
    const team_id_t& team) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_employee<ciphertext>(context, kMetricsCodespace)) {
    return *denied;
  }
  auto preferences = std::vector<preference_record_t>{};
  for (const auto& member : store_.members(team)) {
    if (auto record = latest_record(member)) {
      preferences.push_back(std::move(*record));
    }
  }
  return run_arithmetic<ciphertext>(kMetricsCodespace, [&] {
    return make_success(
        metrics::flexibility_utilization(coprocessor_, preferences),
        kMetricsCodespace);
  });
}

operation_result<fhe::ciphertext> engine::focus_time(
    const call_context& context,
    const employee_id_t& employee) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_employee<ciphertext>(context, kMetricsCodespace)) {
    return *denied;
  }
  auto inputs = employee_inputs{};
  if (auto failed = load_assigned<ciphertext>(employee, false,
                                              kMetricsCodespace, inputs)) {
    return *failed;
  }
  return run_arithmetic<ciphertext>(kMetricsCodespace, [&] {
    return make_success(metrics::focus_time(coprocessor_, inputs.personal),
                        kMetricsCodespace);
  });
}

operation_result<fhe::ciphertext> engine::efficiency(
    const call_context& context,
    const team_id_t& team) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_employee<ciphertext>(context, kMetricsCodespace)) {
    return *denied;
  }
  auto schedule = team_schedule_t{};
  if (auto failed =
          load_optimized<ciphertext>(team, kMetricsCodespace, schedule)) {
    return *failed;
  }
  return run_arithmetic<ciphertext>(kMetricsCodespace, [&] {
    return make_success(metrics::efficiency(coprocessor_, schedule),
                        kMetricsCodespace);
  });
}

operation_result<fhe::ciphertext> engine::conflict(const call_context& context,
                                                   const team_id_t& team) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_employee<ciphertext>(context, kMetricsCodespace)) {
    return *denied;
  }
  auto schedule = team_schedule_t{};
  if (auto failed =
          load_optimized<ciphertext>(team, kMetricsCodespace, schedule)) {
    return *failed;
  }
  return run_arithmetic<ciphertext>(kMetricsCodespace, [&] {
    return make_success(metrics::conflict(coprocessor_, schedule),
                        kMetricsCodespace);
  });
}

operation_result<fhe::ciphertext> engine::work_life_balance(
    const call_context& context,
    const employee_id_t& employee) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_employee<ciphertext>(context, kMetricsCodespace)) {
    return *denied;
  }
  auto inputs = employee_inputs{};
  if (auto failed = load_assigned<ciphertext>(employee, false,
                                              kMetricsCodespace, inputs)) {
    return *failed;
  }
  return run_arithmetic<ciphertext>(kMetricsCodespace, [&] {
    return make_success(
        metrics::work_life_balance(coprocessor_, inputs.personal),
        kMetricsCodespace);
  });
}

operation_result<fhe::ciphertext> engine::remote_work_impact(
    const call_context& context,
    const team_id_t& team) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_employee<ciphertext>(context, kMetricsCodespace)) {
    return *denied;
  }
  auto schedule = team_schedule_t{};
  if (auto failed =
          load_optimized<ciphertext>(team, kMetricsCodespace, schedule)) {
    return *failed;
  }
  return run_arithmetic<ciphertext>(kMetricsCodespace, [&] {
    return make_success(metrics::remote_work_impact(coprocessor_, schedule),
                        kMetricsCodespace);
  });
}

operation_result<fhe::ciphertext> engine::recommendation(
    const call_context& context,
    const employee_id_t& employee) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_employee<ciphertext>(context, kMetricsCodespace)) {
    return *denied;
  }
  auto inputs = employee_inputs{};
  if (auto failed =
          load_assigned<ciphertext>(employee, true, kMetricsCodespace, inputs)) {
    return *failed;
  }
  return run_arithmetic<ciphertext>(kMetricsCodespace, [&] {
    return make_success(metrics::recommendation(coprocessor_, inputs.personal,
                                                *inputs.preference),
                        kMetricsCodespace);
  });
}

operation_result<fhe::ciphertext> engine::adherence(
    const call_context& context,
    const employee_id_t& employee) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied =
          authorize_employee<ciphertext>(context, kMetricsCodespace)) {
    return *denied;
  }
  auto inputs = employee_inputs{};
  if (auto failed =
          load_assigned<ciphertext>(employee, true, kMetricsCodespace, inputs)) {
    return *failed;
  }
  return run_arithmetic<ciphertext>(kMetricsCodespace, [&] {
    return make_success(metrics::adherence(coprocessor_, inputs.personal,
                                           *inputs.preference),
                        kMetricsCodespace);
  });
}

void engine::set_identity_verifier(identity_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  identity_verifier_ = std::move(verifier);
}

void engine::set_event_sink(event_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  event_sink_ = std::move(sink);
}

void engine::set_proof_verifier(proof_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!verifier) {
    spdlog::warn("Empty proof verifier installed; every reveal will fail");
  }
  proof_verifier_ = std::move(verifier);
}

}  // namespace hybridwork::execution
