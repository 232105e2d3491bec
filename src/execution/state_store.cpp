#include <hybridwork/execution/state_store.hpp>
#include <hybridwork/schema/key/engine_keys.hpp>

namespace hybridwork::execution {

using namespace hybridwork::schema;

record_id_t state_store::last_record_id() const {
  return get<record_id_t>(key::make_sequence_key()).value_or(0);
}

std::optional<preference_record_t> state_store::preference(
    const record_id_t record_id) const {
  return get<preference_record_t>(key::make_record_key(record_id));
}

std::optional<record_id_t> state_store::latest_preference(
    const employee_id_t& employee) const {
  return get<record_id_t>(key::make_latest_key(employee));
}

std::vector<record_id_t> state_store::preference_history(
    const employee_id_t& employee) const {
  auto prefix = key::make_history_prefix(employee);
  auto entries = storage_.list_by_prefix(bytes_view_t{prefix});
  auto history = std::vector<record_id_t>{};
  history.reserve(entries.size());
  for (const auto& [entry_key, value] : entries) {
    history.push_back(encoder_.decode<record_id_t>(bytes_view_t{value}));
  }
  return history;
}

std::vector<employee_id_t> state_store::members(const team_id_t& team) const {
  return get<std::vector<employee_id_t>>(key::make_members_key(team))
      .value_or(std::vector<employee_id_t>{});
}

std::optional<team_schedule_t> state_store::team_schedule(
    const team_id_t& team) const {
  return get<team_schedule_t>(key::make_team_schedule_key(team));
}

std::optional<personal_schedule_t> state_store::personal_schedule(
    const employee_id_t& employee) const {
  return get<personal_schedule_t>(key::make_personal_schedule_key(employee));
}

std::optional<revealed_schedule_t> state_store::revealed_schedule(
    const employee_id_t& employee) const {
  return get<revealed_schedule_t>(key::make_revealed_schedule_key(employee));
}

std::optional<reveal_state_t> state_store::reveal_state(
    const employee_id_t& employee) const {
  return get<reveal_state_t>(key::make_reveal_state_key(employee));
}

std::optional<decryption_request_t> state_store::pending_request(
    const request_id_t& request_id) const {
  return get<decryption_request_t>(key::make_pending_request_key(request_id));
}

void write_set::put_record_sequence(const record_id_t record_id) {
  put(key::make_sequence_key(), record_id);
}

void write_set::put_preference(const preference_record_t& record) {
  put(key::make_record_key(record.record_id), record);
  put(key::make_history_key(record.employee, record.record_id),
      record.record_id);
  put(key::make_latest_key(record.employee), record.record_id);
}

void write_set::put_members(const team_id_t& team,
                            const std::vector<employee_id_t>& members) {
  put(key::make_members_key(team), members);
}

void write_set::put_team_schedule(const team_schedule_t& schedule) {
  put(key::make_team_schedule_key(schedule.team), schedule);
}

void write_set::put_personal_schedule(const personal_schedule_t& schedule) {
  put(key::make_personal_schedule_key(schedule.employee), schedule);
}

void write_set::put_revealed_schedule(const revealed_schedule_t& schedule) {
  put(key::make_revealed_schedule_key(schedule.employee), schedule);
}

void write_set::put_reveal_state(const reveal_state_t& state) {
  put(key::make_reveal_state_key(state.employee), state);
}

void write_set::put_pending_request(const decryption_request_t& request) {
  put(key::make_pending_request_key(request.request_id), request);
}

void write_set::erase_pending_request(const request_id_t& request_id) {
  batch_.deletes.push_back(key::make_pending_request_key(request_id));
}

void write_set::commit(const rocksdb_storage_t& storage) {
  storage.commit(batch_);
  batch_ = hybridwork::storage::write_batch{};
}

}  // namespace hybridwork::execution
