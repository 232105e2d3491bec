#pragma once

#include <hybridwork/schema/key/builder.hpp>
#include <hybridwork/schema/primitives.hpp>
#include <array>
#include <string_view>

// Schema key type: engine keys.
// Canonical key prefixes for ledger, directory, schedule and reveal state.
namespace hybridwork::schema::key {

inline constexpr std::string_view kLedgerSequenceKey{"HW|LEDGER|SEQUENCE"};
inline constexpr std::string_view kRecordKeyPrefix{"HW|LEDGER|RECORD|"};
inline constexpr std::string_view kHistoryKeyPrefix{"HW|LEDGER|HISTORY|"};
inline constexpr std::string_view kLatestKeyPrefix{"HW|LEDGER|LATEST|"};
inline constexpr std::string_view kMembersKeyPrefix{"HW|DIRECTORY|TEAM|"};
inline constexpr std::string_view kTeamScheduleKeyPrefix{"HW|SCHEDULE|TEAM|"};
inline constexpr std::string_view kPersonalScheduleKeyPrefix{
    "HW|SCHEDULE|PERSONAL|"};
inline constexpr std::string_view kRevealedScheduleKeyPrefix{
    "HW|SCHEDULE|REVEALED|"};
inline constexpr std::string_view kRevealStateKeyPrefix{"HW|REVEAL|STATE|"};
inline constexpr std::string_view kPendingRequestKeyPrefix{
    "HW|REVEAL|PENDING|"};

inline const std::array<std::string_view, 10> kEngineKeyspaces{
    kLedgerSequenceKey,         kRecordKeyPrefix,
    kHistoryKeyPrefix,          kLatestKeyPrefix,
    kMembersKeyPrefix,          kTeamScheduleKeyPrefix,
    kPersonalScheduleKeyPrefix, kRevealedScheduleKeyPrefix,
    kRevealStateKeyPrefix,      kPendingRequestKeyPrefix};

inline bytes_t make_sequence_key() {
  return builder{}.write(kLedgerSequenceKey).data;
}

inline bytes_t make_record_key(const record_id_t record_id) {
  return builder{}.write(kRecordKeyPrefix).write(record_id).data;
}

/// Prefix of all history entries of one employee, ordered by record id.
inline bytes_t make_history_prefix(const employee_id_t& employee) {
  return builder{}.write(kHistoryKeyPrefix).write(employee).data;
}

inline bytes_t make_history_key(const employee_id_t& employee,
                                const record_id_t record_id) {
  auto b = builder{make_history_prefix(employee)};
  return b.write(record_id).data;
}

inline bytes_t make_latest_key(const employee_id_t& employee) {
  return builder{}.write(kLatestKeyPrefix).write(employee).data;
}

inline bytes_t make_members_key(const team_id_t& team) {
  return builder{}.write(kMembersKeyPrefix).write(team).data;
}

inline bytes_t make_team_schedule_key(const team_id_t& team) {
  return builder{}.write(kTeamScheduleKeyPrefix).write(team).data;
}

inline bytes_t make_personal_schedule_key(const employee_id_t& employee) {
  return builder{}.write(kPersonalScheduleKeyPrefix).write(employee).data;
}

inline bytes_t make_revealed_schedule_key(const employee_id_t& employee) {
  return builder{}.write(kRevealedScheduleKeyPrefix).write(employee).data;
}

inline bytes_t make_reveal_state_key(const employee_id_t& employee) {
  return builder{}.write(kRevealStateKeyPrefix).write(employee).data;
}

inline bytes_t make_pending_request_key(const request_id_t& request_id) {
  return builder{}.write(kPendingRequestKeyPrefix).write(request_id).data;
}

}  // namespace hybridwork::schema::key
