#pragma once

#include <hybridwork/fhe/coprocessor.hpp>
#include <hybridwork/schema/enum_string.hpp>
#include <hybridwork/schema/personal_schedule.hpp>
#include <hybridwork/schema/preference_record.hpp>
#include <hybridwork/schema/team_schedule.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace hybridwork::execution {

/// How adjacent members are paired when accumulating the overlap score.
enum class overlap_adjacency : uint8_t {
  /// Pair `member[i-1]` with `member[i]` by directory index; a pair counts
  /// only when both members have a preference.
  member_order = 0,
  /// Pair consecutive members among those that have a preference.
  submission_order = 1,
};

inline constexpr auto kOverlapAdjacencyMappings = std::array{
    std::pair<std::string_view, overlap_adjacency>{
        "member_order", overlap_adjacency::member_order},
    std::pair<std::string_view, overlap_adjacency>{
        "submission_order", overlap_adjacency::submission_order}};

inline std::optional<overlap_adjacency> overlap_adjacency_from_string(
    const std::string_view value) {
  return hybridwork::schema::from_string(value, kOverlapAdjacencyMappings);
}

struct team_computation final {
  hybridwork::fhe::ciphertext office_days;
  hybridwork::fhe::ciphertext collab_days;
  hybridwork::fhe::ciphertext overlap_score;
};

/// Encrypted team schedule from the latest preference of each member, in
/// directory order (std::nullopt for members that never submitted).
///
/// Office and collaboration totals are divided by the raw member count,
/// skipped members included. Throws `fhe::arithmetic_error` for an empty
/// member list.
team_computation compute_team_schedule(
    hybridwork::fhe::coprocessor& coprocessor,
    const std::vector<std::optional<hybridwork::schema::preference_record_t>>&
        member_preferences,
    overlap_adjacency adjacency);

/// `(preference + team) / 2` for office days and collaboration days.
std::pair<hybridwork::fhe::ciphertext, hybridwork::fhe::ciphertext>
blend_personal_schedule(hybridwork::fhe::coprocessor& coprocessor,
                        const hybridwork::schema::preference_record_t& preference,
                        const hybridwork::schema::team_schedule_t& team);

/// Shift office and collaboration days of a team by an encrypted day count.
hybridwork::schema::team_schedule_t adjust_for_team_events(
    hybridwork::fhe::coprocessor& coprocessor,
    hybridwork::schema::team_schedule_t schedule,
    const hybridwork::fhe::ciphertext& event_days);

/// Remove constrained days from the office count and cap collaboration days
/// at the new office count.
hybridwork::schema::personal_schedule_t adjust_for_personal_constraints(
    hybridwork::fhe::coprocessor& coprocessor,
    hybridwork::schema::personal_schedule_t schedule,
    const hybridwork::fhe::ciphertext& constraint_days);

/// Add the shared collaboration-day mask of two teams to both overlap scores.
std::pair<hybridwork::schema::team_schedule_t,
          hybridwork::schema::team_schedule_t>
optimize_cross_team_collab(hybridwork::fhe::coprocessor& coprocessor,
                           hybridwork::schema::team_schedule_t first,
                           hybridwork::schema::team_schedule_t second);

}  // namespace hybridwork::execution
