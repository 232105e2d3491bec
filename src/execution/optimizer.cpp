#include <hybridwork/execution/optimizer.hpp>

namespace hybridwork::execution {

using hybridwork::fhe::ciphertext;
using namespace hybridwork::schema;

team_computation compute_team_schedule(
    hybridwork::fhe::coprocessor& coprocessor,
    const std::vector<std::optional<preference_record_t>>& member_preferences,
    const overlap_adjacency adjacency) {
  auto total_office = coprocessor.encrypt(0);
  auto total_collab = coprocessor.encrypt(0);
  auto overlap = coprocessor.encrypt(0);

  const preference_record_t* previous = nullptr;
  for (std::size_t i = 0; i < member_preferences.size(); ++i) {
    const auto& current = member_preferences[i];
    if (!current.has_value()) {
      if (adjacency == overlap_adjacency::member_order) {
        previous = nullptr;
      }
      continue;
    }

    total_office = coprocessor.add(total_office, current->days_in_office);
    total_collab = coprocessor.add(total_collab, current->team_days);
    if (previous != nullptr) {
      overlap = coprocessor.add(
          overlap, coprocessor.bit_and(current->team_days, previous->team_days));
    }
    previous = &*current;
  }

  const auto member_count = static_cast<uint32_t>(member_preferences.size());
  return team_computation{
      .office_days = coprocessor.div(total_office, member_count),
      .collab_days = coprocessor.div(total_collab, member_count),
      .overlap_score = overlap};
}

std::pair<ciphertext, ciphertext> blend_personal_schedule(
    hybridwork::fhe::coprocessor& coprocessor,
    const preference_record_t& preference,
    const team_schedule_t& team) {
  auto office = coprocessor.div(
      coprocessor.add(preference.days_in_office, team.office_days), 2);
  auto collab =
      coprocessor.div(coprocessor.add(preference.team_days, team.collab_days), 2);
  return {office, collab};
}

team_schedule_t adjust_for_team_events(hybridwork::fhe::coprocessor& coprocessor,
                                       team_schedule_t schedule,
                                       const ciphertext& event_days) {
  schedule.office_days = coprocessor.add(schedule.office_days, event_days);
  schedule.collab_days = coprocessor.add(schedule.collab_days, event_days);
  return schedule;
}

personal_schedule_t adjust_for_personal_constraints(
    hybridwork::fhe::coprocessor& coprocessor,
    personal_schedule_t schedule,
    const ciphertext& constraint_days) {
  auto office = coprocessor.sub(schedule.office_days, constraint_days);
  auto exceeds = coprocessor.gt(schedule.collab_days, office);
  schedule.collab_days = coprocessor.select(exceeds, office, schedule.collab_days);
  schedule.office_days = office;
  return schedule;
}

std::pair<team_schedule_t, team_schedule_t> optimize_cross_team_collab(
    hybridwork::fhe::coprocessor& coprocessor,
    team_schedule_t first,
    team_schedule_t second) {
  auto shared = coprocessor.bit_and(first.collab_days, second.collab_days);
  first.overlap_score = coprocessor.add(first.overlap_score, shared);
  second.overlap_score = coprocessor.add(second.overlap_score, shared);
  return {std::move(first), std::move(second)};
}

}  // namespace hybridwork::execution
