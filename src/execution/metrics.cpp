#include <hybridwork/execution/metrics.hpp>

namespace hybridwork::execution::metrics {

using hybridwork::fhe::ciphertext;
using hybridwork::fhe::coprocessor;
using namespace hybridwork::schema;

namespace {

constexpr auto kFullScore = uint32_t{100};
constexpr auto kDeviationScale = uint32_t{10};
constexpr auto kWorkWeekDays = uint32_t{5};
constexpr auto kRemoteDayWeight = uint32_t{20};
constexpr auto kFlexibilityThreshold = uint32_t{70};

// 100 - |actual - preferred| / 10
ciphertext deviation_score(coprocessor& cp,
                           const ciphertext& actual,
                           const ciphertext& preferred) {
  auto deviation = cp.div(cp.abs(cp.sub(actual, preferred)), kDeviationScale);
  return cp.sub(cp.encrypt(kFullScore), deviation);
}

}  // namespace

ciphertext satisfaction(coprocessor& cp,
                        const personal_schedule_t& personal,
                        const preference_record_t& preference) {
  auto office = deviation_score(cp, personal.office_days,
                                preference.days_in_office);
  auto collab =
      deviation_score(cp, personal.collab_days, preference.team_days);
  return cp.div(cp.add(office, collab), 2);
}

ciphertext team_collaboration(const team_schedule_t& team) {
  return team.overlap_score;
}

ciphertext flexibility_utilization(
    coprocessor& cp,
    const std::vector<preference_record_t>& preferences) {
  if (preferences.empty()) {
    return cp.encrypt(0);
  }
  auto total = cp.encrypt(0);
  for (const auto& preference : preferences) {
    total = cp.add(total, preference.flexibility);
  }
  return cp.div(total, static_cast<uint32_t>(preferences.size()));
}

ciphertext focus_time(coprocessor& cp, const personal_schedule_t& personal) {
  return cp.sub(personal.office_days, personal.collab_days);
}

ciphertext efficiency(coprocessor& cp, const team_schedule_t& team) {
  return cp.div(cp.mul(team.collab_days, team.overlap_score), kFullScore);
}

ciphertext conflict(coprocessor& cp, const team_schedule_t& team) {
  return cp.sub(team.collab_days, team.office_days);
}

ciphertext work_life_balance(coprocessor& cp,
                             const personal_schedule_t& personal) {
  return cp.sub(cp.encrypt(kFullScore),
                cp.mul(personal.office_days, kDeviationScale));
}

ciphertext remote_work_impact(coprocessor& cp, const team_schedule_t& team) {
  return cp.mul(cp.sub(cp.encrypt(kWorkWeekDays), team.office_days),
                kRemoteDayWeight);
}

ciphertext recommendation(coprocessor& cp,
                          const personal_schedule_t& personal,
                          const preference_record_t& preference) {
  auto flexible = cp.gt(preference.flexibility, kFlexibilityThreshold);
  return cp.select(flexible, cp.add(personal.office_days, 1),
                   personal.office_days);
}

ciphertext adherence(coprocessor& cp,
                     const personal_schedule_t& personal,
                     const preference_record_t& preference) {
  return cp.div(
      cp.add(preference.flexibility, satisfaction(cp, personal, preference)),
      2);
}

}  // namespace hybridwork::execution::metrics
