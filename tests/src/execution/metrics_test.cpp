#include <hybridwork/execution/metrics.hpp>
#include <hybridwork/fhe/simulated_coprocessor.hpp>
#include <hybridwork/testing/common.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <vector>

namespace {

using hybridwork::testing::reveal;
namespace metrics = hybridwork::execution::metrics;

class metrics_test : public ::testing::Test {
 protected:
  hybridwork::schema::personal_schedule_t personal(const uint32_t office,
                                                   const uint32_t collab) {
    auto schedule = hybridwork::schema::personal_schedule_t{};
    schedule.office_days = coprocessor_.encrypt_input(office);
    schedule.collab_days = coprocessor_.encrypt_input(collab);
    schedule.assigned = true;
    return schedule;
  }

  hybridwork::schema::preference_record_t preference(
      const uint32_t office,
      const uint32_t team_days,
      const uint32_t flexibility) {
    auto record = hybridwork::schema::preference_record_t{};
    record.days_in_office = coprocessor_.encrypt_input(office);
    record.team_days = coprocessor_.encrypt_input(team_days);
    record.focus_days = coprocessor_.encrypt_input(0);
    record.flexibility = coprocessor_.encrypt_input(flexibility);
    return record;
  }

  hybridwork::schema::team_schedule_t team(const uint32_t office,
                                           const uint32_t collab,
                                           const uint32_t overlap) {
    auto schedule = hybridwork::schema::team_schedule_t{};
    schedule.office_days = coprocessor_.encrypt_input(office);
    schedule.collab_days = coprocessor_.encrypt_input(collab);
    schedule.overlap_score = coprocessor_.encrypt_input(overlap);
    schedule.optimized = true;
    return schedule;
  }

  hybridwork::fhe::simulated_coprocessor coprocessor_;
};

}  // namespace

TEST_F(metrics_test, focus_time_is_office_minus_collab) {
  EXPECT_EQ(reveal(coprocessor_,
                   metrics::focus_time(coprocessor_, personal(4, 1))),
            3u);
}

TEST_F(metrics_test, focus_time_wraps_when_collab_exceeds_office) {
  EXPECT_EQ(reveal(coprocessor_,
                   metrics::focus_time(coprocessor_, personal(2, 5))),
            std::numeric_limits<uint32_t>::max() - 2u);
}

TEST_F(metrics_test, satisfaction_penalises_deviation_in_tenths) {
  // Deviations of 20 and 35 cost 2 and 3 points.
  auto score = metrics::satisfaction(coprocessor_, personal(30, 5),
                                     preference(10, 40, 0));
  EXPECT_EQ(reveal(coprocessor_, score), (98u + 97u) / 2u);

  auto perfect = metrics::satisfaction(coprocessor_, personal(3, 2),
                                       preference(3, 2, 0));
  EXPECT_EQ(reveal(coprocessor_, perfect), 100u);
}

TEST_F(metrics_test, team_metrics_follow_their_formulas) {
  auto schedule = team(3, 7, 50);

  EXPECT_EQ(reveal(coprocessor_, metrics::team_collaboration(schedule)), 50u);
  EXPECT_EQ(reveal(coprocessor_, metrics::efficiency(coprocessor_, schedule)),
            7u * 50u / 100u);
  EXPECT_EQ(reveal(coprocessor_, metrics::conflict(coprocessor_, schedule)),
            4u);
  EXPECT_EQ(
      reveal(coprocessor_, metrics::remote_work_impact(coprocessor_, schedule)),
      40u);
}

TEST_F(metrics_test, conflict_wraps_when_office_exceeds_collab) {
  EXPECT_EQ(reveal(coprocessor_,
                   metrics::conflict(coprocessor_, team(4, 1, 0))),
            std::numeric_limits<uint32_t>::max() - 2u);
}

TEST_F(metrics_test, work_life_balance_drops_ten_per_office_day) {
  EXPECT_EQ(reveal(coprocessor_,
                   metrics::work_life_balance(coprocessor_, personal(3, 0))),
            70u);
}

TEST_F(metrics_test, flexibility_utilization_averages_or_is_zero) {
  auto records = std::vector<hybridwork::schema::preference_record_t>{
      preference(0, 0, 80), preference(0, 0, 45)};
  EXPECT_EQ(reveal(coprocessor_,
                   metrics::flexibility_utilization(coprocessor_, records)),
            62u);
  EXPECT_EQ(reveal(coprocessor_,
                   metrics::flexibility_utilization(coprocessor_, {})),
            0u);
}

TEST_F(metrics_test, recommendation_adds_a_day_above_seventy) {
  auto schedule = personal(3, 1);
  EXPECT_EQ(reveal(coprocessor_,
                   metrics::recommendation(coprocessor_, schedule,
                                           preference(0, 0, 71))),
            4u);
  EXPECT_EQ(reveal(coprocessor_,
                   metrics::recommendation(coprocessor_, schedule,
                                           preference(0, 0, 70))),
            3u);
}

TEST_F(metrics_test, adherence_averages_flexibility_and_satisfaction) {
  auto score = metrics::adherence(coprocessor_, personal(3, 2),
                                  preference(3, 2, 60));
  EXPECT_EQ(reveal(coprocessor_, score), (60u + 100u) / 2u);
}
