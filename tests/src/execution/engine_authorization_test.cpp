#include <hybridwork/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

using hybridwork::schema::error_category;
using hybridwork::schema::error_code;
using hybridwork::testing::engine_fixture;
using hybridwork::testing::make_hash;

TEST(engine_authorization, admin_operations_reject_employees) {
  auto fixture = engine_fixture{"hybridwork_auth_admin"};
  auto alice = make_hash(1);
  auto team = make_hash(50);
  auto caller = engine_fixture::as(alice);
  auto& engine = fixture.engine();
  ASSERT_TRUE(fixture.submit(alice, 4, 6).ok());

  auto added = engine.add_member(caller, team, alice);
  EXPECT_EQ(added.code, error_code::authorization_denied);
  EXPECT_EQ(added.category, error_category::authorization_failed);
  EXPECT_TRUE(engine.members(team).empty());

  EXPECT_EQ(engine.optimize_team(caller, team).code,
            error_code::authorization_denied);
  EXPECT_EQ(engine.assign_personal(caller, alice, team).code,
            error_code::authorization_denied);
  EXPECT_EQ(engine
                .adjust_for_team_events(caller, team,
                                        fixture.coprocessor().encrypt_input(1))
                .code,
            error_code::authorization_denied);
  EXPECT_EQ(engine
                .adjust_for_personal_constraints(
                    caller, alice, fixture.coprocessor().encrypt_input(1))
                .code,
            error_code::authorization_denied);
  EXPECT_EQ(engine.optimize_cross_team_collab(caller, team, make_hash(51)).code,
            error_code::authorization_denied);
  EXPECT_EQ(engine.cancel_reveal(caller, alice).code,
            error_code::authorization_denied);
}

TEST(engine_authorization, unrecognized_callers_are_rejected) {
  auto fixture = engine_fixture{"hybridwork_auth_identity"};
  auto stranger = make_hash(9);
  fixture.engine().set_identity_verifier(
      [&](const hybridwork::schema::employee_id_t& caller) {
        return caller != stranger;
      });

  auto submitted = fixture.submit(stranger, 1, 1);
  EXPECT_EQ(submitted.code, error_code::unrecognized_caller);
  EXPECT_EQ(submitted.category, error_category::authorization_failed);
  EXPECT_EQ(fixture.engine().ledger_size(), 0u);

  auto zero = hybridwork::schema::make_zero_hash();
  EXPECT_EQ(fixture.submit(zero, 1, 1).code, error_code::unrecognized_caller);
  EXPECT_EQ(fixture.engine().request_reveal(engine_fixture::as(stranger)).code,
            error_code::unrecognized_caller);
  EXPECT_EQ(fixture.engine()
                .focus_time(engine_fixture::as(stranger), make_hash(1))
                .code,
            error_code::unrecognized_caller);
}

TEST(engine_authorization, revealed_schedule_is_owner_only) {
  auto fixture = engine_fixture{"hybridwork_auth_owner"};
  auto alice = make_hash(1);
  auto bob = make_hash(2);
  ASSERT_TRUE(fixture.submit(alice, 4, 6).ok());

  auto peeked =
      fixture.engine().revealed_schedule(engine_fixture::as(bob), alice);
  EXPECT_EQ(peeked.code, error_code::authorization_denied);
  EXPECT_FALSE(peeked.value.has_value());

  auto as_admin =
      fixture.engine().revealed_schedule(engine_fixture::as_admin(), alice);
  EXPECT_EQ(as_admin.code, error_code::authorization_denied);

  EXPECT_TRUE(
      fixture.engine().revealed_schedule(engine_fixture::as(alice), alice).ok());
}

TEST(engine_optimizer, assign_requires_an_optimized_team) {
  auto fixture = engine_fixture{"hybridwork_opt_not_optimized"};
  auto alice = make_hash(1);
  auto team = make_hash(50);
  auto admin = engine_fixture::as_admin();
  ASSERT_TRUE(fixture.submit(alice, 4, 6).ok());
  ASSERT_TRUE(fixture.submit(alice, 5, 6).ok());
  ASSERT_TRUE(fixture.engine().add_member(admin, team, alice).ok());

  auto assigned = fixture.engine().assign_personal(admin, alice, team);
  EXPECT_EQ(assigned.code, error_code::team_not_optimized);
  EXPECT_EQ(assigned.category, error_category::precondition_failed);
  EXPECT_FALSE(fixture.engine().personal_schedule(alice)->assigned);
}

TEST(engine_optimizer, optimize_rejects_empty_team) {
  auto fixture = engine_fixture{"hybridwork_opt_empty"};
  auto result =
      fixture.engine().optimize_team(engine_fixture::as_admin(), make_hash(50));
  EXPECT_EQ(result.code, error_code::empty_team);
  EXPECT_FALSE(fixture.engine().team_schedule(make_hash(50)).has_value());
}

TEST(engine_optimizer, assign_requires_a_preference) {
  auto fixture = engine_fixture{"hybridwork_opt_no_pref"};
  auto alice = make_hash(1);
  auto bob = make_hash(2);
  auto team = make_hash(50);
  auto admin = engine_fixture::as_admin();
  ASSERT_TRUE(fixture.submit(alice, 4, 6).ok());
  ASSERT_TRUE(fixture.engine().add_member(admin, team, alice).ok());
  ASSERT_TRUE(fixture.engine().add_member(admin, team, bob).ok());
  ASSERT_TRUE(fixture.engine().optimize_team(admin, team).ok());

  EXPECT_EQ(fixture.engine().assign_personal(admin, bob, team).code,
            error_code::no_preference);
}

TEST(engine_optimizer, optimizes_and_blends_through_the_engine) {
  auto fixture = engine_fixture{"hybridwork_opt_blend"};
  auto alice = make_hash(1);
  auto bob = make_hash(2);
  auto team = make_hash(50);
  ASSERT_TRUE(fixture.submit(alice, 4, 6).ok());
  ASSERT_TRUE(fixture.submit(bob, 2, 8).ok());
  ASSERT_TRUE(fixture.build_team(team, {alice, bob}));

  auto schedule = fixture.engine().team_schedule(team);
  ASSERT_TRUE(schedule.has_value());
  EXPECT_TRUE(schedule->optimized);
  EXPECT_EQ(fixture.plaintext(schedule->office_days), 3u);
  EXPECT_EQ(fixture.plaintext(schedule->collab_days), 7u);

  auto personal = fixture.engine().personal_schedule(alice);
  ASSERT_TRUE(personal.has_value());
  EXPECT_TRUE(personal->assigned);
  EXPECT_EQ(personal->team, team);
  EXPECT_EQ(fixture.plaintext(personal->office_days), 3u);
  EXPECT_EQ(fixture.plaintext(personal->collab_days), 6u);
  EXPECT_EQ(fixture.engine().reveal_status(alice),
            hybridwork::schema::reveal_status_t::assigned);
}

TEST(engine_optimizer, submission_order_policy_is_applied) {
  auto fixture = engine_fixture{
      "hybridwork_opt_submission_order",
      hybridwork::execution::overlap_adjacency::submission_order};
  auto team = make_hash(50);
  auto admin = engine_fixture::as_admin();
  ASSERT_TRUE(fixture.submit(make_hash(1), 4, 0b0110).ok());
  ASSERT_TRUE(fixture.submit(make_hash(3), 2, 0b0011).ok());
  for (const auto seed : {1, 2, 3}) {
    ASSERT_TRUE(fixture.engine()
                    .add_member(admin, team,
                                make_hash(static_cast<uint8_t>(seed)))
                    .ok());
  }
  ASSERT_TRUE(fixture.engine().optimize_team(admin, team).ok());

  auto schedule = fixture.engine().team_schedule(team);
  ASSERT_TRUE(schedule.has_value());
  EXPECT_EQ(fixture.plaintext(schedule->overlap_score), 0b0010u);
}

TEST(engine_optimizer, degenerate_arithmetic_commits_nothing) {
  auto fixture = engine_fixture{"hybridwork_opt_degenerate"};
  auto alice = make_hash(1);
  auto team = make_hash(50);
  auto admin = engine_fixture::as_admin();
  auto foreign = hybridwork::fhe::ciphertext{make_hash(99)};
  ASSERT_TRUE(fixture.engine()
                  .submit_preference(engine_fixture::as(alice), foreign,
                                     foreign, foreign, foreign)
                  .ok());
  ASSERT_TRUE(fixture.engine().add_member(admin, team, alice).ok());

  auto result = fixture.engine().optimize_team(admin, team);
  EXPECT_EQ(result.code, error_code::arithmetic_degenerate);
  EXPECT_EQ(result.category, error_category::arithmetic_degenerate);
  EXPECT_FALSE(fixture.engine().team_schedule(team).has_value());
}

TEST(engine_optimizer, mutators_require_optimized_or_assigned_targets) {
  auto fixture = engine_fixture{"hybridwork_opt_mutator_pre"};
  auto admin = engine_fixture::as_admin();
  auto days = fixture.coprocessor().encrypt_input(1);

  EXPECT_EQ(fixture.engine().adjust_for_team_events(admin, make_hash(50), days).code,
            error_code::team_not_optimized);
  EXPECT_EQ(fixture.engine()
                .adjust_for_personal_constraints(admin, make_hash(1), days)
                .code,
            error_code::not_assigned);
  EXPECT_EQ(fixture.engine()
                .optimize_cross_team_collab(admin, make_hash(50), make_hash(50))
                .code,
            error_code::invalid_argument);
  EXPECT_EQ(fixture.engine()
                .optimize_cross_team_collab(admin, make_hash(50), make_hash(51))
                .code,
            error_code::team_not_optimized);
}

TEST(engine_optimizer, mutators_overwrite_stored_schedules) {
  auto fixture = engine_fixture{"hybridwork_opt_mutators"};
  auto admin = engine_fixture::as_admin();
  auto alice = make_hash(1);
  auto bob = make_hash(2);
  auto first = make_hash(50);
  auto second = make_hash(51);
  ASSERT_TRUE(fixture.submit(alice, 4, 0b110).ok());
  ASSERT_TRUE(fixture.submit(bob, 2, 0b011).ok());
  ASSERT_TRUE(fixture.build_team(first, {alice}));
  ASSERT_TRUE(fixture.build_team(second, {bob}));

  auto events = fixture.engine().adjust_for_team_events(
      admin, first, fixture.coprocessor().encrypt_input(1));
  ASSERT_TRUE(events.ok()) << events.log;
  EXPECT_EQ(fixture.plaintext(fixture.engine().team_schedule(first)->office_days),
            5u);
  EXPECT_EQ(fixture.plaintext(fixture.engine().team_schedule(first)->collab_days),
            0b111u);

  ASSERT_TRUE(fixture.engine()
                  .optimize_cross_team_collab(admin, first, second)
                  .ok());
  EXPECT_EQ(
      fixture.plaintext(fixture.engine().team_schedule(first)->overlap_score),
      0b011u);
  EXPECT_EQ(
      fixture.plaintext(fixture.engine().team_schedule(second)->overlap_score),
      0b011u);

  auto constrained = fixture.engine().adjust_for_personal_constraints(
      admin, alice, fixture.coprocessor().encrypt_input(3));
  ASSERT_TRUE(constrained.ok()) << constrained.log;
  auto personal = fixture.engine().personal_schedule(alice);
  EXPECT_EQ(fixture.plaintext(personal->office_days), 1u);
  EXPECT_EQ(fixture.plaintext(personal->collab_days), 1u);
}

TEST(engine_metrics, preconditions_are_checked) {
  auto fixture = engine_fixture{"hybridwork_metrics_pre"};
  auto alice = make_hash(1);
  auto caller = engine_fixture::as(alice);
  ASSERT_TRUE(fixture.submit(alice, 4, 6).ok());

  EXPECT_EQ(fixture.engine().satisfaction(caller, alice).code,
            error_code::not_assigned);
  EXPECT_EQ(fixture.engine().focus_time(caller, alice).code,
            error_code::not_assigned);
  EXPECT_EQ(fixture.engine().efficiency(caller, make_hash(50)).code,
            error_code::team_not_optimized);
  EXPECT_EQ(fixture.engine().team_collaboration(caller, make_hash(50)).code,
            error_code::team_not_optimized);

  auto flexibility =
      fixture.engine().flexibility_utilization(caller, make_hash(50));
  ASSERT_TRUE(flexibility.ok());
  EXPECT_EQ(fixture.plaintext(*flexibility.value), 0u);
}

TEST(engine_metrics, focus_time_wraps_through_the_engine) {
  auto fixture = engine_fixture{"hybridwork_metrics_focus"};
  auto alice = make_hash(1);
  auto team = make_hash(50);
  ASSERT_TRUE(fixture.submit(alice, 1, 5, 1, 90).ok());
  ASSERT_TRUE(fixture.build_team(team, {alice}));

  auto caller = engine_fixture::as(alice);
  auto focus = fixture.engine().focus_time(caller, alice);
  ASSERT_TRUE(focus.ok());
  // office 1, collab 5.
  EXPECT_EQ(fixture.plaintext(*focus.value), static_cast<uint32_t>(1u - 5u));

  auto recommendation = fixture.engine().recommendation(caller, alice);
  ASSERT_TRUE(recommendation.ok());
  EXPECT_EQ(fixture.plaintext(*recommendation.value), 2u);

  auto flexibility = fixture.engine().flexibility_utilization(caller, team);
  ASSERT_TRUE(flexibility.ok());
  EXPECT_EQ(fixture.plaintext(*flexibility.value), 90u);

  EXPECT_TRUE(fixture.engine().satisfaction(caller, alice).ok());
  EXPECT_TRUE(fixture.engine().adherence(caller, alice).ok());
  EXPECT_TRUE(fixture.engine().work_life_balance(caller, alice).ok());
  EXPECT_TRUE(fixture.engine().conflict(caller, team).ok());
  EXPECT_TRUE(fixture.engine().remote_work_impact(caller, team).ok());
}
