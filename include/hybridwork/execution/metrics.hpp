#pragma once

#include <hybridwork/fhe/coprocessor.hpp>
#include <hybridwork/schema/personal_schedule.hpp>
#include <hybridwork/schema/preference_record.hpp>
#include <hybridwork/schema/team_schedule.hpp>

#include <vector>

// Derived metric formulas. Pure ciphertext arithmetic; preconditions are
// checked by the engine before these are called. Subtractions wrap modulo
// 2^32.
namespace hybridwork::execution::metrics {

/// Mean of `100 - |personal - preferred| / 10` over office and collaboration
/// days.
hybridwork::fhe::ciphertext satisfaction(
    hybridwork::fhe::coprocessor& coprocessor,
    const hybridwork::schema::personal_schedule_t& personal,
    const hybridwork::schema::preference_record_t& preference);

hybridwork::fhe::ciphertext team_collaboration(
    const hybridwork::schema::team_schedule_t& team);

/// Mean flexibility over the given preferences, encrypted zero when empty.
hybridwork::fhe::ciphertext flexibility_utilization(
    hybridwork::fhe::coprocessor& coprocessor,
    const std::vector<hybridwork::schema::preference_record_t>& preferences);

hybridwork::fhe::ciphertext focus_time(
    hybridwork::fhe::coprocessor& coprocessor,
    const hybridwork::schema::personal_schedule_t& personal);

hybridwork::fhe::ciphertext efficiency(
    hybridwork::fhe::coprocessor& coprocessor,
    const hybridwork::schema::team_schedule_t& team);

hybridwork::fhe::ciphertext conflict(
    hybridwork::fhe::coprocessor& coprocessor,
    const hybridwork::schema::team_schedule_t& team);

hybridwork::fhe::ciphertext work_life_balance(
    hybridwork::fhe::coprocessor& coprocessor,
    const hybridwork::schema::personal_schedule_t& personal);

hybridwork::fhe::ciphertext remote_work_impact(
    hybridwork::fhe::coprocessor& coprocessor,
    const hybridwork::schema::team_schedule_t& team);

/// One extra office day when flexibility exceeds 70, otherwise unchanged.
hybridwork::fhe::ciphertext recommendation(
    hybridwork::fhe::coprocessor& coprocessor,
    const hybridwork::schema::personal_schedule_t& personal,
    const hybridwork::schema::preference_record_t& preference);

hybridwork::fhe::ciphertext adherence(
    hybridwork::fhe::coprocessor& coprocessor,
    const hybridwork::schema::personal_schedule_t& personal,
    const hybridwork::schema::preference_record_t& preference);

}  // namespace hybridwork::execution::metrics
