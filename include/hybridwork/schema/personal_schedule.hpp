#pragma once

#include <hybridwork/fhe/ciphertext.hpp>
#include <hybridwork/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: personal schedule.
// Blend of an employee's latest preference and their team schedule. Created
// zeroed at first submission, overwritten by every assignment.
namespace hybridwork::schema {

template <uint16_t Version>
struct personal_schedule;

template <>
struct personal_schedule<1> final {
  uint16_t version{1};
  employee_id_t employee{};
  std::optional<team_id_t> team;
  hybridwork::fhe::ciphertext office_days;
  hybridwork::fhe::ciphertext collab_days;
  bool assigned{};
};

using personal_schedule_t = personal_schedule<1>;

}  // namespace hybridwork::schema
