#pragma once

#include <hybridwork/fhe/ciphertext.hpp>
#include <hybridwork/schema/primitives.hpp>
#include <cstdint>

// Schema type: team schedule.
// One live instance per team, fully overwritten by each optimization run.
namespace hybridwork::schema {

template <uint16_t Version>
struct team_schedule;

template <>
struct team_schedule<1> final {
  uint16_t version{1};
  team_id_t team{};
  hybridwork::fhe::ciphertext office_days;
  hybridwork::fhe::ciphertext collab_days;
  hybridwork::fhe::ciphertext overlap_score;
  bool optimized{};
  timestamp_milliseconds_t optimized_at{};
};

using team_schedule_t = team_schedule<1>;

}  // namespace hybridwork::schema
