#pragma once

#include <hybridwork/schema/primitives.hpp>
#include <cstdint>

// Schema type: revealed schedule.
// Plaintext personal schedule. `revealed` goes false -> true exactly once.
namespace hybridwork::schema {

template <uint16_t Version>
struct revealed_schedule;

template <>
struct revealed_schedule<1> final {
  uint16_t version{1};
  employee_id_t employee{};
  uint32_t office_days{};
  uint32_t collab_days{};
  bool revealed{};
  timestamp_milliseconds_t revealed_at{};
};

using revealed_schedule_t = revealed_schedule<1>;

}  // namespace hybridwork::schema
