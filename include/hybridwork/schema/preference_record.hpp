#pragma once

#include <hybridwork/fhe/ciphertext.hpp>
#include <hybridwork/schema/primitives.hpp>
#include <cstdint>

// Schema type: preference record.
// Ledger entry: one encrypted preference submission. Immutable once appended;
// later submissions by the same employee supersede it without replacing it.
namespace hybridwork::schema {

template <uint16_t Version>
struct preference_record;

template <>
struct preference_record<1> final {
  uint16_t version{1};
  record_id_t record_id{};
  employee_id_t employee{};
  hybridwork::fhe::ciphertext days_in_office;
  hybridwork::fhe::ciphertext team_days;
  hybridwork::fhe::ciphertext focus_days;
  hybridwork::fhe::ciphertext flexibility;
  timestamp_milliseconds_t submitted_at{};
};

using preference_record_t = preference_record<1>;

}  // namespace hybridwork::schema
