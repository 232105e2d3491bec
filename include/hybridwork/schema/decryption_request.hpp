#pragma once

#include <hybridwork/schema/enum_string.hpp>
#include <hybridwork/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

// Schema type: decryption request.
// Pending correlation entry from an issued request id to its target. Deleted
// when the matching callback commits, so an id resolves at most once.
namespace hybridwork::schema {

enum class reveal_target_t : uint8_t {
  personal_schedule = 1,
};

inline constexpr auto kRevealTargetMappings =
    std::array{std::pair<std::string_view, reveal_target_t>{
        "personal_schedule", reveal_target_t::personal_schedule}};

template <uint16_t Version>
struct decryption_request;

template <>
struct decryption_request<1> final {
  uint16_t version{1};
  request_id_t request_id{};
  reveal_target_t target{reveal_target_t::personal_schedule};
  employee_id_t employee{};
  std::vector<handle_id_t> handles;
  timestamp_milliseconds_t requested_at{};
};

using decryption_request_t = decryption_request<1>;

}  // namespace hybridwork::schema
