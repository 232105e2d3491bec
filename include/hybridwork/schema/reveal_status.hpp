#pragma once

#include <hybridwork/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: reveal status.
// Per-employee reveal lifecycle. `revealed` has no outgoing transition.
namespace hybridwork::schema {

enum class reveal_status_t : uint8_t {
  unassigned = 0,
  assigned = 1,
  request_pending = 2,
  revealed = 3
};

inline constexpr auto kRevealStatusMappings =
    std::array{std::pair<std::string_view, reveal_status_t>{
                   "unassigned", reveal_status_t::unassigned},
               std::pair<std::string_view, reveal_status_t>{
                   "assigned", reveal_status_t::assigned},
               std::pair<std::string_view, reveal_status_t>{
                   "request_pending", reveal_status_t::request_pending},
               std::pair<std::string_view, reveal_status_t>{
                   "revealed", reveal_status_t::revealed}};

template <>
inline std::optional<reveal_status_t> try_from_string<reveal_status_t>(
    const std::string_view value) {
  return from_string(value, kRevealStatusMappings);
}

inline constexpr std::string_view to_string(const reveal_status_t value) {
  return to_string(value, kRevealStatusMappings).value_or("unknown");
}

}  // namespace hybridwork::schema
