#pragma once

#include <hybridwork/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error code.
// Stable numeric failure codes returned by engine operations.
namespace hybridwork::schema {

enum class error_code : uint32_t {
  ok = 0,
  empty_team = 1,
  no_preference = 2,
  team_not_optimized = 3,
  not_assigned = 4,
  already_revealed = 5,
  reveal_pending = 6,
  no_pending_reveal = 7,
  invalid_argument = 8,
  authorization_denied = 20,
  unrecognized_caller = 21,
  unknown_request = 30,
  invalid_proof = 31,
  malformed_payload = 32,
  arithmetic_degenerate = 40,
};

enum class error_category : uint8_t {
  none = 0,
  precondition_failed = 1,
  authorization_failed = 2,
  protocol_failed = 3,
  arithmetic_degenerate = 4,
};

inline constexpr auto kErrorCategoryMappings = std::array{
    std::pair<std::string_view, error_category>{"none", error_category::none},
    std::pair<std::string_view, error_category>{
        "precondition_failed", error_category::precondition_failed},
    std::pair<std::string_view, error_category>{
        "authorization_failed", error_category::authorization_failed},
    std::pair<std::string_view, error_category>{
        "protocol_failed", error_category::protocol_failed},
    std::pair<std::string_view, error_category>{
        "arithmetic_degenerate", error_category::arithmetic_degenerate}};

template <>
inline std::optional<error_category> try_from_string<error_category>(
    const std::string_view value) {
  return from_string(value, kErrorCategoryMappings);
}

inline constexpr std::string_view to_string(const error_category value) {
  return to_string(value, kErrorCategoryMappings).value_or("unknown");
}

}  // namespace hybridwork::schema
