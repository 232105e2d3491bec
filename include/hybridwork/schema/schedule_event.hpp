#pragma once

#include <hybridwork/schema/enum_string.hpp>
#include <hybridwork/schema/event_attribute.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

// Schema type: schedule event.
// Notification emitted for dashboard and notification collaborators. Never
// carries plaintext preference or schedule values.
namespace hybridwork::schema {

enum class event_type_t : uint8_t {
  submitted = 1,
  optimized = 2,
  assigned = 3,
  revealed = 4,
};

inline constexpr auto kEventTypeMappings = std::array{
    std::pair<std::string_view, event_type_t>{"submitted",
                                              event_type_t::submitted},
    std::pair<std::string_view, event_type_t>{"optimized",
                                              event_type_t::optimized},
    std::pair<std::string_view, event_type_t>{"assigned",
                                              event_type_t::assigned},
    std::pair<std::string_view, event_type_t>{"revealed",
                                              event_type_t::revealed}};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings).value_or("unknown");
}

template <uint16_t Version>
struct schedule_event;

template <>
struct schedule_event<1> final {
  uint16_t version{1};
  event_type_t type{};
  std::vector<event_attribute_t> attributes;
};

using schedule_event_t = schedule_event<1>;

}  // namespace hybridwork::schema
