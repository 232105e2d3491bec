#pragma once

#include <hybridwork/schema/primitives.hpp>
#include <hybridwork/schema/reveal_status.hpp>
#include <cstdint>
#include <optional>

// Schema type: reveal state.
// Coordinator bookkeeping per employee; `pending_request` is set exactly
// while the status is `request_pending`.
namespace hybridwork::schema {

template <uint16_t Version>
struct reveal_state;

template <>
struct reveal_state<1> final {
  uint16_t version{1};
  employee_id_t employee{};
  reveal_status_t status{reveal_status_t::unassigned};
  std::optional<request_id_t> pending_request;
};

using reveal_state_t = reveal_state<1>;

}  // namespace hybridwork::schema
