#pragma once

#include <hybridwork/schema/primitives.hpp>

namespace hybridwork::schema {

/// Explicit authorization context passed into every engine operation.
///
/// `caller` has already been authenticated by the calling layer. `now` is
/// recorded on records created by the call.
struct call_context final {
  employee_id_t caller{};
  timestamp_milliseconds_t now{};
};

}  // namespace hybridwork::schema
