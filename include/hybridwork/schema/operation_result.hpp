#pragma once

#include <hybridwork/schema/error_code.hpp>
#include <hybridwork/schema/schedule_event.hpp>

#include <optional>
#include <string>
#include <vector>

namespace hybridwork::schema {

/// Outcome of an engine operation.
///
/// On success `code` is `ok` and `value` is set (for non-void operations).
/// On failure `value` is empty and no state was changed.
template <typename T>
struct operation_result final {
  error_code code{error_code::ok};
  error_category category{error_category::none};
  std::string log;
  std::string codespace;
  std::optional<T> value;
  std::vector<schedule_event_t> events;

  bool ok() const { return code == error_code::ok; }
};

/// Value type for operations that return nothing on success.
struct accepted_t final {};

}  // namespace hybridwork::schema
