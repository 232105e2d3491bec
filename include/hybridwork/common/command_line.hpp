#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hybridwork::common {

/// `team:employee` from `--member`.
struct member_entry final {
  std::string team;
  std::string employee;
};

/// `employee:office,team,focus,flexibility` from `--preference`.
struct preference_entry final {
  std::string employee;
  std::vector<uint32_t> values;
};

std::optional<member_entry> parse_member(const std::string& value);

/// Every value must be a plain decimal uint32; signs, whitespace and
/// trailing characters are rejected.
std::optional<preference_entry> parse_preference(const std::string& value);

}  // namespace hybridwork::common
