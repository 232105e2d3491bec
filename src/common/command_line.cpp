#include <hybridwork/common/command_line.hpp>

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace hybridwork::common {

namespace {

std::optional<uint32_t> parse_count(const std::string& token) {
  if (token.empty() ||
      !std::isdigit(static_cast<unsigned char>(token.front()))) {
    return std::nullopt;
  }
  auto consumed = std::size_t{};
  auto parsed = uint64_t{};
  try {
    parsed = std::stoull(token, &consumed);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  if (consumed != token.size() || parsed > UINT32_MAX) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(parsed);
}

}  // namespace

std::optional<member_entry> parse_member(const std::string& value) {
  auto separator = value.find(':');
  if (separator == std::string::npos || separator == 0 ||
      separator + 1 == value.size()) {
    return std::nullopt;
  }
  return member_entry{value.substr(0, separator), value.substr(separator + 1)};
}

std::optional<preference_entry> parse_preference(const std::string& value) {
  auto separator = value.find(':');
  if (separator == std::string::npos || separator == 0) {
    return std::nullopt;
  }
  auto entry = preference_entry{};
  entry.employee = value.substr(0, separator);
  auto rest = std::string_view{value}.substr(separator + 1);
  while (!rest.empty()) {
    auto comma = rest.find(',');
    auto parsed = parse_count(std::string{rest.substr(0, comma)});
    if (!parsed) {
      return std::nullopt;
    }
    entry.values.push_back(*parsed);
    if (comma == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(comma + 1);
  }
  if (entry.values.size() != 4) {
    return std::nullopt;
  }
  return entry;
}

}  // namespace hybridwork::common
