#include <algorithm>
#include <hybridwork/schema/key/builder.hpp>
#include <iterator>

namespace hybridwork::schema::key {

builder& builder::write(const std::string_view& str) {
  std::ranges::copy(str, std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy(bytes, std::back_inserter(data));
  return *this;
}

builder& builder::write(const hash32_t& id) {
  return write(std::span<const uint8_t>{id.data(), id.size()});
}

}  // namespace hybridwork::schema::key
