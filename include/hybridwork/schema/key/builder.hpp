#pragma once
#include <hybridwork/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace hybridwork::schema::key {

/// Raw key writer. Integers are written big-endian so that RocksDB's
/// bytewise ordering matches numeric ordering within a prefix.
struct builder final {
  hybridwork::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const hash32_t& id);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    const auto* raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace hybridwork::schema::key
