#pragma once
#include <hybridwork/schema/primitives.hpp>
#include <optional>

namespace hybridwork::schema::encoding {

/// Build-time selected wire encoder. Specialized per library tag.
template <typename Library>
struct encoder {
  template <typename T>
  hybridwork::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, hybridwork::schema::bytes_t& out);

  template <typename T>
  T decode(const hybridwork::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const hybridwork::schema::bytes_view_t& bytes);
};

}  // namespace hybridwork::schema::encoding
