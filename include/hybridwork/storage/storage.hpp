#pragma once
#include <hybridwork/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace hybridwork::storage {

using key_value_entry_t =
    std::pair<hybridwork::schema::bytes_t, hybridwork::schema::bytes_t>;

/// Writes and deletes applied together or not at all.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<hybridwork::schema::bytes_t> deletes;

  bool empty() const { return puts.empty() && deletes.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const hybridwork::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const hybridwork::schema::bytes_view_t& key,
           const T& value) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const hybridwork::schema::bytes_view_t& prefix) const;

  /// Atomically apply every put and delete in the batch.
  void commit(const write_batch& batch) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace hybridwork::storage
