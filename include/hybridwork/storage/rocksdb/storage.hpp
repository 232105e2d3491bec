#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <hybridwork/common/critical.hpp>
#include <hybridwork/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace hybridwork::storage {

namespace detail {

inline hybridwork::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const hybridwork::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const hybridwork::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const hybridwork::schema::bytes_view_t& key,
           const T& value) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const hybridwork::schema::bytes_view_t& prefix) const;
  void commit(const write_batch& batch) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const hybridwork::schema::bytes_view_t& key) const {
  if (!database) {
    hybridwork::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    hybridwork::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(hybridwork::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const hybridwork::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    hybridwork::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(hybridwork::schema::bytes_view_t{encoded_value}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    hybridwork::common::critical("Failed to put value into RocksDB");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const hybridwork::schema::bytes_view_t& prefix) const {
  if (!database) {
    hybridwork::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = hybridwork::schema::make_string(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB prefix scan failed: {}",
                  iterator->status().ToString());
    hybridwork::common::critical("RocksDB prefix scan failed");
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::commit(
    const write_batch& batch) const {
  if (!database) {
    hybridwork::common::critical("RocksDB database is not initialized");
  }
  if (batch.empty()) {
    return;
  }

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletes) {
    auto delete_status =
        rocks_batch.Delete(detail::to_slice(hybridwork::schema::bytes_view_t{key}));
    if (!delete_status.ok()) {
      hybridwork::common::critical("failed staging key deletion");
    }
  }
  for (const auto& [key, value] : batch.puts) {
    auto put_status = rocks_batch.Put(
        detail::to_slice(hybridwork::schema::bytes_view_t{key}),
        detail::to_slice(hybridwork::schema::bytes_view_t{value}));
    if (!put_status.ok()) {
      hybridwork::common::critical("failed staging key write");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocks_batch);
  if (!write_status.ok()) {
    spdlog::error("RocksDB batch commit failed: {}", write_status.ToString());
    hybridwork::common::critical("failed to commit write batch");
  }
}

}  // namespace hybridwork::storage
