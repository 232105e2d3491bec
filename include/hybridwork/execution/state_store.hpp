#pragma once

#include <hybridwork/schema/decryption_request.hpp>
#include <hybridwork/schema/encoding/scale/encoder.hpp>
#include <hybridwork/schema/personal_schedule.hpp>
#include <hybridwork/schema/preference_record.hpp>
#include <hybridwork/schema/primitives.hpp>
#include <hybridwork/schema/reveal_state.hpp>
#include <hybridwork/schema/revealed_schedule.hpp>
#include <hybridwork/schema/team_schedule.hpp>
#include <hybridwork/storage/rocksdb/storage.hpp>

#include <optional>
#include <vector>

namespace hybridwork::execution {

using scale_encoder_t = hybridwork::schema::encoding::encoder<
    hybridwork::schema::encoding::scale_encoder_tag>;
using rocksdb_storage_t =
    hybridwork::storage::storage<hybridwork::storage::rocksdb_storage_tag>;

/// Typed reads over the engine keyspaces.
class state_store final {
 public:
  state_store(scale_encoder_t& encoder, rocksdb_storage_t& storage)
      : encoder_{encoder}, storage_{storage} {}

  /// Last record id handed out by the ledger (0 when empty).
  hybridwork::schema::record_id_t last_record_id() const;

  std::optional<hybridwork::schema::preference_record_t> preference(
      hybridwork::schema::record_id_t record_id) const;
  std::optional<hybridwork::schema::record_id_t> latest_preference(
      const hybridwork::schema::employee_id_t& employee) const;
  std::vector<hybridwork::schema::record_id_t> preference_history(
      const hybridwork::schema::employee_id_t& employee) const;

  std::vector<hybridwork::schema::employee_id_t> members(
      const hybridwork::schema::team_id_t& team) const;

  std::optional<hybridwork::schema::team_schedule_t> team_schedule(
      const hybridwork::schema::team_id_t& team) const;
  std::optional<hybridwork::schema::personal_schedule_t> personal_schedule(
      const hybridwork::schema::employee_id_t& employee) const;
  std::optional<hybridwork::schema::revealed_schedule_t> revealed_schedule(
      const hybridwork::schema::employee_id_t& employee) const;
  std::optional<hybridwork::schema::reveal_state_t> reveal_state(
      const hybridwork::schema::employee_id_t& employee) const;
  std::optional<hybridwork::schema::decryption_request_t> pending_request(
      const hybridwork::schema::request_id_t& request_id) const;

 private:
  template <typename T>
  std::optional<T> get(const hybridwork::schema::bytes_t& key) const {
    return storage_.get<T>(encoder_,
                           hybridwork::schema::bytes_view_t{key});
  }

  scale_encoder_t& encoder_;
  rocksdb_storage_t& storage_;
};

/// Writes staged by one engine operation, committed as a single batch.
///
/// Nothing reaches storage until `commit`; dropping an uncommitted set
/// discards the operation.
class write_set final {
 public:
  explicit write_set(scale_encoder_t& encoder) : encoder_{encoder} {}

  void put_record_sequence(hybridwork::schema::record_id_t record_id);
  void put_preference(const hybridwork::schema::preference_record_t& record);
  void put_members(const hybridwork::schema::team_id_t& team,
                   const std::vector<hybridwork::schema::employee_id_t>& members);
  void put_team_schedule(const hybridwork::schema::team_schedule_t& schedule);
  void put_personal_schedule(
      const hybridwork::schema::personal_schedule_t& schedule);
  void put_revealed_schedule(
      const hybridwork::schema::revealed_schedule_t& schedule);
  void put_reveal_state(const hybridwork::schema::reveal_state_t& state);
  void put_pending_request(
      const hybridwork::schema::decryption_request_t& request);
  void erase_pending_request(const hybridwork::schema::request_id_t& request_id);

  bool empty() const { return batch_.empty(); }

  void commit(const rocksdb_storage_t& storage);

 private:
  template <typename T>
  void put(hybridwork::schema::bytes_t key, const T& value) {
    batch_.puts.emplace_back(std::move(key), encoder_.encode(value));
  }

  scale_encoder_t& encoder_;
  hybridwork::storage::write_batch batch_;
};

}  // namespace hybridwork::execution
