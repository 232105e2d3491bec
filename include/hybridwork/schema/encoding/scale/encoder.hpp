#pragma once
#include <hybridwork/common/critical.hpp>
#include <hybridwork/schema/encoding/encoder.hpp>
#include <hybridwork/schema/encoding/scale/ciphertext.hpp>
#include <hybridwork/schema/encoding/scale/decryption_request.hpp>
#include <hybridwork/schema/encoding/scale/personal_schedule.hpp>
#include <hybridwork/schema/encoding/scale/preference_record.hpp>
#include <hybridwork/schema/encoding/scale/reveal_state.hpp>
#include <hybridwork/schema/encoding/scale/reveal_status.hpp>
#include <hybridwork/schema/encoding/scale/revealed_schedule.hpp>
#include <hybridwork/schema/encoding/scale/team_schedule.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace hybridwork::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  hybridwork::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, hybridwork::schema::bytes_t& out);

  template <typename T>
  T decode(const hybridwork::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const hybridwork::schema::bytes_view_t& bytes);
};

template <typename T>
hybridwork::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    hybridwork::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        hybridwork::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const hybridwork::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    hybridwork::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const hybridwork::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace hybridwork::schema::encoding
