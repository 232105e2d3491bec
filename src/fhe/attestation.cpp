#include <hybridwork/fhe/attestation.hpp>
#include <hybridwork/schema/encoding/scale/encoder.hpp>

#include <string>
#include <tuple>

namespace hybridwork::fhe {

namespace {

using encoder_t = hybridwork::schema::encoding::encoder<
    hybridwork::schema::encoding::scale_encoder_tag>;

constexpr auto kValueWidth = sizeof(uint32_t);

}  // namespace

hybridwork::schema::bytes_t make_reveal_message(
    const hybridwork::schema::request_id_t& request_id,
    const hybridwork::schema::bytes_view_t& payload) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{std::string{kRevealDomain}, request_id,
                                   hybridwork::schema::make_bytes(payload)});
}

hybridwork::schema::bytes_t encode_reveal_payload(
    const std::vector<uint32_t>& values) {
  auto encoder = encoder_t{};
  auto payload = hybridwork::schema::bytes_t{};
  payload.reserve(values.size() * kValueWidth);
  for (const auto value : values) {
    encoder.encode(value, payload);
  }
  return payload;
}

std::optional<std::vector<uint32_t>> decode_reveal_payload(
    const hybridwork::schema::bytes_view_t& payload,
    const std::size_t count) {
  if (payload.size() != count * kValueWidth) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto values = std::vector<uint32_t>{};
  values.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    auto value =
        encoder.try_decode<uint32_t>(payload.subspan(i * kValueWidth, kValueWidth));
    if (!value.has_value()) {
      return std::nullopt;
    }
    values.push_back(*value);
  }
  return values;
}

}  // namespace hybridwork::fhe
