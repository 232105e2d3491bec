#pragma once

#include <hybridwork/fhe/attestation.hpp>
#include <hybridwork/fhe/simulated_coprocessor.hpp>
#include <hybridwork/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace hybridwork::testing {

inline hybridwork::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = hybridwork::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Plaintext behind a simulated ciphertext, read through the regular
/// decryption path.
inline std::optional<uint32_t> reveal(
    hybridwork::fhe::simulated_coprocessor& coprocessor,
    const hybridwork::fhe::ciphertext& value) {
  auto request_id =
      coprocessor.request_decryption({coprocessor.serialize(value)});
  auto response = coprocessor.fulfil(request_id);
  if (!response) {
    return std::nullopt;
  }
  auto values = hybridwork::fhe::decode_reveal_payload(
      hybridwork::schema::bytes_view_t{response->payload}, 1);
  if (!values) {
    return std::nullopt;
  }
  return values->front();
}

}  // namespace hybridwork::testing
