#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hybridwork::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using employee_id_t = hash32_t;
using team_id_t = hash32_t;
using handle_id_t = hash32_t;
using request_id_t = hash32_t;
using record_id_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Decode a 64 character hex identifier, with or without a 0x prefix.
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();
bool is_zero_hash(const hash32_t& hash);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Short hex prefix of an identifier, for log lines.
std::string short_id(const hash32_t& id);

struct ed25519_attestor_id final {
  std::array<uint8_t, 32> public_key;
};

struct secp256k1_attestor_id final {
  std::array<uint8_t, 33> public_key;
};

/// Public key of the co-processor that signs decryption results.
using attestor_id_t = std::variant<ed25519_attestor_id, secp256k1_attestor_id>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using proof_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

}  // namespace hybridwork::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
