#pragma once

#include <hybridwork/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace hybridwork::fhe {

inline constexpr std::string_view kRevealDomain{"hybridwork.reveal.v1"};

/// Bytes a co-processor signs for a decryption result. The request id is part
/// of the message so a proof cannot be replayed against another request.
hybridwork::schema::bytes_t make_reveal_message(
    const hybridwork::schema::request_id_t& request_id,
    const hybridwork::schema::bytes_view_t& payload);

/// Plaintext payload: each value as a fixed-width little-endian uint32.
hybridwork::schema::bytes_t encode_reveal_payload(
    const std::vector<uint32_t>& values);

/// Decode a payload holding exactly `count` values, or std::nullopt.
std::optional<std::vector<uint32_t>> decode_reveal_payload(
    const hybridwork::schema::bytes_view_t& payload,
    std::size_t count);

}  // namespace hybridwork::fhe
