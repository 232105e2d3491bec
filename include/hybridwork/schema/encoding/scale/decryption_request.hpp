#pragma once
#include <hybridwork/schema/decryption_request.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace hybridwork::schema {

void encode(const reveal_target_t& o, ::scale::Encoder& encoder);
void decode(reveal_target_t& o, ::scale::Decoder& decoder);

void encode(const decryption_request<1>& o, ::scale::Encoder& encoder);
void decode(decryption_request<1>& o, ::scale::Decoder& decoder);

}  // namespace hybridwork::schema
