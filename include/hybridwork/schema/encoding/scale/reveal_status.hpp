#pragma once
#include <hybridwork/schema/reveal_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace hybridwork::schema {

void encode(const reveal_status_t& o, ::scale::Encoder& encoder);
void decode(reveal_status_t& o, ::scale::Decoder& decoder);

}  // namespace hybridwork::schema
