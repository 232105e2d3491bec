#pragma once
#include <hybridwork/schema/reveal_state.hpp>
#include <hybridwork/schema/encoding/scale/reveal_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace hybridwork::schema {

void encode(const reveal_state<1>& o, ::scale::Encoder& encoder);
void decode(reveal_state<1>& o, ::scale::Decoder& decoder);

}  // namespace hybridwork::schema
