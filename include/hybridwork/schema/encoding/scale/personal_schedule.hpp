#pragma once
#include <hybridwork/schema/personal_schedule.hpp>
#include <hybridwork/schema/encoding/scale/ciphertext.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace hybridwork::schema {

void encode(const personal_schedule<1>& o, ::scale::Encoder& encoder);
void decode(personal_schedule<1>& o, ::scale::Decoder& decoder);

}  // namespace hybridwork::schema
