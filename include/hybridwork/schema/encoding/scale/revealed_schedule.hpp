#pragma once
#include <hybridwork/schema/revealed_schedule.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace hybridwork::schema {

void encode(const revealed_schedule<1>& o, ::scale::Encoder& encoder);
void decode(revealed_schedule<1>& o, ::scale::Decoder& decoder);

}  // namespace hybridwork::schema
