#pragma once
#include <hybridwork/schema/team_schedule.hpp>
#include <hybridwork/schema/encoding/scale/ciphertext.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace hybridwork::schema {

void encode(const team_schedule<1>& o, ::scale::Encoder& encoder);
void decode(team_schedule<1>& o, ::scale::Decoder& decoder);

}  // namespace hybridwork::schema
