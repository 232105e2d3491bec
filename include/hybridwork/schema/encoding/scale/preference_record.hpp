#pragma once
#include <hybridwork/schema/preference_record.hpp>
#include <hybridwork/schema/encoding/scale/ciphertext.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Record codecs live beside the record types so the SCALE codec reaches them
// through argument dependent lookup.
namespace hybridwork::schema {

void encode(const preference_record<1>& o, ::scale::Encoder& encoder);
void decode(preference_record<1>& o, ::scale::Decoder& decoder);

}  // namespace hybridwork::schema
