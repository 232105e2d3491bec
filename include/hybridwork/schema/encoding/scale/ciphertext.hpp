#pragma once
#include <hybridwork/fhe/ciphertext.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace hybridwork::fhe {

// A ciphertext is stored as its handle identifier only.
void encode(const ciphertext& o, ::scale::Encoder& encoder);
void decode(ciphertext& o, ::scale::Decoder& decoder);

}  // namespace hybridwork::fhe
