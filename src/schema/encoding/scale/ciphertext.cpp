#include <hybridwork/schema/encoding/scale/ciphertext.hpp>

namespace hybridwork::fhe {

void encode(const ciphertext& o, ::scale::Encoder& encoder) {
  encode(o.handle(), encoder);
}

void decode(ciphertext& o, ::scale::Decoder& decoder) {
  auto handle = hybridwork::schema::handle_id_t{};
  decode(handle, decoder);
  o = ciphertext{handle};
}

}  // namespace hybridwork::fhe
