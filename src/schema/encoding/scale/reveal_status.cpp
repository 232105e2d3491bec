#include <hybridwork/common/critical.hpp>
#include <hybridwork/schema/encoding/scale/reveal_status.hpp>

namespace hybridwork::schema {

void encode(const reveal_status_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(reveal_status_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  auto status = static_cast<reveal_status_t>(raw);
  if (!to_string(status, kRevealStatusMappings)) {
    hybridwork::common::critical("stored reveal status is out of range");
  }
  o = status;
}

}  // namespace hybridwork::schema
