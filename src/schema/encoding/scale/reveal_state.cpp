#include <hybridwork/schema/encoding/scale/reveal_state.hpp>

namespace hybridwork::schema {

void encode(const reveal_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.employee, encoder);
  encode(o.status, encoder);
  encode(o.pending_request, encoder);
}

void decode(reveal_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.employee, decoder);
  decode(o.status, decoder);
  decode(o.pending_request, decoder);
}

}  // namespace hybridwork::schema
