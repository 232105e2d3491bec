#include <hybridwork/common/critical.hpp>
#include <hybridwork/schema/encoding/scale/decryption_request.hpp>

namespace hybridwork::schema {

void encode(const reveal_target_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(reveal_target_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  auto target = static_cast<reveal_target_t>(raw);
  if (!to_string(target, kRevealTargetMappings)) {
    hybridwork::common::critical("stored reveal target is out of range");
  }
  o = target;
}

void encode(const decryption_request<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.request_id, encoder);
  encode(o.target, encoder);
  encode(o.employee, encoder);
  encode(o.handles, encoder);
  encode(o.requested_at, encoder);
}

void decode(decryption_request<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.request_id, decoder);
  decode(o.target, decoder);
  decode(o.employee, decoder);
  decode(o.handles, decoder);
  decode(o.requested_at, decoder);
}

}  // namespace hybridwork::schema
