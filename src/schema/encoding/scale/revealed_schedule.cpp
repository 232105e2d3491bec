#include <hybridwork/schema/encoding/scale/revealed_schedule.hpp>

namespace hybridwork::schema {

void encode(const revealed_schedule<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.employee, encoder);
  encode(o.office_days, encoder);
  encode(o.collab_days, encoder);
  encode(o.revealed, encoder);
  encode(o.revealed_at, encoder);
}

void decode(revealed_schedule<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.employee, decoder);
  decode(o.office_days, decoder);
  decode(o.collab_days, decoder);
  decode(o.revealed, decoder);
  decode(o.revealed_at, decoder);
}

}  // namespace hybridwork::schema
