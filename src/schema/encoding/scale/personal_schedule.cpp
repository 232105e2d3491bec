#include <hybridwork/schema/encoding/scale/personal_schedule.hpp>

namespace hybridwork::schema {

void encode(const personal_schedule<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.employee, encoder);
  encode(o.team, encoder);
  encode(o.office_days, encoder);
  encode(o.collab_days, encoder);
  encode(o.assigned, encoder);
}

void decode(personal_schedule<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.employee, decoder);
  decode(o.team, decoder);
  decode(o.office_days, decoder);
  decode(o.collab_days, decoder);
  decode(o.assigned, decoder);
}

}  // namespace hybridwork::schema
