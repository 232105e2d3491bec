#include <hybridwork/schema/encoding/scale/preference_record.hpp>

namespace hybridwork::schema {

void encode(const preference_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.record_id, encoder);
  encode(o.employee, encoder);
  encode(o.days_in_office, encoder);
  encode(o.team_days, encoder);
  encode(o.focus_days, encoder);
  encode(o.flexibility, encoder);
  encode(o.submitted_at, encoder);
}

void decode(preference_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.record_id, decoder);
  decode(o.employee, decoder);
  decode(o.days_in_office, decoder);
  decode(o.team_days, decoder);
  decode(o.focus_days, decoder);
  decode(o.flexibility, decoder);
  decode(o.submitted_at, decoder);
}

}  // namespace hybridwork::schema
