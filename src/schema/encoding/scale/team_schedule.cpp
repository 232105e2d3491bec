#include <hybridwork/schema/encoding/scale/team_schedule.hpp>

namespace hybridwork::schema {

void encode(const team_schedule<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.team, encoder);
  encode(o.office_days, encoder);
  encode(o.collab_days, encoder);
  encode(o.overlap_score, encoder);
  encode(o.optimized, encoder);
  encode(o.optimized_at, encoder);
}

void decode(team_schedule<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.team, decoder);
  decode(o.office_days, decoder);
  decode(o.collab_days, decoder);
  decode(o.overlap_score, decoder);
  decode(o.optimized, decoder);
  decode(o.optimized_at, decoder);
}

}  // namespace hybridwork::schema
