#include <covenant/schema/encoding/scale/json_value.hpp>
#include <covenant/schema/encoding/scale/template_metadata.hpp>

namespace covenant::schema {

void encode(const template_metadata_t& o, ::scale::Encoder& encoder) {
  encode(o.label, encoder);
  encode(o.color, encoder);
  encode(o.extra, encoder);
}

void decode(template_metadata_t& o, ::scale::Decoder& decoder) {
  decode(o.label, decoder);
  decode(o.color, decoder);
  decode(o.extra, decoder);
}

}  // namespace covenant::schema
