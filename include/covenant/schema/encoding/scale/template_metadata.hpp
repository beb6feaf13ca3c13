#pragma once
#include <covenant/schema/template_metadata.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace covenant::schema {

void encode(const template_metadata_t& o, ::scale::Encoder& encoder);
void decode(template_metadata_t& o, ::scale::Decoder& decoder);

}  // namespace covenant::schema
