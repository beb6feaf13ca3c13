#pragma once
#include <covenant/schema/template_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace covenant::schema {

void encode(const output_record_t& o, ::scale::Encoder& encoder);
void decode(output_record_t& o, ::scale::Decoder& decoder);

void encode(const template_record<1>& o, ::scale::Encoder& encoder);
void decode(template_record<1>& o, ::scale::Decoder& decoder);

}  // namespace covenant::schema
