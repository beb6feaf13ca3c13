#pragma once
#include <covenant/schema/json_value.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared in the schema namespace so the codec finds them by
// argument-dependent lookup when encoding containers of these types.
namespace covenant::schema {

inline constexpr auto kMaxJsonDepth = 64u;

void encode(const json_value& o, ::scale::Encoder& encoder);
void decode(json_value& o, ::scale::Decoder& decoder);

void encode(const json_object_t& o, ::scale::Encoder& encoder);
void decode(json_object_t& o, ::scale::Decoder& decoder);

}  // namespace covenant::schema
