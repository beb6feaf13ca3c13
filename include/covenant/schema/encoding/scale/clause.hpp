#pragma once
#include <covenant/schema/clause.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace covenant::schema {

inline constexpr auto kMaxClauseDepth = 64u;

void encode(const clause_t& o, ::scale::Encoder& encoder);
void decode(clause_t& o, ::scale::Decoder& decoder);

void encode(const std::vector<clause_t>& o, ::scale::Encoder& encoder);
void decode(std::vector<clause_t>& o, ::scale::Decoder& decoder);

}  // namespace covenant::schema
