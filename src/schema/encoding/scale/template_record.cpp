#include <covenant/schema/encoding/scale/clause.hpp>
#include <covenant/schema/encoding/scale/template_metadata.hpp>
#include <covenant/schema/encoding/scale/template_record.hpp>

namespace covenant::schema {

namespace {

void encode(const std::optional<template_metadata_t>& o,
            ::scale::Encoder& encoder) {
  encode(o.has_value(), encoder);
  if (o) {
    encode(*o, encoder);
  }
}

void decode(std::optional<template_metadata_t>& o, ::scale::Decoder& decoder) {
  auto present = bool{};
  decode(present, decoder);
  if (!present) {
    o.reset();
    return;
  }
  auto metadata = template_metadata_t{};
  decode(metadata, decoder);
  o = std::move(metadata);
}

}  // namespace

void encode(const output_record_t& o, ::scale::Encoder& encoder) {
  encode(o.amount, encoder);
  encode(o.template_hash, encoder);
  encode(o.metadata, encoder);
}

void decode(output_record_t& o, ::scale::Decoder& decoder) {
  decode(o.amount, decoder);
  decode(o.template_hash, decoder);
  decode(o.metadata, decoder);
}

void encode(const template_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.metadata, encoder);
  encode(o.guards, encoder);
  encode(o.ctv, encoder);
  encode(o.ctv_index, encoder);
  encode(o.max, encoder);
  encode(o.min_feerate_sats_vbyte, encoder);
  encode(o.tx, encoder);
  encode(static_cast<uint32_t>(o.outputs.size()), encoder);
  for (const auto& output : o.outputs) {
    encode(output, encoder);
  }
}

void decode(template_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.metadata, decoder);
  decode(o.guards, decoder);
  decode(o.ctv, decoder);
  decode(o.ctv_index, decoder);
  decode(o.max, decoder);
  decode(o.min_feerate_sats_vbyte, decoder);
  decode(o.tx, decoder);
  auto size = uint32_t{};
  decode(size, decoder);
  o.outputs.clear();
  for (auto i = uint32_t{0}; i < size; ++i) {
    auto output = output_record_t{};
    decode(output, decoder);
    o.outputs.push_back(std::move(output));
  }
}

}  // namespace covenant::schema
