#pragma once
#include <covenant/schema/clause.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/template_metadata.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace covenant::schema {

struct output_record_t final {
  amount_t amount{};
  std::optional<hash32_t> template_hash;
  std::optional<template_metadata_t> metadata;  // omitted when empty

  bool operator==(const output_record_t& other) const = default;
};

template <uint16_t Version>
struct template_record;

// Persisted and exchanged form of a template. Output scripts are carried by
// `tx` only; `outputs[i]` annotates `tx` output i.
template <>
struct template_record<1> final {
  uint16_t version{1};
  std::optional<template_metadata_t> metadata;  // omitted when empty
  std::vector<clause_t> guards;
  hash32_t ctv{};
  uint32_t ctv_index{};
  amount_t max{};
  std::optional<amount_t> min_feerate_sats_vbyte;
  bytes_t tx;  // consensus encoding
  std::vector<output_record_t> outputs;

  bool operator==(const template_record<1>& other) const = default;
};

using template_record_t = template_record<1>;

}  // namespace covenant::schema
