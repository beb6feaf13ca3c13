#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace covenant::schema {

enum class template_error_code : uint32_t {
  ok = 0,
  malformed_input = 1,
  amount_exceeded = 2,
  empty_output_set = 3,
  already_finalized = 4,
  invariant_violation = 5,
  amount_mismatch = 6,
  missing_child = 7,
};

inline constexpr auto kTemplateErrorCodeNames =
    std::array<std::pair<std::string_view, template_error_code>, 8>{{
        {"ok", template_error_code::ok},
        {"malformed_input", template_error_code::malformed_input},
        {"amount_exceeded", template_error_code::amount_exceeded},
        {"empty_output_set", template_error_code::empty_output_set},
        {"already_finalized", template_error_code::already_finalized},
        {"invariant_violation", template_error_code::invariant_violation},
        {"amount_mismatch", template_error_code::amount_mismatch},
        {"missing_child", template_error_code::missing_child},
    }};

constexpr std::string_view to_string(const template_error_code code) {
  return to_string(code, kTemplateErrorCodeNames).value_or("unknown");
}

template <>
inline std::optional<template_error_code> try_from_string<template_error_code>(
    const std::string_view value) {
  return from_string(value, kTemplateErrorCodeNames);
}

}  // namespace covenant::schema
