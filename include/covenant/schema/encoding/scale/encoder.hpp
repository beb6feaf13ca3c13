#pragma once
#include <covenant/common/critical.hpp>
#include <covenant/schema/encoding/encoder.hpp>
#include <covenant/schema/encoding/scale/clause.hpp>
#include <covenant/schema/encoding/scale/json_value.hpp>
#include <covenant/schema/encoding/scale/template_metadata.hpp>
#include <covenant/schema/encoding/scale/template_record.hpp>
#include <exception>
#include <iterator>
#include <scale/scale.hpp>
#include <spdlog/spdlog.h>

namespace covenant::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  covenant::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, covenant::schema::bytes_t& out);

  template <typename T>
  T decode(const covenant::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const covenant::schema::bytes_view_t& bytes);
};

template <typename T>
covenant::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    covenant::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        covenant::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const covenant::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    covenant::common::critical("failed to decode SCALE bytes");
  }
  return std::move(decoded).value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const covenant::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded).value();
  } catch (const std::exception& ex) {
    spdlog::debug("SCALE decode failed: {}", ex.what());
    return std::nullopt;
  }
}

}  // namespace covenant::schema::encoding
