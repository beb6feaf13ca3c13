#include <covenant/schema/encoding/scale/json_value.hpp>

#include <bit>
#include <stdexcept>
#include <utility>

namespace covenant::schema {

namespace {

enum class json_tag : uint8_t {
  null = 0,
  boolean = 1,
  integer = 2,
  number = 3,
  string = 4,
  array = 5,
  object = 6,
};

void decode_value(json_value& o, ::scale::Decoder& decoder, uint32_t depth);

void decode_object(json_object_t& o,
                   ::scale::Decoder& decoder,
                   const uint32_t depth) {
  auto size = uint32_t{};
  decode(size, decoder);
  o.clear();
  for (auto i = uint32_t{0}; i < size; ++i) {
    auto key = std::string{};
    auto value = json_value{};
    decode(key, decoder);
    decode_value(value, decoder, depth + 1);
    if (!o.emplace(std::move(key), std::move(value)).second) {
      throw std::invalid_argument("duplicate json object key");
    }
  }
}

void decode_value(json_value& o,
                  ::scale::Decoder& decoder,
                  const uint32_t depth) {
  if (depth > kMaxJsonDepth) {
    throw std::invalid_argument("json value nested too deeply");
  }
  auto tag = uint8_t{};
  decode(tag, decoder);
  switch (static_cast<json_tag>(tag)) {
    case json_tag::null:
      o.value = json_null_t{};
      return;
    case json_tag::boolean: {
      auto value = bool{};
      decode(value, decoder);
      o.value = value;
      return;
    }
    case json_tag::integer: {
      auto value = int64_t{};
      decode(value, decoder);
      o.value = value;
      return;
    }
    case json_tag::number: {
      auto bits = uint64_t{};
      decode(bits, decoder);
      o.value = std::bit_cast<double>(bits);
      return;
    }
    case json_tag::string: {
      auto value = std::string{};
      decode(value, decoder);
      o.value = std::move(value);
      return;
    }
    case json_tag::array: {
      auto size = uint32_t{};
      decode(size, decoder);
      auto values = json_array_t{};
      for (auto i = uint32_t{0}; i < size; ++i) {
        auto value = json_value{};
        decode_value(value, decoder, depth + 1);
        values.push_back(std::move(value));
      }
      o.value = std::move(values);
      return;
    }
    case json_tag::object: {
      auto values = json_object_t{};
      decode_object(values, decoder, depth);
      o.value = std::move(values);
      return;
    }
  }
  throw std::invalid_argument("unknown json value tag");
}

}  // namespace

void encode(const json_value& o, ::scale::Encoder& encoder) {
  std::visit(
      overloaded{[&](const json_null_t&) {
                   encode(static_cast<uint8_t>(json_tag::null), encoder);
                 },
                 [&](const bool value) {
                   encode(static_cast<uint8_t>(json_tag::boolean), encoder);
                   encode(value, encoder);
                 },
                 [&](const int64_t value) {
                   encode(static_cast<uint8_t>(json_tag::integer), encoder);
                   encode(value, encoder);
                 },
                 [&](const double value) {
                   encode(static_cast<uint8_t>(json_tag::number), encoder);
                   encode(std::bit_cast<uint64_t>(value), encoder);
                 },
                 [&](const std::string& value) {
                   encode(static_cast<uint8_t>(json_tag::string), encoder);
                   encode(value, encoder);
                 },
                 [&](const json_array_t& values) {
                   encode(static_cast<uint8_t>(json_tag::array), encoder);
                   encode(static_cast<uint32_t>(values.size()), encoder);
                   for (const auto& value : values) {
                     encode(value, encoder);
                   }
                 },
                 [&](const json_object_t& values) {
                   encode(static_cast<uint8_t>(json_tag::object), encoder);
                   encode(values, encoder);
                 }},
      o.value);
}

void decode(json_value& o, ::scale::Decoder& decoder) {
  decode_value(o, decoder, 0);
}

// Keys are written in map order, which keeps the encoding canonical.
void encode(const json_object_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint32_t>(o.size()), encoder);
  for (const auto& [key, value] : o) {
    encode(key, encoder);
    encode(value, encoder);
  }
}

void decode(json_object_t& o, ::scale::Decoder& decoder) {
  decode_object(o, decoder, 0);
}

}  // namespace covenant::schema
