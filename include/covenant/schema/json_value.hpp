#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace covenant::schema {

struct json_value;

using json_null_t = std::monostate;
using json_array_t = std::vector<json_value>;
using json_object_t = std::map<std::string, json_value, std::less<>>;

// Open-ended metadata value. Integers and non-integral numbers are kept
// apart so integral values survive encoding exactly.
struct json_value final {
  std::variant<json_null_t,
               bool,
               int64_t,
               double,
               std::string,
               json_array_t,
               json_object_t>
      value;

  bool operator==(const json_value& other) const = default;
};

}  // namespace covenant::schema
