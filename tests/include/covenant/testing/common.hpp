#pragma once

#include <covenant/schema/output.hpp>
#include <covenant/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace covenant::testing {

inline covenant::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = covenant::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Version 0 witness program over a 20-byte key hash filled with `seed`.
inline covenant::schema::bytes_t make_p2wpkh_script(const uint8_t seed) {
  auto script = covenant::schema::bytes_t{0x00, 0x14};
  script.insert(std::end(script), 20, seed);
  return script;
}

inline covenant::schema::output_t make_output(
    const covenant::schema::amount_t amount,
    const uint8_t seed) {
  return covenant::schema::output_t{.amount = amount,
                                    .script_pubkey = make_p2wpkh_script(seed)};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace covenant::testing
