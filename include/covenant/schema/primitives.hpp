#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace covenant::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

// Satoshis. Signed so that malformed negative input is representable and can
// be rejected at the boundary.
using amount_t = int64_t;

inline constexpr auto kCoin = amount_t{100'000'000};
inline constexpr auto kMaxMoney = amount_t{21'000'000} * kCoin;

constexpr bool money_range(const amount_t value) {
  return value >= 0 && value <= kMaxMoney;
}

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const hash32_t& hash);

hash32_t make_hash32(const bytes_view_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const bytes_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

/// Parse a decimal satoshi amount. Rejects signs, fractions, non-digits and
/// values outside `money_range`.
std::optional<amount_t> try_parse_amount(std::string_view text);

}  // namespace covenant::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
