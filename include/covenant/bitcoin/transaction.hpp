#pragma once
#include <covenant/schema/primitives.hpp>
#include <cstdint>
#include <vector>

namespace covenant::bitcoin {

inline constexpr auto kSequenceFinal = uint32_t{0xFFFFFFFF};
// Highest sequence that still lets nLockTime be enforced.
inline constexpr auto kSequenceLockTimeEnabled = uint32_t{0xFFFFFFFE};

struct outpoint_t final {
  covenant::schema::hash32_t txid{};
  uint32_t index{0xFFFFFFFF};

  bool is_null() const {
    return index == 0xFFFFFFFF && txid == covenant::schema::make_zero_hash();
  }

  bool operator==(const outpoint_t& other) const = default;
};

struct tx_in_t final {
  outpoint_t prevout;
  covenant::schema::bytes_t script_sig;
  uint32_t sequence{kSequenceFinal};
  std::vector<covenant::schema::bytes_t> witness;

  bool operator==(const tx_in_t& other) const = default;
};

struct tx_out_t final {
  covenant::schema::amount_t value{};
  covenant::schema::bytes_t script_pubkey;

  bool operator==(const tx_out_t& other) const = default;
};

struct transaction_t final {
  int32_t version{2};
  std::vector<tx_in_t> inputs;
  std::vector<tx_out_t> outputs;
  uint32_t lock_time{};

  bool has_witness() const;

  bool operator==(const transaction_t& other) const = default;
};

}  // namespace covenant::bitcoin
