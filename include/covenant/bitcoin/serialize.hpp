#pragma once
#include <covenant/bitcoin/transaction.hpp>
#include <covenant/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

// Bitcoin consensus encoding: little-endian integers, CompactSize length
// prefixes, BIP-144 witness serialization.
namespace covenant::bitcoin {

inline constexpr auto kMaxCompactSize = uint64_t{0x02000000};

void write_le32(covenant::schema::bytes_t& out, uint32_t value);
void write_le32(covenant::schema::bytes_t& out, int32_t value);
void write_le64(covenant::schema::bytes_t& out, int64_t value);
void write_compact_size(covenant::schema::bytes_t& out, uint64_t size);
void write_var_bytes(covenant::schema::bytes_t& out,
                     const covenant::schema::bytes_view_t& bytes);

void serialize(const tx_out_t& output, covenant::schema::bytes_t& out);

/// Consensus encoding of `tx`. Witness data is written (BIP-144) only when
/// requested and at least one input carries any.
covenant::schema::bytes_t serialize(const transaction_t& tx,
                                    bool with_witness = true);

/// Parse a consensus-encoded transaction. Truncated input, oversized
/// CompactSize values and trailing bytes are rejected.
std::optional<transaction_t> try_deserialize(
    const covenant::schema::bytes_view_t& bytes);

/// Double SHA-256 of the non-witness encoding, in internal byte order.
covenant::schema::hash32_t compute_txid(const transaction_t& tx);

/// Cursor over consensus-encoded bytes.
class reader final {
 public:
  explicit reader(const covenant::schema::bytes_view_t& bytes);

  std::optional<uint8_t> read_u8();
  std::optional<uint32_t> read_le32();
  std::optional<int64_t> read_le64();
  std::optional<uint64_t> read_compact_size();
  std::optional<covenant::schema::bytes_t> read_bytes(std::size_t size);
  std::optional<covenant::schema::bytes_t> read_var_bytes();

  std::size_t remaining() const { return bytes_.size() - offset_; }

 private:
  covenant::schema::bytes_view_t bytes_;
  std::size_t offset_{};
};

}  // namespace covenant::bitcoin
