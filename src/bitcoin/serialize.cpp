#include <covenant/bitcoin/serialize.hpp>
#include <covenant/sha256/hash.hpp>

#include <boost/endian/buffers.hpp>
#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <iterator>

using covenant::schema::bytes_t;
using covenant::schema::bytes_view_t;

namespace covenant::bitcoin {

namespace {

template <typename Buffer>
void append(bytes_t& out, const Buffer& buffer) {
  const auto* begin = reinterpret_cast<const uint8_t*>(buffer.data());
  out.insert(std::end(out), begin, begin + sizeof(Buffer));
}

void serialize(const tx_in_t& input, bytes_t& out) {
  out.insert(std::end(out), std::begin(input.prevout.txid),
             std::end(input.prevout.txid));
  write_le32(out, input.prevout.index);
  write_var_bytes(out, input.script_sig);
  write_le32(out, input.sequence);
}

std::optional<tx_in_t> read_input(reader& in) {
  auto input = tx_in_t{};
  auto txid = in.read_bytes(input.prevout.txid.size());
  auto index = in.read_le32();
  auto script_sig = in.read_var_bytes();
  auto sequence = in.read_le32();
  if (!txid || !index || !script_sig || !sequence) {
    return std::nullopt;
  }
  std::copy(std::begin(*txid), std::end(*txid),
            std::begin(input.prevout.txid));
  input.prevout.index = *index;
  input.script_sig = std::move(*script_sig);
  input.sequence = *sequence;
  return input;
}

std::optional<tx_out_t> read_output(reader& in) {
  auto value = in.read_le64();
  auto script = in.read_var_bytes();
  if (!value || !script) {
    return std::nullopt;
  }
  return tx_out_t{.value = *value, .script_pubkey = std::move(*script)};
}

template <typename T, typename Read>
std::optional<std::vector<T>> read_vector(reader& in, Read&& read) {
  auto count = in.read_compact_size();
  // every element occupies at least one byte
  if (!count || *count > in.remaining()) {
    return std::nullopt;
  }
  auto out = std::vector<T>{};
  out.reserve(static_cast<std::size_t>(*count));
  for (auto i = uint64_t{0}; i < *count; ++i) {
    auto element = read(in);
    if (!element) {
      return std::nullopt;
    }
    out.push_back(std::move(*element));
  }
  return out;
}

}  // namespace

bool transaction_t::has_witness() const {
  return std::ranges::any_of(
      inputs, [](const tx_in_t& input) { return !input.witness.empty(); });
}

void write_le32(bytes_t& out, const uint32_t value) {
  append(out, boost::endian::little_uint32_buf_t{value});
}

void write_le32(bytes_t& out, const int32_t value) {
  append(out, boost::endian::little_int32_buf_t{value});
}

void write_le64(bytes_t& out, const int64_t value) {
  append(out, boost::endian::little_int64_buf_t{value});
}

void write_compact_size(bytes_t& out, const uint64_t size) {
  if (size < 253) {
    out.push_back(static_cast<uint8_t>(size));
  } else if (size <= 0xFFFF) {
    out.push_back(253);
    append(out,
           boost::endian::little_uint16_buf_t{static_cast<uint16_t>(size)});
  } else if (size <= 0xFFFFFFFF) {
    out.push_back(254);
    append(out,
           boost::endian::little_uint32_buf_t{static_cast<uint32_t>(size)});
  } else {
    out.push_back(255);
    append(out, boost::endian::little_uint64_buf_t{size});
  }
}

void write_var_bytes(bytes_t& out, const bytes_view_t& bytes) {
  write_compact_size(out, bytes.size());
  out.insert(std::end(out), std::begin(bytes), std::end(bytes));
}

void serialize(const tx_out_t& output, bytes_t& out) {
  write_le64(out, output.value);
  write_var_bytes(out, output.script_pubkey);
}

bytes_t serialize(const transaction_t& tx, const bool with_witness) {
  auto out = bytes_t{};
  auto witness = with_witness && tx.has_witness();

  write_le32(out, tx.version);
  if (witness) {
    out.push_back(0x00);  // marker
    out.push_back(0x01);  // flag
  }
  write_compact_size(out, tx.inputs.size());
  for (const auto& input : tx.inputs) {
    serialize(input, out);
  }
  write_compact_size(out, tx.outputs.size());
  for (const auto& output : tx.outputs) {
    serialize(output, out);
  }
  if (witness) {
    for (const auto& input : tx.inputs) {
      write_compact_size(out, input.witness.size());
      for (const auto& item : input.witness) {
        write_var_bytes(out, item);
      }
    }
  }
  write_le32(out, tx.lock_time);
  return out;
}

std::optional<transaction_t> try_deserialize(const bytes_view_t& bytes) {
  auto in = reader{bytes};
  auto tx = transaction_t{};

  auto version = in.read_le32();
  if (!version) {
    return std::nullopt;
  }
  tx.version = static_cast<int32_t>(*version);

  auto inputs = read_vector<tx_in_t>(in, read_input);
  if (!inputs) {
    return std::nullopt;
  }
  auto flags = uint8_t{0};
  if (inputs->empty()) {
    // an empty input vector is the BIP-144 marker
    auto flag = in.read_u8();
    if (!flag) {
      return std::nullopt;
    }
    flags = *flag;
    if (flags != 0) {
      inputs = read_vector<tx_in_t>(in, read_input);
      if (!inputs) {
        return std::nullopt;
      }
    }
  }
  tx.inputs = std::move(*inputs);

  if (!tx.inputs.empty() || flags != 0) {
    auto outputs = read_vector<tx_out_t>(in, read_output);
    if (!outputs) {
      return std::nullopt;
    }
    tx.outputs = std::move(*outputs);
  }

  if ((flags & 0x01) != 0) {
    flags &= static_cast<uint8_t>(~0x01);
    for (auto& input : tx.inputs) {
      auto witness = read_vector<bytes_t>(
          in, [](reader& r) { return r.read_var_bytes(); });
      if (!witness) {
        return std::nullopt;
      }
      input.witness = std::move(*witness);
    }
    if (!tx.has_witness()) {
      return std::nullopt;  // superfluous witness record
    }
  }
  if (flags != 0) {
    return std::nullopt;  // unknown optional data
  }

  auto lock_time = in.read_le32();
  if (!lock_time || in.remaining() != 0) {
    return std::nullopt;
  }
  tx.lock_time = *lock_time;
  return tx;
}

covenant::schema::hash32_t compute_txid(const transaction_t& tx) {
  auto encoded = serialize(tx, false);
  return covenant::sha256::double_hash(covenant::schema::make_bytes_view(encoded));
}

reader::reader(const bytes_view_t& bytes) : bytes_(bytes) {}

std::optional<uint8_t> reader::read_u8() {
  if (remaining() < 1) {
    return std::nullopt;
  }
  return bytes_[offset_++];
}

std::optional<uint32_t> reader::read_le32() {
  if (remaining() < 4) {
    return std::nullopt;
  }
  auto value = boost::endian::load_little_u32(bytes_.data() + offset_);
  offset_ += 4;
  return value;
}

std::optional<int64_t> reader::read_le64() {
  if (remaining() < 8) {
    return std::nullopt;
  }
  auto value = boost::endian::load_little_s64(bytes_.data() + offset_);
  offset_ += 8;
  return value;
}

std::optional<uint64_t> reader::read_compact_size() {
  auto first = read_u8();
  if (!first) {
    return std::nullopt;
  }
  auto size = uint64_t{*first};
  auto minimum = uint64_t{0};
  if (*first == 253) {
    if (remaining() < 2) {
      return std::nullopt;
    }
    size = boost::endian::load_little_u16(bytes_.data() + offset_);
    offset_ += 2;
    minimum = 253;
  } else if (*first == 254) {
    if (remaining() < 4) {
      return std::nullopt;
    }
    size = boost::endian::load_little_u32(bytes_.data() + offset_);
    offset_ += 4;
    minimum = 0x10000;
  } else if (*first == 255) {
    if (remaining() < 8) {
      return std::nullopt;
    }
    size = boost::endian::load_little_u64(bytes_.data() + offset_);
    offset_ += 8;
    minimum = 0x100000000;
  }
  // non-canonical encodings are invalid
  if (size < minimum || size > kMaxCompactSize) {
    return std::nullopt;
  }
  return size;
}

std::optional<bytes_t> reader::read_bytes(const std::size_t size) {
  if (remaining() < size) {
    return std::nullopt;
  }
  auto begin = std::begin(bytes_) + static_cast<std::ptrdiff_t>(offset_);
  auto out = bytes_t{begin, begin + static_cast<std::ptrdiff_t>(size)};
  offset_ += size;
  return out;
}

std::optional<bytes_t> reader::read_var_bytes() {
  auto size = read_compact_size();
  if (!size) {
    return std::nullopt;
  }
  return read_bytes(static_cast<std::size_t>(*size));
}

}  // namespace covenant::bitcoin
