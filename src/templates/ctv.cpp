#include <covenant/bitcoin/serialize.hpp>
#include <covenant/sha256/hash.hpp>
#include <covenant/templates/ctv.hpp>

#include <iterator>

using covenant::schema::bytes_t;
using covenant::schema::make_bytes_view;

namespace covenant::templates {

covenant::schema::hash32_t compute_sequences_hash(
    const covenant::bitcoin::transaction_t& tx) {
  auto material = bytes_t{};
  material.reserve(tx.inputs.size() * 4);
  for (const auto& input : tx.inputs) {
    covenant::bitcoin::write_le32(material, input.sequence);
  }
  return covenant::sha256::hash(make_bytes_view(material));
}

covenant::schema::hash32_t compute_outputs_hash(
    const covenant::bitcoin::transaction_t& tx) {
  auto material = bytes_t{};
  for (const auto& output : tx.outputs) {
    covenant::bitcoin::serialize(output, material);
  }
  return covenant::sha256::hash(make_bytes_view(material));
}

covenant::schema::hash32_t compute_ctv_hash(
    const covenant::bitcoin::transaction_t& tx,
    const uint32_t input_index) {
  auto sequences_hash = compute_sequences_hash(tx);
  auto outputs_hash = compute_outputs_hash(tx);

  auto material = bytes_t{};
  material.reserve(4 + 4 + 4 + 32 + 4 + 32 + 4);
  covenant::bitcoin::write_le32(material, tx.version);
  covenant::bitcoin::write_le32(material, tx.lock_time);
  covenant::bitcoin::write_le32(material,
                                static_cast<uint32_t>(tx.inputs.size()));
  material.insert(std::end(material), std::begin(sequences_hash),
                  std::end(sequences_hash));
  covenant::bitcoin::write_le32(material,
                                static_cast<uint32_t>(tx.outputs.size()));
  material.insert(std::end(material), std::begin(outputs_hash),
                  std::end(outputs_hash));
  covenant::bitcoin::write_le32(material, input_index);
  return covenant::sha256::hash(make_bytes_view(material));
}

}  // namespace covenant::templates
