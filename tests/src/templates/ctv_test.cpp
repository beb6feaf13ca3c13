#include <gtest/gtest.h>
#include <covenant/bitcoin/transaction.hpp>
#include <covenant/templates/ctv.hpp>
#include <covenant/testing/common.hpp>

#include <functional>
#include <utility>
#include <vector>

namespace {

covenant::bitcoin::transaction_t make_tx() {
  auto tx = covenant::bitcoin::transaction_t{};
  tx.inputs.push_back(covenant::bitcoin::tx_in_t{});
  tx.outputs.push_back(covenant::bitcoin::tx_out_t{
      .value = 300,
      .script_pubkey = covenant::testing::make_p2wpkh_script(0x11)});
  tx.outputs.push_back(covenant::bitcoin::tx_out_t{
      .value = 400,
      .script_pubkey = covenant::testing::make_p2wpkh_script(0x22)});
  return tx;
}

}  // namespace

TEST(ctv, matches_independent_vector) {
  EXPECT_EQ(
      covenant::schema::to_hex(covenant::templates::compute_ctv_hash(make_tx(), 0)),
      "f3998c3b87d844da8b1ca29654753b70820315113103879ca33f7003a1fccc7d");
  EXPECT_EQ(
      covenant::schema::to_hex(covenant::templates::compute_ctv_hash(make_tx(), 1)),
      "f45364c686a6ff94807c7be93fad2ba742e57dc6ad08685a8601247356a406f3");
}

TEST(ctv, is_deterministic_across_equal_bodies) {
  auto lhs = make_tx();
  auto rhs = make_tx();
  EXPECT_EQ(covenant::templates::compute_ctv_hash(lhs, 0),
            covenant::templates::compute_ctv_hash(lhs, 0));
  EXPECT_EQ(covenant::templates::compute_ctv_hash(lhs, 0),
            covenant::templates::compute_ctv_hash(rhs, 0));
}

TEST(ctv, ignores_uncommitted_input_fields) {
  auto base = covenant::templates::compute_ctv_hash(make_tx(), 0);

  auto tx = make_tx();
  tx.inputs.front().prevout =
      covenant::bitcoin::outpoint_t{.txid = covenant::testing::make_hash(9),
                                    .index = 3};
  tx.inputs.front().witness = {covenant::schema::bytes_t{0xAA}};
  EXPECT_EQ(covenant::templates::compute_ctv_hash(tx, 0), base);
}

TEST(ctv, commits_to_every_relevant_field) {
  using mutation_t = std::function<void(covenant::bitcoin::transaction_t&)>;
  auto base = covenant::templates::compute_ctv_hash(make_tx(), 0);
  auto mutations = std::vector<mutation_t>{
      [](auto& tx) { tx.version = 3; },
      [](auto& tx) { tx.lock_time = 1; },
      [](auto& tx) { tx.inputs.front().sequence = 0xFFFFFFFE; },
      [](auto& tx) { tx.inputs.push_back(covenant::bitcoin::tx_in_t{}); },
      [](auto& tx) { tx.outputs[0].value = 301; },
      [](auto& tx) { tx.outputs[1].value = 399; },
      [](auto& tx) { tx.outputs[0].script_pubkey.back() ^= 0x01; },
      [](auto& tx) { tx.outputs[1].script_pubkey.push_back(0x00); },
      [](auto& tx) { std::swap(tx.outputs[0], tx.outputs[1]); },
      [](auto& tx) { tx.outputs.pop_back(); },
  };
  for (std::size_t i = 0; i < mutations.size(); ++i) {
    auto tx = make_tx();
    mutations[i](tx);
    EXPECT_NE(covenant::templates::compute_ctv_hash(tx, 0), base)
        << "mutation " << i;
  }
  EXPECT_NE(covenant::templates::compute_ctv_hash(make_tx(), 1), base);
}

TEST(ctv, component_hashes_feed_the_digest) {
  auto tx = make_tx();
  auto sequences = covenant::templates::compute_sequences_hash(tx);
  tx.inputs.front().sequence = 0;
  EXPECT_NE(covenant::templates::compute_sequences_hash(tx), sequences);

  auto outputs = covenant::templates::compute_outputs_hash(tx);
  tx.outputs.front().value = 0;
  EXPECT_NE(covenant::templates::compute_outputs_hash(tx), outputs);
}
