#include <gtest/gtest.h>
#include <covenant/templates/builder.hpp>
#include <covenant/templates/ctv.hpp>
#include <covenant/testing/common.hpp>

using covenant::schema::template_error_code;
using covenant::testing::make_output;

TEST(template_builder, finalize_within_max_succeeds) {
  auto builder = covenant::templates::template_builder{};
  ASSERT_EQ(builder.set_max(1000), template_error_code::ok);
  ASSERT_EQ(builder.add_output(make_output(300, 0x11)), template_error_code::ok);
  ASSERT_EQ(builder.add_output(make_output(400, 0x22)), template_error_code::ok);

  auto result = builder.finalize();
  ASSERT_TRUE(result.ok()) << result.log;
  const auto& tmpl = *result.value;
  EXPECT_EQ(tmpl.total_amount(), 700);
  EXPECT_EQ(tmpl.max(), 1000);
  EXPECT_EQ(tmpl.ctv_index(), 0u);
  EXPECT_EQ(covenant::schema::to_hex(tmpl.hash()),
            "f3998c3b87d844da8b1ca29654753b70820315113103879ca33f7003a1fccc7d");
  EXPECT_EQ(tmpl.hash(), covenant::templates::compute_ctv_hash(tmpl.tx(), 0));
  EXPECT_EQ(tmpl.verify(), template_error_code::ok);
  EXPECT_TRUE(builder.finalized());
}

TEST(template_builder, materialized_transaction_shape) {
  auto builder = covenant::templates::template_builder{};
  ASSERT_EQ(builder.add_output(make_output(300, 0x11)), template_error_code::ok);
  auto result = builder.finalize();
  ASSERT_TRUE(result.ok());

  const auto& tx = result.value->tx();
  EXPECT_EQ(tx.version, 2);
  EXPECT_EQ(tx.lock_time, 0u);
  ASSERT_EQ(tx.inputs.size(), 1u);
  EXPECT_TRUE(tx.inputs.front().prevout.is_null());
  EXPECT_TRUE(tx.inputs.front().script_sig.empty());
  EXPECT_EQ(tx.inputs.front().sequence, covenant::bitcoin::kSequenceFinal);
  ASSERT_EQ(tx.outputs.size(), 1u);
  EXPECT_EQ(tx.outputs.front().value, 300);
}

TEST(template_builder, lock_time_enables_sequence) {
  auto builder = covenant::templates::template_builder{};
  ASSERT_EQ(builder.set_lock_time(800000), template_error_code::ok);
  ASSERT_EQ(builder.set_sequence(2, 144), template_error_code::ok);
  ASSERT_EQ(builder.add_output(make_output(1, 0x11)), template_error_code::ok);
  auto result = builder.finalize();
  ASSERT_TRUE(result.ok());

  const auto& inputs = result.value->tx().inputs;
  ASSERT_EQ(inputs.size(), 3u);
  EXPECT_EQ(inputs[0].sequence, covenant::bitcoin::kSequenceLockTimeEnabled);
  EXPECT_EQ(inputs[1].sequence, covenant::bitcoin::kSequenceLockTimeEnabled);
  EXPECT_EQ(inputs[2].sequence, 144u);
  EXPECT_EQ(result.value->tx().lock_time, 800000u);
}

TEST(template_builder, over_max_fails_and_stays_accumulating) {
  auto builder = covenant::templates::template_builder{};
  ASSERT_EQ(builder.set_max(500), template_error_code::ok);
  ASSERT_EQ(builder.add_output(make_output(300, 0x11)), template_error_code::ok);
  ASSERT_EQ(builder.add_output(make_output(300, 0x22)), template_error_code::ok);

  auto result = builder.finalize();
  EXPECT_EQ(result.code, template_error_code::amount_exceeded);
  EXPECT_FALSE(result.value.has_value());
  EXPECT_FALSE(builder.finalized());
  EXPECT_EQ(builder.pending_total(), 600);

  ASSERT_EQ(builder.remove_output(1), template_error_code::ok);
  ASSERT_EQ(builder.add_output(make_output(200, 0x22)), template_error_code::ok);
  EXPECT_EQ(builder.pending_total(), 500);

  auto retried = builder.finalize();
  ASSERT_TRUE(retried.ok()) << retried.log;
  EXPECT_EQ(retried.value->total_amount(), 500);
}

TEST(template_builder, empty_output_set_fails) {
  auto builder = covenant::templates::template_builder{};
  auto result = builder.finalize();
  EXPECT_EQ(result.code, template_error_code::empty_output_set);
  EXPECT_FALSE(builder.finalized());
}

TEST(template_builder, max_defaults_to_total) {
  auto builder = covenant::templates::template_builder{};
  ASSERT_EQ(builder.add_output(make_output(250, 0x11)), template_error_code::ok);
  auto result = builder.finalize();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->max(), 250);
}

TEST(template_builder, strict_mode_requires_exact_total) {
  auto builder = covenant::templates::template_builder{};
  ASSERT_EQ(builder.set_max(1000), template_error_code::ok);
  ASSERT_EQ(builder.require_exact_amount(true), template_error_code::ok);
  ASSERT_EQ(builder.add_output(make_output(700, 0x11)), template_error_code::ok);
  EXPECT_EQ(builder.finalize().code, template_error_code::amount_mismatch);

  ASSERT_EQ(builder.add_output(make_output(300, 0x22)), template_error_code::ok);
  EXPECT_TRUE(builder.finalize().ok());
}

TEST(template_builder, rejects_out_of_range_amounts) {
  auto builder = covenant::templates::template_builder{};
  EXPECT_EQ(builder.add_output(make_output(-1, 0x11)),
            template_error_code::malformed_input);
  EXPECT_EQ(builder.add_output(
                make_output(covenant::schema::kMaxMoney + 1, 0x11)),
            template_error_code::malformed_input);
  ASSERT_EQ(builder.add_output(make_output(covenant::schema::kMaxMoney, 0x11)),
            template_error_code::ok);
  EXPECT_EQ(builder.add_output(make_output(1, 0x22)),
            template_error_code::malformed_input);
  EXPECT_EQ(builder.set_max(-5), template_error_code::malformed_input);
  EXPECT_EQ(builder.set_min_feerate(-1), template_error_code::malformed_input);
  EXPECT_EQ(builder.remove_output(3), template_error_code::malformed_input);
  EXPECT_EQ(builder.output_count(), 1u);
}

TEST(template_builder, mutators_fail_after_finalize) {
  auto builder = covenant::templates::template_builder{};
  ASSERT_EQ(builder.add_output(make_output(1, 0x11)), template_error_code::ok);
  ASSERT_TRUE(builder.finalize().ok());

  EXPECT_EQ(builder.add_output(make_output(1, 0x22)),
            template_error_code::already_finalized);
  EXPECT_EQ(builder.remove_output(0), template_error_code::already_finalized);
  EXPECT_EQ(builder.add_guard(covenant::schema::clause_t{}),
            template_error_code::already_finalized);
  EXPECT_EQ(builder.set_max(1), template_error_code::already_finalized);
  EXPECT_EQ(builder.set_min_feerate(1), template_error_code::already_finalized);
  EXPECT_EQ(builder.set_label("x"), template_error_code::already_finalized);
  EXPECT_EQ(builder.set_color("x"), template_error_code::already_finalized);
  EXPECT_EQ(builder.set_extra("k", covenant::schema::json_value{}),
            template_error_code::already_finalized);
  EXPECT_EQ(builder.set_metadata({}), template_error_code::already_finalized);
  EXPECT_EQ(builder.set_version(1), template_error_code::already_finalized);
  EXPECT_EQ(builder.set_lock_time(1), template_error_code::already_finalized);
  EXPECT_EQ(builder.set_sequence(0, 1), template_error_code::already_finalized);
  EXPECT_EQ(builder.require_exact_amount(true),
            template_error_code::already_finalized);
  EXPECT_EQ(builder.finalize().code, template_error_code::already_finalized);
}

TEST(template_builder, metadata_and_guards_do_not_affect_digest) {
  auto plain = covenant::templates::template_builder{};
  ASSERT_EQ(plain.add_output(make_output(300, 0x11)), template_error_code::ok);

  auto decorated = covenant::templates::template_builder{};
  ASSERT_EQ(decorated.add_output(make_output(300, 0x11)),
            template_error_code::ok);
  ASSERT_EQ(decorated.set_label("vault"), template_error_code::ok);
  ASSERT_EQ(decorated.set_color("#ff0000"), template_error_code::ok);
  ASSERT_EQ(decorated.set_extra("tier", covenant::schema::json_value{int64_t{2}}),
            template_error_code::ok);
  ASSERT_EQ(decorated.add_guard(covenant::schema::clause_t{
                covenant::schema::older_t{.sequence = 144}}),
            template_error_code::ok);
  ASSERT_EQ(decorated.set_min_feerate(5), template_error_code::ok);

  auto lhs = plain.finalize();
  auto rhs = decorated.finalize();
  ASSERT_TRUE(lhs.ok());
  ASSERT_TRUE(rhs.ok());
  EXPECT_EQ(lhs.value->hash(), rhs.value->hash());
  EXPECT_EQ(rhs.value->metadata().label, "vault");
  EXPECT_EQ(rhs.value->guards().size(), 1u);
  EXPECT_EQ(rhs.value->min_feerate_sats_vbyte(), 5);
}

TEST(template_builder, ctv_index_is_committed) {
  auto at_zero = covenant::templates::template_builder{};
  ASSERT_EQ(at_zero.add_output(make_output(300, 0x11)), template_error_code::ok);
  auto at_one = covenant::templates::template_builder{};
  ASSERT_EQ(at_one.add_output(make_output(300, 0x11)), template_error_code::ok);

  auto lhs = at_zero.finalize(0);
  auto rhs = at_one.finalize(1);
  ASSERT_TRUE(lhs.ok());
  ASSERT_TRUE(rhs.ok());
  EXPECT_NE(lhs.value->hash(), rhs.value->hash());
  EXPECT_EQ(rhs.value->ctv_index(), 1u);
  EXPECT_EQ(rhs.value->verify(), template_error_code::ok);
}

TEST(template_builder, rejects_hash_not_committed_by_script) {
  auto child_builder = covenant::templates::template_builder{};
  ASSERT_EQ(child_builder.add_output(make_output(300, 0x11)),
            template_error_code::ok);
  auto child = child_builder.finalize();
  ASSERT_TRUE(child.ok());

  auto builder = covenant::templates::template_builder{};
  auto plain = make_output(300, 0x22);
  plain.template_hash = child.value->hash();
  EXPECT_EQ(builder.add_output(plain), template_error_code::malformed_input);

  auto redirected = covenant::templates::make_ctv_output(300, *child.value);
  redirected.template_hash = covenant::testing::make_hash(9);
  EXPECT_EQ(builder.add_output(redirected),
            template_error_code::malformed_input);

  EXPECT_EQ(builder.add_output(
                covenant::templates::make_ctv_output(300, *child.value)),
            template_error_code::ok);
  EXPECT_EQ(builder.output_count(), 1u);
}
