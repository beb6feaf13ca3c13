#include <gtest/gtest.h>
#include <covenant/templates/builder.hpp>
#include <covenant/templates/graph.hpp>
#include <covenant/testing/common.hpp>

#include <algorithm>
#include <stdexcept>
#include <vector>

using covenant::schema::template_error_code;
using covenant::testing::make_output;

namespace {

covenant::templates::transaction_template finalize(
    std::vector<covenant::schema::output_t> outputs) {
  auto builder = covenant::templates::template_builder{};
  for (auto& output : outputs) {
    builder.add_output(std::move(output));
  }
  auto result = builder.finalize();
  if (!result.ok()) {
    throw std::runtime_error{result.log};
  }
  return std::move(*result.value);
}

std::size_t position(const std::vector<covenant::schema::hash32_t>& order,
                     const covenant::schema::hash32_t& hash) {
  return static_cast<std::size_t>(
      std::distance(std::begin(order), std::ranges::find(order, hash)));
}

}  // namespace

TEST(template_graph, rejects_unknown_children) {
  auto leaf = finalize({make_output(500, 0x11)});
  auto parent = finalize({covenant::templates::make_ctv_output(500, leaf)});

  auto graph = covenant::templates::template_graph{};
  EXPECT_EQ(graph.insert(parent), template_error_code::missing_child);
  EXPECT_EQ(graph.size(), 0u);

  EXPECT_EQ(graph.insert(leaf), template_error_code::ok);
  EXPECT_EQ(graph.insert(parent), template_error_code::ok);
  EXPECT_EQ(graph.size(), 2u);
}

TEST(template_graph, insert_is_idempotent) {
  auto leaf = finalize({make_output(500, 0x11)});
  auto graph = covenant::templates::template_graph{};
  EXPECT_EQ(graph.insert(leaf), template_error_code::ok);
  EXPECT_EQ(graph.insert(leaf), template_error_code::ok);
  EXPECT_EQ(graph.size(), 1u);
  ASSERT_NE(graph.find(leaf.hash()), nullptr);
  EXPECT_EQ(graph.find(leaf.hash())->total_amount(), 500);
  EXPECT_EQ(graph.find(covenant::testing::make_hash(1)), nullptr);
}

TEST(template_graph, orders_children_first) {
  auto left = finalize({make_output(100, 0x11)});
  auto right = finalize({make_output(200, 0x22)});
  auto middle = finalize({covenant::templates::make_ctv_output(100, left)});
  auto root = finalize({covenant::templates::make_ctv_output(100, middle),
                        covenant::templates::make_ctv_output(200, right),
                        covenant::templates::make_ctv_output(100, left)});

  auto graph = covenant::templates::template_graph{};
  ASSERT_EQ(graph.insert(left), template_error_code::ok);
  ASSERT_EQ(graph.insert(right), template_error_code::ok);
  ASSERT_EQ(graph.insert(middle), template_error_code::ok);
  ASSERT_EQ(graph.insert(root), template_error_code::ok);

  EXPECT_EQ(graph.children(root.hash()),
            (std::vector{middle.hash(), right.hash(), left.hash()}));
  EXPECT_TRUE(graph.children(left.hash()).empty());
  EXPECT_EQ(graph.roots(), std::vector{root.hash()});

  auto order = graph.topological_order();
  ASSERT_EQ(order.size(), 4u);
  EXPECT_LT(position(order, left.hash()), position(order, middle.hash()));
  EXPECT_LT(position(order, middle.hash()), position(order, root.hash()));
  EXPECT_LT(position(order, right.hash()), position(order, root.hash()));
  EXPECT_EQ(order.back(), root.hash());
}

TEST(template_graph, forged_child_edge_never_reaches_graph) {
  auto child = finalize({make_output(500, 0x11)});
  auto decoy = finalize({make_output(600, 0x22)});
  auto parent = finalize({covenant::templates::make_ctv_output(500, child)});

  auto graph = covenant::templates::template_graph{};
  ASSERT_EQ(graph.insert(child), template_error_code::ok);
  ASSERT_EQ(graph.insert(decoy), template_error_code::ok);

  auto forged = parent.to_record();
  forged.outputs[0].template_hash = decoy.hash();
  auto rebuilt = covenant::templates::transaction_template::from_record(forged);
  ASSERT_EQ(rebuilt.code, template_error_code::invariant_violation);

  auto genuine =
      covenant::templates::transaction_template::from_record(parent.to_record());
  ASSERT_TRUE(genuine.ok()) << genuine.log;
  ASSERT_EQ(graph.insert(*genuine.value), template_error_code::ok);
  EXPECT_EQ(graph.children(parent.hash()), std::vector{child.hash()});
  auto roots = graph.roots();
  EXPECT_EQ(roots.size(), 2u);
  EXPECT_EQ(std::ranges::find(roots, child.hash()), std::end(roots));
  EXPECT_NE(std::ranges::find(roots, decoy.hash()), std::end(roots));
  EXPECT_NE(std::ranges::find(roots, parent.hash()), std::end(roots));
}
