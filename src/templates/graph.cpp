#include <covenant/templates/graph.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

using covenant::schema::hash32_t;
using covenant::schema::template_error_code;

namespace covenant::templates {

template_error_code template_graph::insert(transaction_template tmpl) {
  auto hash = tmpl.hash();
  if (nodes_.contains(hash)) {
    return template_error_code::ok;
  }
  if (auto code = tmpl.verify(); code != template_error_code::ok) {
    return code;
  }
  for (const auto& output : tmpl.outputs()) {
    if (output.template_hash && !nodes_.contains(*output.template_hash)) {
      spdlog::debug("Template {} references unknown child {}",
                    covenant::schema::to_hex(hash),
                    covenant::schema::to_hex(*output.template_hash));
      return template_error_code::missing_child;
    }
  }
  nodes_.emplace(hash, std::move(tmpl));
  spdlog::debug("Inserted template {} ({} node(s))",
                covenant::schema::to_hex(hash), nodes_.size());
  return template_error_code::ok;
}

const transaction_template* template_graph::find(const hash32_t& hash) const {
  auto it = nodes_.find(hash);
  if (it == std::end(nodes_)) {
    return nullptr;
  }
  return &it->second;
}

bool template_graph::contains(const hash32_t& hash) const {
  return nodes_.contains(hash);
}

std::vector<hash32_t> template_graph::children(const hash32_t& hash) const {
  auto out = std::vector<hash32_t>{};
  const auto* node = find(hash);
  if (node == nullptr) {
    return out;
  }
  for (const auto& output : node->outputs()) {
    if (output.template_hash &&
        std::ranges::find(out, *output.template_hash) == std::end(out)) {
      out.push_back(*output.template_hash);
    }
  }
  return out;
}

std::vector<hash32_t> template_graph::roots() const {
  auto referenced = std::set<hash32_t>{};
  for (const auto& [hash, node] : nodes_) {
    for (const auto& child : children(hash)) {
      referenced.insert(child);
    }
  }
  auto out = std::vector<hash32_t>{};
  for (const auto& [hash, node] : nodes_) {
    if (!referenced.contains(hash)) {
      out.push_back(hash);
    }
  }
  return out;
}

std::vector<hash32_t> template_graph::topological_order() const {
  auto order = std::vector<hash32_t>{};
  order.reserve(nodes_.size());
  auto visited = std::set<hash32_t>{};

  // Depth-first post-order with an explicit stack.
  for (const auto& [start, node] : nodes_) {
    if (visited.contains(start)) {
      continue;
    }
    auto stack = std::vector<std::pair<hash32_t, bool>>{{start, false}};
    while (!stack.empty()) {
      auto [hash, expanded] = stack.back();
      stack.pop_back();
      if (expanded) {
        order.push_back(hash);
        continue;
      }
      if (!visited.insert(hash).second) {
        continue;
      }
      stack.emplace_back(hash, true);
      auto next = children(hash);
      for (auto it = next.rbegin(); it != next.rend(); ++it) {
        if (!visited.contains(*it)) {
          stack.emplace_back(*it, false);
        }
      }
    }
  }
  return order;
}

}  // namespace covenant::templates
