#pragma once
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/template_error_code.hpp>
#include <covenant/templates/template.hpp>
#include <cstddef>
#include <map>
#include <vector>

namespace covenant::templates {

/// Templates keyed by their hash.
///
/// Edges run from a template to the templates its outputs commit to
/// (`output_t::template_hash`). A template can only be inserted once all of
/// its children are present, and a child's hash cannot depend on a parent
/// that does not exist yet, so the graph is acyclic by construction.
class template_graph final {
 public:
  /// `missing_child` if an output commits to a template not in the graph,
  /// `invariant_violation` if the template fails `verify()`. Inserting an
  /// already present hash is a no-op.
  covenant::schema::template_error_code insert(transaction_template tmpl);

  const transaction_template* find(const covenant::schema::hash32_t& hash) const;
  bool contains(const covenant::schema::hash32_t& hash) const;

  /// Distinct child hashes of `hash`, in output order.
  std::vector<covenant::schema::hash32_t> children(
      const covenant::schema::hash32_t& hash) const;

  /// Templates no other template commits to.
  std::vector<covenant::schema::hash32_t> roots() const;

  /// Every hash, children before parents. Ties are broken by hash so the
  /// order is deterministic.
  std::vector<covenant::schema::hash32_t> topological_order() const;

  std::size_t size() const { return nodes_.size(); }

 private:
  std::map<covenant::schema::hash32_t, transaction_template> nodes_;
};

}  // namespace covenant::templates
