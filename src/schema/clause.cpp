#include <covenant/schema/clause.hpp>

#include <iterator>
#include <utility>

namespace covenant::schema {

namespace {

std::optional<dnf_t> flatten(const clause_t& clause, const bool or_allowed) {
  return std::visit(
      overloaded{
          [](const satisfied_t&) -> std::optional<dnf_t> {
            return dnf_t{conjunction_t{}};
          },
          [&](const and_clause_t& arg) -> std::optional<dnf_t> {
            auto merged = conjunction_t{};
            for (const auto& child : arg.clauses) {
              auto flattened = flatten(child, false);
              if (!flattened || flattened->size() != 1) {
                return std::nullopt;
              }
              auto& conjunction = flattened->front();
              merged.insert(std::end(merged),
                            std::make_move_iterator(std::begin(conjunction)),
                            std::make_move_iterator(std::end(conjunction)));
            }
            return dnf_t{std::move(merged)};
          },
          [&](const or_clause_t& arg) -> std::optional<dnf_t> {
            if (!or_allowed) {
              return std::nullopt;
            }
            auto out = dnf_t{};
            for (const auto& child : arg.clauses) {
              auto flattened = flatten(child, true);
              if (!flattened) {
                return std::nullopt;
              }
              out.insert(std::end(out),
                         std::make_move_iterator(std::begin(*flattened)),
                         std::make_move_iterator(std::end(*flattened)));
            }
            return out;
          },
          [&](const auto&) -> std::optional<dnf_t> {
            return dnf_t{conjunction_t{clause}};
          }},
      clause.value);
}

}  // namespace

clause_t make_and(clause_t lhs, clause_t rhs) {
  auto out = and_clause_t{};
  out.clauses.push_back(std::move(lhs));
  out.clauses.push_back(std::move(rhs));
  return clause_t{std::move(out)};
}

clause_t make_or(clause_t lhs, clause_t rhs) {
  auto out = or_clause_t{};
  out.clauses.push_back(std::move(lhs));
  out.clauses.push_back(std::move(rhs));
  return clause_t{std::move(out)};
}

clause_t all_of(const std::vector<clause_t>& clauses) {
  if (clauses.empty()) {
    return clause_t{satisfied_t{}};
  }
  if (clauses.size() == 1) {
    return clauses.front();
  }
  return clause_t{and_clause_t{clauses}};
}

std::optional<dnf_t> flatten(const clause_t& clause) {
  return flatten(clause, true);
}

}  // namespace covenant::schema
