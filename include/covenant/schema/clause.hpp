#pragma once
#include <covenant/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

// Spending conditions attached to templates as guards. Guards on one
// template compose with AND.
namespace covenant::schema {

struct clause_t;

struct satisfied_t final {
  bool operator==(const satisfied_t&) const = default;
};

struct signature_check_t final {
  std::array<uint8_t, 33> public_key{};
  bool operator==(const signature_check_t&) const = default;
};

struct preimage_check_t final {
  hash32_t hash{};  // sha256 of the expected preimage
  bool operator==(const preimage_check_t&) const = default;
};

struct after_t final {
  uint32_t lock_time{};  // absolute, nLockTime semantics
  bool operator==(const after_t&) const = default;
};

struct older_t final {
  uint32_t sequence{};  // relative, nSequence semantics
  bool operator==(const older_t&) const = default;
};

struct check_template_verify_t final {
  hash32_t hash{};
  bool operator==(const check_template_verify_t&) const = default;
};

struct and_clause_t final {
  std::vector<clause_t> clauses;
  bool operator==(const and_clause_t&) const = default;
};

struct or_clause_t final {
  std::vector<clause_t> clauses;
  bool operator==(const or_clause_t&) const = default;
};

struct clause_t final {
  std::variant<satisfied_t,
               signature_check_t,
               preimage_check_t,
               after_t,
               older_t,
               check_template_verify_t,
               and_clause_t,
               or_clause_t>
      value;

  bool operator==(const clause_t& other) const = default;
};

/// Disjunction of conjunctions of leaf clauses.
using conjunction_t = std::vector<clause_t>;
using dnf_t = std::vector<conjunction_t>;

clause_t make_and(clause_t lhs, clause_t rhs);
clause_t make_or(clause_t lhs, clause_t rhs);

/// Fold a guard list into a single clause. An empty list is `satisfied`.
clause_t all_of(const std::vector<clause_t>& clauses);

/// Flatten a clause tree to disjunctive normal form.
///
/// Only shallow flattening is performed: an OR reachable through an AND is
/// not distributed and makes the whole flatten fail with std::nullopt.
std::optional<dnf_t> flatten(const clause_t& clause);

}  // namespace covenant::schema
