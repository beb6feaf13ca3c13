#pragma once
#include <covenant/bitcoin/transaction.hpp>
#include <covenant/schema/clause.hpp>
#include <covenant/schema/json_value.hpp>
#include <covenant/schema/output.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/template_error_code.hpp>
#include <covenant/schema/template_metadata.hpp>
#include <covenant/templates/template.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace covenant::templates {

inline constexpr auto kMaxTemplateInputs = std::size_t{4096};

/// Transaction shape applied when a builder materializes its template.
struct template_policy final {
  int32_t version{2};
  uint32_t lock_time{};
  uint32_t sequence{covenant::bitcoin::kSequenceFinal};
};

/// Assembles outputs and guards into a `transaction_template`.
///
/// Two states: accumulating and finalized. Every mutator returns
/// `already_finalized` once `finalize` has succeeded. A failed `finalize`
/// leaves the pending state untouched so the caller can correct it and try
/// again.
///
/// Not thread safe; a builder belongs to one compilation step.
class template_builder final {
 public:
  template_builder() = default;
  explicit template_builder(template_policy policy);

  /// Append an output. Amounts outside [0, kMaxMoney], or that would push
  /// the pending total out of that range, are `malformed_input`. So is an
  /// output whose `template_hash` is not the hash its CTV script commits to.
  covenant::schema::template_error_code add_output(
      covenant::schema::output_t output);

  /// Drop the output at `index`.
  covenant::schema::template_error_code remove_output(std::size_t index);

  /// Append a guard. Guards compose with AND.
  covenant::schema::template_error_code add_guard(
      covenant::schema::clause_t guard);

  covenant::schema::template_error_code set_max(
      covenant::schema::amount_t max);
  covenant::schema::template_error_code set_min_feerate(
      covenant::schema::amount_t sats_per_vbyte);

  covenant::schema::template_error_code set_metadata(
      covenant::schema::template_metadata_t metadata);
  covenant::schema::template_error_code set_label(std::string label);
  covenant::schema::template_error_code set_color(std::string color);
  covenant::schema::template_error_code set_extra(
      std::string key,
      covenant::schema::json_value value);

  covenant::schema::template_error_code set_version(int32_t version);
  covenant::schema::template_error_code set_lock_time(uint32_t lock_time);
  /// Set the sequence of input `input_index`, growing the input list with
  /// policy-sequence inputs as needed.
  covenant::schema::template_error_code set_sequence(std::size_t input_index,
                                                     uint32_t sequence);

  /// Strict mode: the output total must equal max rather than stay below it.
  covenant::schema::template_error_code require_exact_amount(bool exact);

  /// Validate, materialize the transaction, and commit to it at
  /// `ctv_index`.
  ///
  /// When no max was set, max is the pending total.
  template_result finalize(uint32_t ctv_index = 0);

  covenant::schema::amount_t pending_total() const { return pending_total_; }
  std::size_t output_count() const { return outputs_.size(); }
  bool finalized() const { return finalized_; }

 private:
  covenant::bitcoin::transaction_t materialize() const;

  template_policy policy_;
  std::vector<covenant::schema::output_t> outputs_;
  std::vector<covenant::schema::clause_t> guards_;
  std::optional<covenant::schema::amount_t> max_;
  std::optional<covenant::schema::amount_t> min_feerate_;
  covenant::schema::template_metadata_t metadata_;
  std::vector<std::optional<uint32_t>> sequences_{std::nullopt};
  covenant::schema::amount_t pending_total_{};
  bool exact_amount_{};
  bool finalized_{};
};

}  // namespace covenant::templates
